#pragma once
#include "area.hpp"
#include "error.hpp"
#include "notification.hpp"
#include "token.hpp"
#include "types.hpp"
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace trayctx {

// Caller -> pump.
namespace command {

struct AddIcon {
  Area area;
};
struct SetIconImage {
  Token icon;
  std::optional<ImageId> image; // empty: stock application icon
};
struct SetTooltip {
  Token icon;
  std::string tooltip; // empty clears it
};
struct RemoveIcon {
  Token icon;
};
struct ModifyMenuItem {
  Token item;
  MenuItemState change;
};
struct ShowNotification {
  NotificationRequest request;
};
struct WriteClipboard {
  ClipboardData data;
};
struct ReadClipboard {
  // Shared with the sender so it can fail the future if the pump is gone.
  std::shared_ptr<std::promise<std::optional<ClipboardData>>> reply;
};
struct SendCopyData {
  CopyDataTarget target;
  std::uint64_t data_type{};
  std::vector<std::uint8_t> bytes;
};
struct Shutdown {};

} // namespace command

using Command =
    std::variant<command::AddIcon, command::SetIconImage, command::SetTooltip,
                 command::RemoveIcon, command::ModifyMenuItem,
                 command::ShowNotification, command::WriteClipboard,
                 command::ReadClipboard, command::SendCopyData,
                 command::Shutdown>;

const char *command_name(const Command &c);

// Pump -> caller.
namespace event {

struct MenuItemClicked {
  Token item;
  Token icon;
};
struct IconClicked {
  Token icon;
};
struct NotificationShown {
  Token notification;
  Token icon;
};
struct NotificationClicked {
  Token notification;
  Token icon;
};
struct NotificationDismissed {
  Token notification;
  Token icon;
};
struct ClipboardChanged {};
struct CopyDataReceived {
  native_handle sender{}; // HWND passed in wParam by the sending process
  std::uint64_t data_type{};
  std::vector<std::uint8_t> bytes;
};
struct OperationFailed {
  std::string context;
  ErrorCode code = ErrorCode::Shell;
  std::string message;
};
// Always the last event of a pump that started.
struct ShutdownComplete {};

} // namespace event

using Event =
    std::variant<event::MenuItemClicked, event::IconClicked,
                 event::NotificationShown, event::NotificationClicked,
                 event::NotificationDismissed, event::ClipboardChanged,
                 event::CopyDataReceived, event::OperationFailed,
                 event::ShutdownComplete>;

const char *event_name(const Event &e);
bool is_terminal(const Event &e);

} // namespace trayctx
