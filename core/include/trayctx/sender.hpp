#pragma once
#include "area.hpp"
#include "messages.hpp"
#include "pump.hpp"
#include "shell.hpp"
#include <chrono>
#include <future>
#include <memory>
#include <optional>

namespace trayctx {

// Caller-side handle for commands. Copies share the same queue; commands sent
// from one copy are executed in order. After shutdown every send is dropped.
class Sender {
public:
  Sender(std::shared_ptr<CommandChannel> inbox, IShell *shell,
         native_handle window);

  // The area's menu tokens stay valid; they are bound when the pump adds it.
  Token add_icon(Area area);
  void set_icon_image(const Token &icon, std::optional<ImageId> image);
  void set_tooltip(const Token &icon, std::string tooltip);
  void clear_tooltip(const Token &icon);
  void remove_icon(const Token &icon);
  void modify_menu_item(const Token &item, MenuItemState change);
  Token show_notification(const Token &icon, Notification notification);
  void write_clipboard(ClipboardData data);
  // Resolves to empty when the clipboard holds nothing readable. Fails with
  // Error(E_CHANNEL_CLOSED) when the pump stops before answering.
  std::future<std::optional<ClipboardData>> read_clipboard();
  void send_copy_data(CopyDataTarget target, std::uint64_t data_type,
                      std::vector<std::uint8_t> bytes);
  void shutdown();

  bool closed() const { return inbox_->closed(); }

private:
  bool send(Command cmd);

  std::shared_ptr<CommandChannel> inbox_;
  IShell *shell_;
  native_handle window_;
};

// Caller-side end of the event channel. The last copy to go away stops the
// pump from queueing further events.
class EventReceiver {
public:
  explicit EventReceiver(std::shared_ptr<EventChannel> channel);

  // Empty once ShutdownComplete was received and the channel is drained.
  std::optional<Event> recv();
  std::optional<Event> try_recv();
  std::optional<Event> recv_for(std::chrono::milliseconds timeout);

  // Events evicted because the queue was full.
  std::size_t dropped() const;

private:
  struct Guard {
    std::shared_ptr<EventChannel> channel;
    ~Guard() { channel->close_receiver(); }
  };
  std::shared_ptr<Guard> guard_;
};

} // namespace trayctx
