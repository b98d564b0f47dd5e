#pragma once
#include "area.hpp"
#include "id_registry.hpp"
#include "pump.hpp"
#include "sender.hpp"
#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace trayctx {

inline constexpr std::size_t MAX_CLASS_NAME = 256;

struct ContextOptions {
  std::size_t event_capacity = 1024;
  native_id max_menu_items = MAX_MENU_ITEM_ID;
  native_id max_icons = MAX_ICON_ID;
  native_id max_notifications = MAX_NOTIFICATION_ID;
};

// A running pump plus the handles to talk to it. Destroying it shuts the pump
// down and waits for the thread.
class Context {
public:
  Context(Context &&) noexcept = default;
  Context &operator=(Context &&) = delete;
  Context(const Context &) = delete;
  Context &operator=(const Context &) = delete;
  ~Context();

  Sender sender() const { return sender_; }
  EventReceiver events() const { return events_; }
  PumpState state() const { return pump_->state(); }
  native_handle window() const { return pump_->window(); }

  // Requests shutdown and waits until the pump thread is gone.
  void close();

private:
  friend class WindowBuilder;
  Context(std::unique_ptr<MessagePump> pump, Sender sender,
          EventReceiver events);

  std::unique_ptr<MessagePump> pump_;
  Sender sender_;
  EventReceiver events_;
};

class WindowBuilder {
public:
  explicit WindowBuilder(std::string class_name);

  WindowBuilder &window_name(std::string name);
  WindowBuilder &clipboard_events(bool enabled);
  WindowBuilder &options(const ContextOptions &opts);

  ImageId insert_image(IconBuffer buffer);
  // The reference stays valid until build().
  Area &new_area();

  // Throws Error(E_CONFIG).
  void validate() const;

  // Starts the pump. Throws Error(E_CONFIG) before anything native is touched,
  // Error(E_SETUP) when the window or an icon could not be created. The
  // builder is spent afterwards.
  Context build(IShell *shell);

private:
  std::string class_name_;
  std::string window_name_;
  bool clipboard_events_ = false;
  ContextOptions options_;
  std::vector<IconBuffer> images_;
  std::unique_ptr<IdRegistry> registry_;
  std::deque<Area> areas_;
  bool built_ = false;
};

} // namespace trayctx
