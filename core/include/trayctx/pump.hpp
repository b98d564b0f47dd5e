#pragma once
#include "area.hpp"
#include "channel.hpp"
#include "id_registry.hpp"
#include "messages.hpp"
#include "notification.hpp"
#include "shell.hpp"
#include <atomic>
#include <future>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace trayctx {

enum class PumpState : std::uint8_t { NotStarted, Running, ShuttingDown, Stopped };

const char *pump_state_name(PumpState state);

using CommandChannel = Channel<Command>;
using EventChannel = Channel<Event>;

struct PumpConfig {
  std::string class_name;
  std::string window_name;
  bool clipboard_events = false;
  std::vector<IconBuffer> images;
  std::vector<Area> areas;
};

// Owns the hidden window and every native handle hanging off it. All of them
// are created, used and destroyed on the pump thread; the outside world only
// reaches it through the two channels.
class MessagePump {
public:
  MessagePump(IShell *shell, PumpConfig config, IdRegistry registry,
              std::shared_ptr<CommandChannel> inbox,
              std::shared_ptr<EventChannel> events);
  ~MessagePump();

  MessagePump(const MessagePump &) = delete;
  MessagePump &operator=(const MessagePump &) = delete;

  // Spawns the thread and waits until the window and icons exist. Throws
  // Error(E_SETUP) if any of it failed; no thread is left behind then.
  void start();
  // Waits for the thread to exit. Does not request shutdown.
  void join();

  PumpState state() const { return state_.load(); }
  // Valid once start() returned.
  native_handle window() const { return window_.load(); }

private:
  struct TrayIcon {
    Token token;
    native_id id{};
    std::optional<ImageId> image;
    std::string tooltip;
    std::unique_ptr<Menu> menu;
    native_handle menu_handle{};
    bool added = false;
  };

  void run(std::promise<void> started);
  void setup();
  void loop();
  void finish();
  void teardown();

  void drain_inbox();
  void discard(Command &cmd);
  void execute(Command &cmd);
  void dispatch(NativeMessage msg);
  void begin_shutdown(const char *reason);

  void handle(command::AddIcon &c);
  void handle(command::SetIconImage &c);
  void handle(command::SetTooltip &c);
  void handle(command::RemoveIcon &c);
  void handle(command::ModifyMenuItem &c);
  void handle(command::ShowNotification &c);
  void handle(command::WriteClipboard &c);
  void handle(command::ReadClipboard &c);
  void handle(command::SendCopyData &c);
  void handle(command::Shutdown &c);

  void on_icon(const NativeMessage &msg);
  void on_menu_command(native_id id);
  void on_balloon_done(const Token &icon, bool clicked);
  void restore_icons();

  void install_icon(Area area);
  void show_icon(TrayIcon &icon);
  void remove_icon(const Token &token);
  void release_tokens(TrayIcon &icon);
  native_handle build_menu(const Menu &menu);
  void display(NotificationRequest req);

  TrayIcon &icon_for(const Token &token);
  native_id native_of(const Token &token) const;
  native_handle image_handle(const std::optional<ImageId> &image);

  void emit(Event e);
  void report(const std::string &context, const Error &e);

  IShell *shell_;
  PumpConfig config_;
  IdRegistry registry_;
  NotificationTracker tracker_;
  std::shared_ptr<CommandChannel> inbox_;
  std::shared_ptr<EventChannel> events_;

  std::atomic<PumpState> state_{PumpState::NotStarted};
  std::thread thread_;

  // Read from other threads through window().
  std::atomic<native_handle> window_{0};
  bool clipboard_listener_ = false;
  std::vector<native_handle> images_; // indexed by ImageId
  native_handle stock_image_{};
  std::map<Token, TrayIcon> icons_;
  std::map<Token, Token> item_owner_; // menu item -> icon
};

} // namespace trayctx
