#pragma once
#include "shell.hpp"
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <set>

namespace trayctx {

struct FakeTrayIcon {
  native_handle image{};
  std::string tooltip;
};

struct FakeMenuItem {
  enum class Kind { Entry, Separator, Submenu } kind = Kind::Entry;
  native_id id{};
  std::string label;
  bool checked = false;
  bool enabled = true;
  bool highlight = false;
  bool is_default = false;
  native_handle submenu{};
};

struct FakeBalloon {
  native_id icon{};
  std::string title;
  std::string message;
  NotificationIcon kind = NotificationIcon::None;
  std::optional<StockIcon> stock_icon;
  std::uint32_t options = 0;
};

// In-memory shell: keeps the state a real shell would hold, records every
// call as a string and lets tests feed native messages to the pump.
class FakeShell final : public IShell {
public:
  FakeShell() = default;

  native_handle create_window(const std::string &class_name,
                              const std::string &window_name) override;
  void destroy_window(native_handle window) override;
  NativeMessage wait_message(native_handle window) override;
  void wake(native_handle window) override;
  void add_clipboard_listener(native_handle window) override;
  void remove_clipboard_listener(native_handle window) override;

  native_handle create_icon_image(const IconBuffer &buffer) override;
  native_handle stock_icon_image() override;
  void destroy_icon_image(native_handle image) override;

  void add_tray_icon(native_handle window, native_id id) override;
  void delete_tray_icon(native_handle window, native_id id) override;
  void set_tray_image(native_handle window, native_id id,
                      native_handle image) override;
  void set_tray_tooltip(native_handle window, native_id id,
                        const std::string &tooltip) override;
  void show_balloon(native_handle window, native_id id,
                    const Notification &n) override;

  native_handle create_popup_menu() override;
  void destroy_menu(native_handle menu) override;
  void append_menu_entry(native_handle menu, native_id id,
                         const std::string &label, const MenuItemState &state,
                         bool is_default) override;
  void append_menu_separator(native_handle menu) override;
  void append_submenu(native_handle menu, native_id id,
                      const std::string &label,
                      native_handle submenu) override;
  void modify_menu_item(native_handle menu, native_id id,
                        const MenuItemState &change) override;
  void track_popup_menu(native_handle window, native_handle menu) override;

  std::optional<ClipboardData> read_clipboard(native_handle window) override;
  void write_clipboard(native_handle window,
                       const ClipboardData &data) override;

  void send_copy_data(native_handle window, const CopyDataTarget &target,
                      std::uint64_t data_type,
                      const std::vector<std::uint8_t> &bytes) override;

  std::optional<std::string> registry_get(const std::string &key,
                                          const std::string &name) override;
  void registry_set(const std::string &key, const std::string &name,
                    const std::string &value) override;
  void registry_delete(const std::string &key,
                       const std::string &name) override;
  std::string current_executable() override;
  std::optional<native_handle>
  acquire_named_mutex(const std::string &name) override;
  void release_named_mutex(native_handle mutex) override;
  bool open_directory(const std::string &path) override;

  // Test helpers
  void inject(NativeMessage msg);
  // Delivers `msg` the way a cross-thread SendMessage does: the window
  // procedure queues it while the pump is blocked waiting for posted ones.
  void send_message(NativeMessage msg);
  void click_menu_item(native_id id);
  void icon_action(native_id icon, IconAction action);
  // Explorer restart: every icon disappears and TaskbarCreated is posted.
  void restart_taskbar();
  // The next `times` calls of `op` (method name, e.g. "set_tray_tooltip")
  // throw Error(E_SHELL).
  void fail_on(const std::string &op, int times = 1);
  void set_executable(const std::string &path);

  std::vector<std::string> get_calls() const;
  void clear_calls();
  bool has_call(const std::string &call) const;

  bool window_alive() const;
  bool clipboard_listening() const;
  std::map<native_id, FakeTrayIcon> tray_icons() const;
  std::vector<FakeMenuItem> menu_items(native_handle menu) const;
  std::size_t live_menus() const;
  std::vector<native_handle> menu_handles() const;
  std::size_t live_images() const;
  std::vector<FakeBalloon> balloons() const;
  std::optional<ClipboardData> clipboard() const;
  void set_clipboard(ClipboardData data);

private:
  void record(const std::string &call);
  void maybe_fail(const std::string &op);
  FakeMenuItem *find_item(native_handle menu, native_id id);

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<NativeMessage> inbox_;      // posted
  std::deque<NativeMessage> dispatched_; // queued by the window procedure
  std::vector<std::string> calls_;
  std::map<std::string, int> failures_;

  native_handle next_handle_ = 0x100;
  native_handle window_{};
  bool clipboard_listener_ = false;
  std::map<native_id, FakeTrayIcon> icons_;
  std::set<native_handle> images_;
  std::map<native_handle, std::vector<FakeMenuItem>> menus_;
  std::vector<FakeBalloon> balloons_;
  std::optional<ClipboardData> clipboard_;
  std::map<std::string, std::string> registry_;
  std::set<std::string> mutexes_;
  std::map<native_handle, std::string> mutex_handles_;
  std::string executable_ = "C:\\Program Files\\trayctx\\demo.exe";
};

} // namespace trayctx
