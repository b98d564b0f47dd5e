#pragma once
#include "shell.hpp"
#include <map>
#include <memory>
#include <string>

namespace trayctx {

// Shell backed by user32/shell32/advapi32. Compiled on Windows only.
//
// The window is a disabled, zero-sized top-level window rather than an
// HWND_MESSAGE one: message-only windows never see the TaskbarCreated
// broadcast.
class Win32Shell final : public IShell {
public:
  Win32Shell();
  ~Win32Shell() override;

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

  // Per-window queue filled by the window procedure.
  struct WindowState;

private:
  WindowState &state_of(native_handle window);

  unsigned taskbar_created_msg_ = 0;
  // Touched on the pump thread only.
  std::map<native_handle, std::unique_ptr<WindowState>> windows_;
};

} // namespace trayctx
