#pragma once
#include "notification.hpp"
#include "types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace trayctx {

enum class NativeMessageKind : std::uint8_t {
  Wake,            // posted by IShell::wake, carries nothing
  IconCallback,    // tray icon callback message
  MenuCommand,     // WM_COMMAND from a popup menu
  ClipboardUpdate, // WM_CLIPBOARDUPDATE
  CopyData,        // WM_COPYDATA, payload copied out of the sender's buffer
  TaskbarCreated,  // explorer restarted, icons must be added again
  Close,           // WM_CLOSE / WM_ENDSESSION
  Quit,            // WM_QUIT or the window was destroyed
};

enum class IconAction : std::uint8_t {
  None,
  LeftClick,
  RightClick,
  DoubleClick,
  BalloonShown,
  BalloonClicked,
  BalloonTimeout, // timed out or closed by the user
};

struct NativeMessage {
  NativeMessageKind kind = NativeMessageKind::Wake;
  native_id id{}; // icon uID or menu command id
  IconAction action = IconAction::None;
  native_handle sender{};
  std::uint64_t data_type{};
  std::vector<std::uint8_t> bytes;
};

// Everything the pump needs from the host shell. Apart from wake(), every
// method is called on the pump thread only. Failures throw trayctx::Error
// with ErrorCode::Shell and the OS error number.
class IShell {
public:
  virtual ~IShell() = default;

  // Window lifetime
  virtual native_handle create_window(const std::string &class_name,
                                      const std::string &window_name) = 0;
  virtual void destroy_window(native_handle window) = 0;

  // Blocks until the next message for the pump is available, including
  // messages sent from other threads or processes.
  virtual NativeMessage wait_message(native_handle window) = 0;
  // Thread-safe. Makes a pending or future wait_message return Wake.
  virtual void wake(native_handle window) = 0;

  virtual void add_clipboard_listener(native_handle window) = 0;
  virtual void remove_clipboard_listener(native_handle window) = 0;

  // Icon images
  virtual native_handle create_icon_image(const IconBuffer &buffer) = 0;
  virtual native_handle stock_icon_image() = 0;
  virtual void destroy_icon_image(native_handle image) = 0;

  // Notification area
  virtual void add_tray_icon(native_handle window, native_id id) = 0;
  virtual void delete_tray_icon(native_handle window, native_id id) = 0;
  virtual void set_tray_image(native_handle window, native_id id,
                              native_handle image) = 0;
  virtual void set_tray_tooltip(native_handle window, native_id id,
                                const std::string &tooltip) = 0;
  virtual void show_balloon(native_handle window, native_id id,
                            const Notification &n) = 0;

  // Menus
  virtual native_handle create_popup_menu() = 0;
  // Destroys submenus attached to `menu` as well.
  virtual void destroy_menu(native_handle menu) = 0;
  virtual void append_menu_entry(native_handle menu, native_id id,
                                 const std::string &label,
                                 const MenuItemState &state,
                                 bool is_default) = 0;
  virtual void append_menu_separator(native_handle menu) = 0;
  virtual void append_submenu(native_handle menu, native_id id,
                              const std::string &label,
                              native_handle submenu) = 0;
  virtual void modify_menu_item(native_handle menu, native_id id,
                                const MenuItemState &change) = 0;
  // Returns once the menu is dismissed; a selection arrives later as a
  // MenuCommand message.
  virtual void track_popup_menu(native_handle window, native_handle menu) = 0;

  // Clipboard
  virtual std::optional<ClipboardData> read_clipboard(native_handle window) = 0;
  virtual void write_clipboard(native_handle window,
                               const ClipboardData &data) = 0;

  // Inter-process copy
  virtual void send_copy_data(native_handle window,
                              const CopyDataTarget &target,
                              std::uint64_t data_type,
                              const std::vector<std::uint8_t> &bytes) = 0;

  // Collaborators outside the pump: autostart registry entries, single
  // instance mutex, explorer.
  virtual std::optional<std::string> registry_get(const std::string &key,
                                                  const std::string &name) = 0;
  virtual void registry_set(const std::string &key, const std::string &name,
                            const std::string &value) = 0;
  virtual void registry_delete(const std::string &key,
                               const std::string &name) = 0;
  virtual std::string current_executable() = 0;
  // Empty when another process already holds the mutex.
  virtual std::optional<native_handle>
  acquire_named_mutex(const std::string &name) = 0;
  virtual void release_named_mutex(native_handle mutex) = 0;
  virtual bool open_directory(const std::string &path) = 0;
};

} // namespace trayctx
