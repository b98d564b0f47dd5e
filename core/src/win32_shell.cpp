#include "trayctx/win32_shell.hpp"

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#include <shellapi.h>
#include <cstring>
#include <cwchar>
#include <deque>
#include "trayctx/error.hpp"
#include "trayctx/logger.hpp"
#include "trayctx/util_win32.hpp"

namespace trayctx {

struct Win32Shell::WindowState {
  std::wstring class_name;
  UINT taskbar_created = 0;
  std::deque<NativeMessage> pending;
};

namespace {

constexpr UINT WM_TRAYCTX_WAKE = WM_APP + 1;
constexpr UINT WM_TRAYCTX_ICON = WM_APP + 2;
constexpr DWORD COPY_DATA_TIMEOUT_MS = 5000;

Error last_error(const std::string &what) {
  DWORD code = GetLastError();
  return Error(ErrorCode::Shell, what + " failed (" + std::to_string(code) + ")",
               code);
}

Error status_error(const std::string &what, LSTATUS status) {
  return Error(ErrorCode::Shell,
               what + " failed (" + std::to_string(status) + ")",
               static_cast<std::uint32_t>(status));
}

IconAction icon_action_of(LPARAM lp) {
  switch (LOWORD(lp)) {
  case WM_LBUTTONUP:
    return IconAction::LeftClick;
  case WM_RBUTTONUP:
    return IconAction::RightClick;
  case WM_LBUTTONDBLCLK:
    return IconAction::DoubleClick;
  case NIN_BALLOONSHOW:
    return IconAction::BalloonShown;
  case NIN_BALLOONUSERCLICK:
    return IconAction::BalloonClicked;
  case NIN_BALLOONTIMEOUT:
    return IconAction::BalloonTimeout;
  default:
    return IconAction::None;
  }
}

// A message sent from another thread or process is handled inside
// GetMessageW, which keeps blocking until something is posted. Post a wake so
// wait_message sees the queued message.
void queue(HWND hwnd, Win32Shell::WindowState *state, NativeMessage msg) {
  state->pending.push_back(std::move(msg));
  if (InSendMessage() && !PostMessageW(hwnd, WM_TRAYCTX_WAKE, 0, 0))
    TRAYCTX_LOG_WARN("win32: re-post of sent message failed (" +
                     std::to_string(GetLastError()) + ")");
}

LRESULT CALLBACK window_proc(HWND hwnd, UINT msg, WPARAM wp, LPARAM lp) {
  if (msg == WM_NCCREATE) {
    auto *cs = reinterpret_cast<CREATESTRUCTW *>(lp);
    SetWindowLongPtrW(hwnd, GWLP_USERDATA,
                      reinterpret_cast<LONG_PTR>(cs->lpCreateParams));
    return DefWindowProcW(hwnd, msg, wp, lp);
  }

  auto *state = reinterpret_cast<Win32Shell::WindowState *>(
      GetWindowLongPtrW(hwnd, GWLP_USERDATA));
  if (!state)
    return DefWindowProcW(hwnd, msg, wp, lp);

  NativeMessage out;
  switch (msg) {
  case WM_TRAYCTX_WAKE:
    if (state->pending.empty())
      state->pending.push_back(out);
    return 0;
  case WM_TRAYCTX_ICON: {
    IconAction action = icon_action_of(lp);
    if (action == IconAction::None)
      return 0;
    out.kind = NativeMessageKind::IconCallback;
    out.id = static_cast<native_id>(wp);
    out.action = action;
    queue(hwnd, state, out);
    return 0;
  }
  case WM_COMMAND:
    // Menu selections only; accelerators and controls do not apply here.
    if (HIWORD(wp) == 0) {
      out.kind = NativeMessageKind::MenuCommand;
      out.id = LOWORD(wp);
      queue(hwnd, state, out);
    }
    return 0;
  case WM_CLIPBOARDUPDATE:
    out.kind = NativeMessageKind::ClipboardUpdate;
    queue(hwnd, state, out);
    return 0;
  case WM_COPYDATA: {
    // The sender's buffer is only valid during this call.
    const auto *cds = reinterpret_cast<const COPYDATASTRUCT *>(lp);
    out.kind = NativeMessageKind::CopyData;
    out.sender = to_native(reinterpret_cast<HWND>(wp));
    out.data_type = static_cast<std::uint64_t>(cds->dwData);
    if (cds->lpData && cds->cbData) {
      const auto *p = static_cast<const std::uint8_t *>(cds->lpData);
      out.bytes.assign(p, p + cds->cbData);
    }
    queue(hwnd, state, std::move(out));
    return TRUE;
  }
  case WM_CLOSE:
    out.kind = NativeMessageKind::Close;
    queue(hwnd, state, out);
    return 0;
  case WM_ENDSESSION:
    if (wp) {
      out.kind = NativeMessageKind::Close;
      queue(hwnd, state, out);
    }
    return 0;
  default:
    if (state->taskbar_created != 0 && msg == state->taskbar_created) {
      out.kind = NativeMessageKind::TaskbarCreated;
      queue(hwnd, state, out);
      return 0;
    }
    break;
  }
  return DefWindowProcW(hwnd, msg, wp, lp);
}

NOTIFYICONDATAW make_nid(native_handle window, native_id id) {
  NOTIFYICONDATAW nid{};
  nid.cbSize = sizeof(nid);
  nid.hWnd = from_native<HWND>(window);
  nid.uID = id;
  return nid;
}

void notify(DWORD op, NOTIFYICONDATAW &nid, const char *what) {
  if (!Shell_NotifyIconW(op, &nid))
    throw last_error(what);
}

UINT menu_state_flags(const MenuItemState &state, bool is_default) {
  UINT flags = MFS_ENABLED;
  if (state.checked.value_or(false))
    flags |= MFS_CHECKED;
  if (!state.enabled.value_or(true))
    flags |= MFS_DISABLED;
  if (state.highlight.value_or(false))
    flags |= MFS_HILITE;
  if (is_default)
    flags |= MFS_DEFAULT;
  return flags;
}

void insert_last(HMENU menu, MENUITEMINFOW &mii, const char *what) {
  int count = GetMenuItemCount(menu);
  if (count < 0)
    throw last_error("GetMenuItemCount");
  if (!InsertMenuItemW(menu, static_cast<UINT>(count), TRUE, &mii))
    throw last_error(what);
}

SHSTOCKICONID stock_icon_id(StockIcon icon) {
  switch (icon) {
  case StockIcon::DocNoAssoc: return SIID_DOCNOASSOC;
  case StockIcon::DocAssoc: return SIID_DOCASSOC;
  case StockIcon::Application: return SIID_APPLICATION;
  case StockIcon::Folder: return SIID_FOLDER;
  case StockIcon::FolderOpen: return SIID_FOLDEROPEN;
  case StockIcon::DriveFixed: return SIID_DRIVEFIXED;
  case StockIcon::DriveNet: return SIID_DRIVENET;
  case StockIcon::DriveCD: return SIID_DRIVECD;
  case StockIcon::Server: return SIID_SERVER;
  case StockIcon::Printer: return SIID_PRINTER;
  case StockIcon::Find: return SIID_FIND;
  case StockIcon::Help: return SIID_HELP;
  case StockIcon::Share: return SIID_SHARE;
  case StockIcon::Link: return SIID_LINK;
  case StockIcon::Recycler: return SIID_RECYCLER;
  case StockIcon::RecyclerFull: return SIID_RECYCLERFULL;
  case StockIcon::Lock: return SIID_LOCK;
  case StockIcon::Shield: return SIID_SHIELD;
  case StockIcon::Warning: return SIID_WARNING;
  case StockIcon::Info: return SIID_INFO;
  case StockIcon::Error: return SIID_ERROR;
  case StockIcon::Key: return SIID_KEY;
  case StockIcon::Software: return SIID_SOFTWARE;
  case StockIcon::Rename: return SIID_RENAME;
  case StockIcon::Delete: return SIID_DELETE;
  case StockIcon::Users: return SIID_USERS;
  case StockIcon::Internet: return SIID_INTERNET;
  case StockIcon::ZipFile: return SIID_ZIPFILE;
  case StockIcon::Settings: return SIID_SETTINGS;
  case StockIcon::DesktopPC: return SIID_DESKTOPPC;
  case StockIcon::NetworkConnect: return SIID_NETWORKCONNECT;
  }
  return SIID_APPLICATION;
}

// The shell copies hBalloonIcon, so the caller keeps ownership.
OwnedIcon load_stock_icon(StockIcon icon, std::uint32_t options) {
  UINT flags = SHGSI_ICON;
  flags |= (options & NOTIFY_LARGE_ICON) ? SHGSI_LARGEICON : SHGSI_SMALLICON;
  if (options & NOTIFY_ICON_SELECTED)
    flags |= SHGSI_SELECTED;
  if (options & NOTIFY_ICON_LINK_OVERLAY)
    flags |= SHGSI_LINKOVERLAY;

  SHSTOCKICONINFO sii{};
  sii.cbSize = sizeof(sii);
  HRESULT hr = SHGetStockIconInfo(stock_icon_id(icon), flags, &sii);
  if (FAILED(hr))
    throw Error(ErrorCode::Shell,
                std::string("SHGetStockIconInfo(") + stock_icon_name(icon) +
                    ") failed",
                static_cast<std::uint32_t>(hr));
  return OwnedIcon(sii.hIcon);
}

std::vector<std::uint8_t> global_bytes(HANDLE h, const char *what) {
  GlobalMemLock mem(h);
  if (!mem.get())
    throw last_error(what);
  const auto *p = static_cast<const std::uint8_t *>(mem.get());
  return std::vector<std::uint8_t>(p, p + GlobalSize(h));
}

} // namespace

Win32Shell::Win32Shell()
    : taskbar_created_msg_(RegisterWindowMessageW(L"TaskbarCreated")) {
  if (taskbar_created_msg_ == 0)
    TRAYCTX_LOG_WARN("win32: TaskbarCreated message unavailable (" +
                     std::to_string(GetLastError()) + ")");
}

Win32Shell::~Win32Shell() = default;

Win32Shell::WindowState &Win32Shell::state_of(native_handle window) {
  auto it = windows_.find(window);
  if (it == windows_.end())
    throw Error(ErrorCode::Shell, "window was not created by this shell",
                ERROR_INVALID_WINDOW_HANDLE);
  return *it->second;
}

native_handle Win32Shell::create_window(const std::string &class_name,
                                        const std::string &window_name) {
  std::wstring cls = u82w(class_name);
  if (cls.empty() || cls.size() > 256)
    throw Error(ErrorCode::Shell, "window class name must be 1..256 chars",
                ERROR_INVALID_PARAMETER);
  std::wstring title = u82w(window_name);
  HINSTANCE inst = GetModuleHandleW(nullptr);

  WNDCLASSW wc{};
  wc.lpfnWndProc = window_proc;
  wc.hInstance = inst;
  wc.lpszClassName = cls.c_str();
  if (!RegisterClassW(&wc))
    throw last_error("RegisterClassW");

  auto state = std::make_unique<WindowState>();
  state->class_name = cls;
  state->taskbar_created = taskbar_created_msg_;

  HWND hwnd = CreateWindowExW(0, cls.c_str(),
                              title.empty() ? nullptr : title.c_str(),
                              WS_DISABLED, 0, 0, 0, 0, nullptr, nullptr, inst,
                              state.get());
  if (!hwnd) {
    Error err = last_error("CreateWindowExW");
    UnregisterClassW(cls.c_str(), inst);
    throw err;
  }

  // Lower-integrity senders and explorer must still reach us.
  if (!ChangeWindowMessageFilterEx(hwnd, WM_COPYDATA, MSGFLT_ALLOW, nullptr))
    TRAYCTX_LOG_DEBUG("win32: WM_COPYDATA filter not changed (" +
                      std::to_string(GetLastError()) + ")");
  if (taskbar_created_msg_ &&
      !ChangeWindowMessageFilterEx(hwnd, taskbar_created_msg_, MSGFLT_ALLOW,
                                   nullptr))
    TRAYCTX_LOG_DEBUG("win32: TaskbarCreated filter not changed (" +
                      std::to_string(GetLastError()) + ")");

  native_handle handle = to_native(hwnd);
  windows_[handle] = std::move(state);
  TRAYCTX_LOG_DEBUG("win32: window " + std::to_string(handle) + " created");
  return handle;
}

void Win32Shell::destroy_window(native_handle window) {
  WindowState &state = state_of(window);
  if (!DestroyWindow(from_native<HWND>(window)))
    throw last_error("DestroyWindow");
  if (!UnregisterClassW(state.class_name.c_str(), GetModuleHandleW(nullptr)))
    TRAYCTX_LOG_DEBUG("win32: UnregisterClassW failed (" +
                      std::to_string(GetLastError()) + ")");
  windows_.erase(window);
}

NativeMessage Win32Shell::wait_message(native_handle window) {
  WindowState &state = state_of(window);
  while (state.pending.empty()) {
    MSG msg;
    BOOL r = GetMessageW(&msg, nullptr, 0, 0);
    if (r == -1)
      throw last_error("GetMessageW");
    if (r == 0) {
      NativeMessage quit;
      quit.kind = NativeMessageKind::Quit;
      return quit;
    }
    TranslateMessage(&msg);
    DispatchMessageW(&msg);
  }
  NativeMessage out = std::move(state.pending.front());
  state.pending.pop_front();
  return out;
}

void Win32Shell::wake(native_handle window) {
  if (!PostMessageW(from_native<HWND>(window), WM_TRAYCTX_WAKE, 0, 0))
    TRAYCTX_LOG_DEBUG("win32: wake not posted (" +
                      std::to_string(GetLastError()) + ")");
}

void Win32Shell::add_clipboard_listener(native_handle window) {
  if (!AddClipboardFormatListener(from_native<HWND>(window)))
    throw last_error("AddClipboardFormatListener");
}

void Win32Shell::remove_clipboard_listener(native_handle window) {
  if (!RemoveClipboardFormatListener(from_native<HWND>(window)))
    throw last_error("RemoveClipboardFormatListener");
}

native_handle Win32Shell::create_icon_image(const IconBuffer &buffer) {
  auto *data = const_cast<PBYTE>(buffer.bytes.data());
  int offset = LookupIconIdFromDirectoryEx(
      data, TRUE, static_cast<int>(buffer.width),
      static_cast<int>(buffer.height), LR_DEFAULTCOLOR);
  if (offset <= 0 || static_cast<std::size_t>(offset) >= buffer.bytes.size())
    throw last_error("LookupIconIdFromDirectoryEx");

  HICON icon = CreateIconFromResourceEx(
      data + offset, static_cast<DWORD>(buffer.bytes.size() - offset), TRUE,
      0x00030000, static_cast<int>(buffer.width),
      static_cast<int>(buffer.height), LR_DEFAULTCOLOR);
  if (!icon)
    throw last_error("CreateIconFromResourceEx");
  return to_native(icon);
}

native_handle Win32Shell::stock_icon_image() {
  HICON icon = LoadIconW(nullptr, IDI_APPLICATION);
  if (!icon)
    throw last_error("LoadIconW");
  return to_native(icon);
}

void Win32Shell::destroy_icon_image(native_handle image) {
  if (!DestroyIcon(from_native<HICON>(image)))
    throw last_error("DestroyIcon");
}

void Win32Shell::add_tray_icon(native_handle window, native_id id) {
  NOTIFYICONDATAW nid = make_nid(window, id);
  nid.uFlags = NIF_MESSAGE;
  nid.uCallbackMessage = WM_TRAYCTX_ICON;
  notify(NIM_ADD, nid, "Shell_NotifyIconW(NIM_ADD)");
}

void Win32Shell::delete_tray_icon(native_handle window, native_id id) {
  NOTIFYICONDATAW nid = make_nid(window, id);
  notify(NIM_DELETE, nid, "Shell_NotifyIconW(NIM_DELETE)");
}

void Win32Shell::set_tray_image(native_handle window, native_id id,
                                native_handle image) {
  NOTIFYICONDATAW nid = make_nid(window, id);
  nid.uFlags = NIF_ICON;
  nid.hIcon = from_native<HICON>(image);
  notify(NIM_MODIFY, nid, "Shell_NotifyIconW(NIF_ICON)");
}

void Win32Shell::set_tray_tooltip(native_handle window, native_id id,
                                  const std::string &tooltip) {
  NOTIFYICONDATAW nid = make_nid(window, id);
  nid.uFlags = NIF_TIP | NIF_SHOWTIP;
  copy_truncated(nid.szTip, u82w(tooltip));
  notify(NIM_MODIFY, nid, "Shell_NotifyIconW(NIF_TIP)");
}

void Win32Shell::show_balloon(native_handle window, native_id id,
                              const Notification &n) {
  NOTIFYICONDATAW nid = make_nid(window, id);
  nid.uFlags = NIF_INFO;
  copy_truncated(nid.szInfoTitle, u82w(n.title));
  copy_truncated(nid.szInfo, u82w(n.message));
  if (n.timeout)
    nid.uTimeout = static_cast<UINT>(n.timeout->count());

  OwnedIcon stock;
  DWORD flags = NIIF_NONE;
  if (n.stock_icon) {
    stock = load_stock_icon(*n.stock_icon, n.options);
    nid.hBalloonIcon = stock.get();
    flags = NIIF_USER;
  } else {
    switch (n.icon) {
    case NotificationIcon::None:
      break;
    case NotificationIcon::Info:
      flags = NIIF_INFO;
      break;
    case NotificationIcon::Warning:
      flags = NIIF_WARNING;
      break;
    case NotificationIcon::Error:
      flags = NIIF_ERROR;
      break;
    }
  }
  if (n.options & NOTIFY_NO_SOUND)
    flags |= NIIF_NOSOUND;
  if (n.options & NOTIFY_LARGE_ICON)
    flags |= NIIF_LARGE_ICON;
  if (n.options & NOTIFY_RESPECT_QUIET_TIME)
    flags |= NIIF_RESPECT_QUIET_TIME;
  nid.dwInfoFlags = flags;

  notify(NIM_MODIFY, nid, "Shell_NotifyIconW(NIF_INFO)");
}

native_handle Win32Shell::create_popup_menu() {
  HMENU menu = CreatePopupMenu();
  if (!menu)
    throw last_error("CreatePopupMenu");
  return to_native(menu);
}

void Win32Shell::destroy_menu(native_handle menu) {
  if (!DestroyMenu(from_native<HMENU>(menu)))
    throw last_error("DestroyMenu");
}

void Win32Shell::append_menu_entry(native_handle menu, native_id id,
                                   const std::string &label,
                                   const MenuItemState &state,
                                   bool is_default) {
  std::wstring text = u82w(label);
  MENUITEMINFOW mii{};
  mii.cbSize = sizeof(mii);
  mii.fMask = MIIM_ID | MIIM_STRING | MIIM_STATE | MIIM_FTYPE;
  mii.fType = MFT_STRING;
  mii.wID = id;
  mii.dwTypeData = text.data();
  mii.fState = menu_state_flags(state, is_default);
  insert_last(from_native<HMENU>(menu), mii, "InsertMenuItemW(entry)");
}

void Win32Shell::append_menu_separator(native_handle menu) {
  MENUITEMINFOW mii{};
  mii.cbSize = sizeof(mii);
  mii.fMask = MIIM_FTYPE;
  mii.fType = MFT_SEPARATOR;
  insert_last(from_native<HMENU>(menu), mii, "InsertMenuItemW(separator)");
}

void Win32Shell::append_submenu(native_handle menu, native_id id,
                                const std::string &label,
                                native_handle submenu) {
  std::wstring text = u82w(label);
  MENUITEMINFOW mii{};
  mii.cbSize = sizeof(mii);
  mii.fMask = MIIM_ID | MIIM_STRING | MIIM_SUBMENU | MIIM_FTYPE;
  mii.fType = MFT_STRING;
  mii.wID = id;
  mii.dwTypeData = text.data();
  mii.hSubMenu = from_native<HMENU>(submenu);
  insert_last(from_native<HMENU>(menu), mii, "InsertMenuItemW(submenu)");
}

void Win32Shell::modify_menu_item(native_handle menu, native_id id,
                                  const MenuItemState &change) {
  HMENU hmenu = from_native<HMENU>(menu);

  MENUITEMINFOW current{};
  current.cbSize = sizeof(current);
  current.fMask = MIIM_STATE;
  if (!GetMenuItemInfoW(hmenu, id, FALSE, &current))
    throw last_error("GetMenuItemInfoW");

  UINT state = current.fState;
  if (change.checked)
    state = *change.checked ? (state | MFS_CHECKED) : (state & ~MFS_CHECKED);
  if (change.enabled)
    state = *change.enabled ? (state & ~MFS_DISABLED) : (state | MFS_DISABLED);
  if (change.highlight)
    state = *change.highlight ? (state | MFS_HILITE) : (state & ~MFS_HILITE);

  std::wstring text;
  MENUITEMINFOW mii{};
  mii.cbSize = sizeof(mii);
  mii.fMask = MIIM_STATE;
  mii.fState = state;
  if (change.label) {
    text = u82w(*change.label);
    mii.fMask |= MIIM_STRING;
    mii.dwTypeData = text.data();
  }
  if (!SetMenuItemInfoW(hmenu, id, FALSE, &mii))
    throw last_error("SetMenuItemInfoW");
}

void Win32Shell::track_popup_menu(native_handle window, native_handle menu) {
  HWND hwnd = from_native<HWND>(window);
  POINT pt{};
  if (!GetCursorPos(&pt))
    throw last_error("GetCursorPos");

  // Without this the menu does not close when clicking elsewhere.
  if (!SetForegroundWindow(hwnd))
    TRAYCTX_LOG_DEBUG("win32: SetForegroundWindow refused");
  if (!TrackPopupMenu(from_native<HMENU>(menu),
                      TPM_RIGHTBUTTON | TPM_BOTTOMALIGN, pt.x, pt.y, 0, hwnd,
                      nullptr))
    throw last_error("TrackPopupMenu");
  PostMessageW(hwnd, WM_NULL, 0, 0);
}

std::optional<ClipboardData> Win32Shell::read_clipboard(native_handle window) {
  ClipboardLock lock(from_native<HWND>(window));
  if (!lock.is_open())
    throw last_error("OpenClipboard");

  if (IsClipboardFormatAvailable(CF_UNICODETEXT)) {
    HANDLE h = GetClipboardData(CF_UNICODETEXT);
    if (!h)
      throw last_error("GetClipboardData(CF_UNICODETEXT)");
    std::vector<std::uint8_t> raw = global_bytes(h, "GlobalLock");
    const auto *w = reinterpret_cast<const wchar_t *>(raw.data());
    std::size_t n = wcsnlen(w, raw.size() / sizeof(wchar_t));
    return ClipboardData::text(w2u8(std::wstring(w, n)));
  }
  if (IsClipboardFormatAvailable(CF_DIBV5)) {
    HANDLE h = GetClipboardData(CF_DIBV5);
    if (!h)
      throw last_error("GetClipboardData(CF_DIBV5)");
    return ClipboardData{ClipboardFormat::Bitmap, global_bytes(h, "GlobalLock")};
  }
  return std::nullopt;
}

void Win32Shell::write_clipboard(native_handle window,
                                 const ClipboardData &data) {
  UINT format = CF_DIBV5;
  std::vector<std::uint8_t> payload;
  if (data.format == ClipboardFormat::Text) {
    format = CF_UNICODETEXT;
    std::wstring w = u82w(data.as_text());
    const auto *p = reinterpret_cast<const std::uint8_t *>(w.c_str());
    payload.assign(p, p + (w.size() + 1) * sizeof(wchar_t));
  } else {
    payload = data.bytes;
  }

  ClipboardLock lock(from_native<HWND>(window));
  if (!lock.is_open())
    throw last_error("OpenClipboard");
  if (!EmptyClipboard())
    throw last_error("EmptyClipboard");

  HGLOBAL mem = GlobalAlloc(GMEM_MOVEABLE, payload.size());
  if (!mem)
    throw last_error("GlobalAlloc");
  {
    GlobalMemLock locked(mem);
    if (!locked.get()) {
      Error err = last_error("GlobalLock");
      GlobalFree(mem);
      throw err;
    }
    std::memcpy(locked.get(), payload.data(), payload.size());
  }
  // On success the clipboard owns `mem`.
  if (!SetClipboardData(format, mem)) {
    Error err = last_error("SetClipboardData");
    GlobalFree(mem);
    throw err;
  }
}

void Win32Shell::send_copy_data(native_handle window,
                                const CopyDataTarget &target,
                                std::uint64_t data_type,
                                const std::vector<std::uint8_t> &bytes) {
  std::wstring cls = u82w(target.class_name);
  std::wstring title = u82w(target.window_name);
  const wchar_t *title_ptr = title.empty() ? nullptr : title.c_str();

  HWND dest = FindWindowW(cls.c_str(), title_ptr);
  if (!dest)
    dest = FindWindowExW(HWND_MESSAGE, nullptr, cls.c_str(), title_ptr);
  if (!dest)
    throw Error(ErrorCode::Shell,
                "no window of class '" + target.class_name + "'",
                ERROR_NOT_FOUND);

  COPYDATASTRUCT cds{};
  cds.dwData = static_cast<ULONG_PTR>(data_type);
  cds.cbData = static_cast<DWORD>(bytes.size());
  cds.lpData = const_cast<std::uint8_t *>(bytes.data());

  DWORD_PTR result = 0;
  if (!SendMessageTimeoutW(dest, WM_COPYDATA,
                           reinterpret_cast<WPARAM>(from_native<HWND>(window)),
                           reinterpret_cast<LPARAM>(&cds), SMTO_ABORTIFHUNG,
                           COPY_DATA_TIMEOUT_MS, &result))
    throw last_error("SendMessageTimeoutW(WM_COPYDATA)");
  if (!result)
    throw Error(ErrorCode::Shell, "WM_COPYDATA refused by receiver");
}

std::optional<std::string> Win32Shell::registry_get(const std::string &key,
                                                    const std::string &name) {
  std::wstring wkey = u82w(key);
  std::wstring wname = u82w(name);

  HKey k;
  LSTATUS s = RegOpenKeyExW(HKEY_CURRENT_USER, wkey.c_str(), 0,
                            KEY_QUERY_VALUE, &k);
  if (s == ERROR_FILE_NOT_FOUND)
    return std::nullopt;
  if (s != ERROR_SUCCESS)
    throw status_error("RegOpenKeyExW", s);

  DWORD type = 0;
  DWORD size = 0;
  s = RegQueryValueExW(k, wname.c_str(), nullptr, &type, nullptr, &size);
  if (s == ERROR_FILE_NOT_FOUND)
    return std::nullopt;
  if (s != ERROR_SUCCESS)
    throw status_error("RegQueryValueExW", s);
  if (type != REG_SZ && type != REG_EXPAND_SZ) {
    TRAYCTX_LOG_DEBUG("win32: registry value '" + name + "' is not a string");
    return std::nullopt;
  }

  std::wstring value(size / sizeof(wchar_t) + 1, L'\0');
  size = static_cast<DWORD>(value.size() * sizeof(wchar_t));
  s = RegQueryValueExW(k, wname.c_str(), nullptr, &type,
                       reinterpret_cast<LPBYTE>(value.data()), &size);
  if (s != ERROR_SUCCESS)
    throw status_error("RegQueryValueExW", s);
  value.resize(wcsnlen(value.c_str(), size / sizeof(wchar_t)));
  return w2u8(value);
}

void Win32Shell::registry_set(const std::string &key, const std::string &name,
                              const std::string &value) {
  std::wstring wkey = u82w(key);
  std::wstring wname = u82w(name);
  std::wstring wvalue = u82w(value);

  HKey k;
  LSTATUS s = RegCreateKeyExW(HKEY_CURRENT_USER, wkey.c_str(), 0, nullptr, 0,
                              KEY_SET_VALUE, nullptr, &k, nullptr);
  if (s != ERROR_SUCCESS)
    throw status_error("RegCreateKeyExW", s);
  s = RegSetValueExW(k, wname.c_str(), 0, REG_SZ,
                     reinterpret_cast<const BYTE *>(wvalue.c_str()),
                     static_cast<DWORD>((wvalue.size() + 1) * sizeof(wchar_t)));
  if (s != ERROR_SUCCESS)
    throw status_error("RegSetValueExW", s);
}

void Win32Shell::registry_delete(const std::string &key,
                                 const std::string &name) {
  std::wstring wkey = u82w(key);
  std::wstring wname = u82w(name);

  HKey k;
  LSTATUS s =
      RegOpenKeyExW(HKEY_CURRENT_USER, wkey.c_str(), 0, KEY_SET_VALUE, &k);
  if (s == ERROR_FILE_NOT_FOUND)
    return;
  if (s != ERROR_SUCCESS)
    throw status_error("RegOpenKeyExW", s);
  s = RegDeleteValueW(k, wname.c_str());
  if (s != ERROR_SUCCESS && s != ERROR_FILE_NOT_FOUND)
    throw status_error("RegDeleteValueW", s);
}

std::string Win32Shell::current_executable() {
  std::wstring path(MAX_PATH, L'\0');
  for (;;) {
    DWORD n = GetModuleFileNameW(nullptr, path.data(),
                                 static_cast<DWORD>(path.size()));
    if (n == 0)
      throw last_error("GetModuleFileNameW");
    if (n < path.size()) {
      path.resize(n);
      return w2u8(path);
    }
    path.resize(path.size() * 2);
  }
}

std::optional<native_handle>
Win32Shell::acquire_named_mutex(const std::string &name) {
  std::wstring wname = u82w(name);
  SafeHandle mutex(CreateMutexW(nullptr, FALSE, wname.c_str()));
  DWORD err = GetLastError();
  if (!mutex.is_valid())
    throw last_error("CreateMutexW");
  if (err == ERROR_ALREADY_EXISTS)
    return std::nullopt;
  return to_native(mutex.release());
}

void Win32Shell::release_named_mutex(native_handle mutex) {
  if (!CloseHandle(from_native<HANDLE>(mutex)))
    throw last_error("CloseHandle");
}

bool Win32Shell::open_directory(const std::string &path) {
  std::wstring wpath = u82w(path);
  HINSTANCE r = ShellExecuteW(nullptr, L"open", wpath.c_str(), nullptr,
                              nullptr, SW_SHOWNORMAL);
  if (reinterpret_cast<INT_PTR>(r) <= 32) {
    TRAYCTX_LOG_WARN("win32: cannot open '" + path + "' (" +
                     std::to_string(reinterpret_cast<INT_PTR>(r)) + ")");
    return false;
  }
  return true;
}

} // namespace trayctx
#endif
