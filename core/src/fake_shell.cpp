#include "trayctx/fake_shell.hpp"
#include "trayctx/error.hpp"
#include <algorithm>

namespace trayctx {

namespace {
constexpr native_handle STOCK_IMAGE = 0x1;
}

void FakeShell::record(const std::string &call) { calls_.push_back(call); }

void FakeShell::maybe_fail(const std::string &op) {
  auto it = failures_.find(op);
  if (it == failures_.end() || it->second <= 0)
    return;
  it->second--;
  record(op + ":failed");
  throw Error(ErrorCode::Shell, "fake " + op + " failure", 5);
}

FakeMenuItem *FakeShell::find_item(native_handle menu, native_id id) {
  auto it = menus_.find(menu);
  if (it == menus_.end())
    return nullptr;
  for (auto &item : it->second) {
    if (item.kind != FakeMenuItem::Kind::Separator && item.id == id)
      return &item;
    if (item.kind == FakeMenuItem::Kind::Submenu) {
      if (FakeMenuItem *found = find_item(item.submenu, id))
        return found;
    }
  }
  return nullptr;
}

native_handle FakeShell::create_window(const std::string &class_name,
                                       const std::string &) {
  std::lock_guard<std::mutex> lk(mu_);
  maybe_fail("create_window");
  window_ = next_handle_++;
  record("create_window:" + class_name);
  return window_;
}

void FakeShell::destroy_window(native_handle window) {
  std::lock_guard<std::mutex> lk(mu_);
  maybe_fail("destroy_window");
  if (window != window_ || window_ == 0)
    throw Error(ErrorCode::Shell, "no such window", 1400);
  window_ = 0;
  record("destroy_window");
}

NativeMessage FakeShell::wait_message(native_handle) {
  std::unique_lock<std::mutex> lk(mu_);
  maybe_fail("wait_message");
  // Only posted messages end the wait; a dispatched wake is dropped when the
  // window procedure already queued something.
  while (dispatched_.empty()) {
    cv_.wait(lk, [&] { return !inbox_.empty(); });
    NativeMessage posted = std::move(inbox_.front());
    inbox_.pop_front();
    if (posted.kind != NativeMessageKind::Wake || dispatched_.empty())
      dispatched_.push_back(std::move(posted));
  }
  NativeMessage msg = std::move(dispatched_.front());
  dispatched_.pop_front();
  return msg;
}

void FakeShell::wake(native_handle window) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    // PostMessage to a destroyed window goes nowhere.
    if (window_ == 0 || window != window_)
      return;
    inbox_.push_back(NativeMessage{});
  }
  cv_.notify_one();
}

void FakeShell::add_clipboard_listener(native_handle) {
  std::lock_guard<std::mutex> lk(mu_);
  maybe_fail("add_clipboard_listener");
  clipboard_listener_ = true;
  record("add_clipboard_listener");
}

void FakeShell::remove_clipboard_listener(native_handle) {
  std::lock_guard<std::mutex> lk(mu_);
  maybe_fail("remove_clipboard_listener");
  clipboard_listener_ = false;
  record("remove_clipboard_listener");
}

native_handle FakeShell::create_icon_image(const IconBuffer &buffer) {
  std::lock_guard<std::mutex> lk(mu_);
  maybe_fail("create_icon_image");
  if (buffer.bytes.empty())
    throw Error(ErrorCode::Shell, "empty icon buffer", 87);
  native_handle h = next_handle_++;
  images_.insert(h);
  record("create_icon_image:" + std::to_string(buffer.bytes.size()));
  return h;
}

native_handle FakeShell::stock_icon_image() {
  std::lock_guard<std::mutex> lk(mu_);
  maybe_fail("stock_icon_image");
  record("stock_icon_image");
  return STOCK_IMAGE;
}

void FakeShell::destroy_icon_image(native_handle image) {
  std::lock_guard<std::mutex> lk(mu_);
  maybe_fail("destroy_icon_image");
  if (!images_.erase(image))
    throw Error(ErrorCode::Shell, "no such image", 1402);
  record("destroy_icon_image");
}

void FakeShell::add_tray_icon(native_handle, native_id id) {
  std::lock_guard<std::mutex> lk(mu_);
  maybe_fail("add_tray_icon");
  if (icons_.count(id))
    throw Error(ErrorCode::Shell, "icon id already present");
  icons_[id] = FakeTrayIcon{};
  record("add_tray_icon:" + std::to_string(id));
}

void FakeShell::delete_tray_icon(native_handle, native_id id) {
  std::lock_guard<std::mutex> lk(mu_);
  maybe_fail("delete_tray_icon");
  if (!icons_.erase(id))
    throw Error(ErrorCode::Shell, "no icon " + std::to_string(id));
  record("delete_tray_icon:" + std::to_string(id));
}

void FakeShell::set_tray_image(native_handle, native_id id,
                               native_handle image) {
  std::lock_guard<std::mutex> lk(mu_);
  maybe_fail("set_tray_image");
  auto it = icons_.find(id);
  if (it == icons_.end())
    throw Error(ErrorCode::Shell, "no icon " + std::to_string(id));
  it->second.image = image;
  record("set_tray_image:" + std::to_string(id));
}

void FakeShell::set_tray_tooltip(native_handle, native_id id,
                                 const std::string &tooltip) {
  std::lock_guard<std::mutex> lk(mu_);
  maybe_fail("set_tray_tooltip");
  auto it = icons_.find(id);
  if (it == icons_.end())
    throw Error(ErrorCode::Shell, "no icon " + std::to_string(id));
  it->second.tooltip = tooltip;
  record("set_tray_tooltip:" + std::to_string(id) + "=" + tooltip);
}

void FakeShell::show_balloon(native_handle, native_id id,
                             const Notification &n) {
  std::lock_guard<std::mutex> lk(mu_);
  maybe_fail("show_balloon");
  if (!icons_.count(id))
    throw Error(ErrorCode::Shell, "no icon " + std::to_string(id));
  balloons_.push_back(
      FakeBalloon{id, n.title, n.message, n.icon, n.stock_icon, n.options});
  std::string call = "show_balloon:" + std::to_string(id) + ":" + n.title;
  if (n.stock_icon)
    call += std::string(":stock=") + stock_icon_name(*n.stock_icon);
  record(call);
}

native_handle FakeShell::create_popup_menu() {
  std::lock_guard<std::mutex> lk(mu_);
  maybe_fail("create_popup_menu");
  native_handle h = next_handle_++;
  menus_[h];
  record("create_popup_menu");
  return h;
}

void FakeShell::destroy_menu(native_handle menu) {
  std::lock_guard<std::mutex> lk(mu_);
  maybe_fail("destroy_menu");
  if (!menus_.count(menu))
    throw Error(ErrorCode::Shell, "no such menu", 1401);

  std::vector<native_handle> doomed{menu};
  while (!doomed.empty()) {
    native_handle h = doomed.back();
    doomed.pop_back();
    auto it = menus_.find(h);
    if (it == menus_.end())
      continue;
    for (const auto &item : it->second) {
      if (item.kind == FakeMenuItem::Kind::Submenu)
        doomed.push_back(item.submenu);
    }
    menus_.erase(it);
  }
  record("destroy_menu");
}

void FakeShell::append_menu_entry(native_handle menu, native_id id,
                                  const std::string &label,
                                  const MenuItemState &state, bool is_default) {
  std::lock_guard<std::mutex> lk(mu_);
  maybe_fail("append_menu_entry");
  auto it = menus_.find(menu);
  if (it == menus_.end())
    throw Error(ErrorCode::Shell, "no such menu", 1401);
  FakeMenuItem item;
  item.kind = FakeMenuItem::Kind::Entry;
  item.id = id;
  item.label = label;
  item.checked = state.checked.value_or(false);
  item.enabled = state.enabled.value_or(true);
  item.highlight = state.highlight.value_or(false);
  item.is_default = is_default;
  it->second.push_back(item);
  record("append_menu_entry:" + std::to_string(id) + ":" + label);
}

void FakeShell::append_menu_separator(native_handle menu) {
  std::lock_guard<std::mutex> lk(mu_);
  maybe_fail("append_menu_separator");
  auto it = menus_.find(menu);
  if (it == menus_.end())
    throw Error(ErrorCode::Shell, "no such menu", 1401);
  FakeMenuItem item;
  item.kind = FakeMenuItem::Kind::Separator;
  it->second.push_back(item);
  record("append_menu_separator");
}

void FakeShell::append_submenu(native_handle menu, native_id id,
                               const std::string &label,
                               native_handle submenu) {
  std::lock_guard<std::mutex> lk(mu_);
  maybe_fail("append_submenu");
  auto it = menus_.find(menu);
  if (it == menus_.end() || !menus_.count(submenu))
    throw Error(ErrorCode::Shell, "no such menu", 1401);
  FakeMenuItem item;
  item.kind = FakeMenuItem::Kind::Submenu;
  item.id = id;
  item.label = label;
  item.submenu = submenu;
  it->second.push_back(item);
  record("append_submenu:" + std::to_string(id) + ":" + label);
}

void FakeShell::modify_menu_item(native_handle menu, native_id id,
                                 const MenuItemState &change) {
  std::lock_guard<std::mutex> lk(mu_);
  maybe_fail("modify_menu_item");
  FakeMenuItem *item = find_item(menu, id);
  if (!item)
    throw Error(ErrorCode::Shell, "no menu item " + std::to_string(id), 1456);
  if (change.label)
    item->label = *change.label;
  if (change.checked)
    item->checked = *change.checked;
  if (change.enabled)
    item->enabled = *change.enabled;
  if (change.highlight)
    item->highlight = *change.highlight;
  record("modify_menu_item:" + std::to_string(id));
}

void FakeShell::track_popup_menu(native_handle, native_handle menu) {
  std::lock_guard<std::mutex> lk(mu_);
  maybe_fail("track_popup_menu");
  if (!menus_.count(menu))
    throw Error(ErrorCode::Shell, "no such menu", 1401);
  record("track_popup_menu");
}

std::optional<ClipboardData> FakeShell::read_clipboard(native_handle) {
  std::lock_guard<std::mutex> lk(mu_);
  maybe_fail("read_clipboard");
  record("read_clipboard");
  return clipboard_;
}

void FakeShell::write_clipboard(native_handle, const ClipboardData &data) {
  std::lock_guard<std::mutex> lk(mu_);
  maybe_fail("write_clipboard");
  clipboard_ = data;
  record("write_clipboard:" + std::to_string(data.bytes.size()));
}

void FakeShell::send_copy_data(native_handle, const CopyDataTarget &target,
                               std::uint64_t data_type,
                               const std::vector<std::uint8_t> &bytes) {
  std::lock_guard<std::mutex> lk(mu_);
  maybe_fail("send_copy_data");
  record("send_copy_data:" + target.class_name + ":" +
         std::to_string(data_type) + ":" + std::to_string(bytes.size()));
}

std::optional<std::string> FakeShell::registry_get(const std::string &key,
                                                   const std::string &name) {
  std::lock_guard<std::mutex> lk(mu_);
  maybe_fail("registry_get");
  auto it = registry_.find(key + "\\" + name);
  if (it == registry_.end())
    return std::nullopt;
  return it->second;
}

void FakeShell::registry_set(const std::string &key, const std::string &name,
                             const std::string &value) {
  std::lock_guard<std::mutex> lk(mu_);
  maybe_fail("registry_set");
  registry_[key + "\\" + name] = value;
  record("registry_set:" + name + "=" + value);
}

void FakeShell::registry_delete(const std::string &key,
                                const std::string &name) {
  std::lock_guard<std::mutex> lk(mu_);
  maybe_fail("registry_delete");
  registry_.erase(key + "\\" + name);
  record("registry_delete:" + name);
}

std::string FakeShell::current_executable() {
  std::lock_guard<std::mutex> lk(mu_);
  return executable_;
}

std::optional<native_handle>
FakeShell::acquire_named_mutex(const std::string &name) {
  std::lock_guard<std::mutex> lk(mu_);
  maybe_fail("acquire_named_mutex");
  if (mutexes_.count(name))
    return std::nullopt;
  mutexes_.insert(name);
  native_handle h = next_handle_++;
  mutex_handles_[h] = name;
  record("acquire_named_mutex:" + name);
  return h;
}

void FakeShell::release_named_mutex(native_handle mutex) {
  std::lock_guard<std::mutex> lk(mu_);
  maybe_fail("release_named_mutex");
  auto it = mutex_handles_.find(mutex);
  if (it == mutex_handles_.end())
    throw Error(ErrorCode::Shell, "no such mutex", 6);
  mutexes_.erase(it->second);
  record("release_named_mutex:" + it->second);
  mutex_handles_.erase(it);
}

bool FakeShell::open_directory(const std::string &path) {
  std::lock_guard<std::mutex> lk(mu_);
  record("open_directory:" + path);
  return !path.empty();
}

// Test helpers

void FakeShell::inject(NativeMessage msg) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    inbox_.push_back(std::move(msg));
  }
  cv_.notify_one();
}

void FakeShell::send_message(NativeMessage msg) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    record("send_message");
    dispatched_.push_back(std::move(msg));
    // Same re-post as the Win32 window procedure.
    inbox_.push_back(NativeMessage{});
  }
  cv_.notify_one();
}

void FakeShell::click_menu_item(native_id id) {
  NativeMessage msg;
  msg.kind = NativeMessageKind::MenuCommand;
  msg.id = id;
  inject(std::move(msg));
}

void FakeShell::icon_action(native_id icon, IconAction action) {
  NativeMessage msg;
  msg.kind = NativeMessageKind::IconCallback;
  msg.id = icon;
  msg.action = action;
  inject(std::move(msg));
}

void FakeShell::restart_taskbar() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    icons_.clear();
    record("restart_taskbar");
    NativeMessage msg;
    msg.kind = NativeMessageKind::TaskbarCreated;
    inbox_.push_back(std::move(msg));
  }
  cv_.notify_one();
}

void FakeShell::fail_on(const std::string &op, int times) {
  std::lock_guard<std::mutex> lk(mu_);
  failures_[op] += times;
}

void FakeShell::set_executable(const std::string &path) {
  std::lock_guard<std::mutex> lk(mu_);
  executable_ = path;
}

std::vector<std::string> FakeShell::get_calls() const {
  std::lock_guard<std::mutex> lk(mu_);
  return calls_;
}

void FakeShell::clear_calls() {
  std::lock_guard<std::mutex> lk(mu_);
  calls_.clear();
}

bool FakeShell::has_call(const std::string &call) const {
  std::lock_guard<std::mutex> lk(mu_);
  return std::find(calls_.begin(), calls_.end(), call) != calls_.end();
}

bool FakeShell::window_alive() const {
  std::lock_guard<std::mutex> lk(mu_);
  return window_ != 0;
}

bool FakeShell::clipboard_listening() const {
  std::lock_guard<std::mutex> lk(mu_);
  return clipboard_listener_;
}

std::map<native_id, FakeTrayIcon> FakeShell::tray_icons() const {
  std::lock_guard<std::mutex> lk(mu_);
  return icons_;
}

std::vector<FakeMenuItem> FakeShell::menu_items(native_handle menu) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = menus_.find(menu);
  if (it == menus_.end())
    return {};
  return it->second;
}

std::size_t FakeShell::live_menus() const {
  std::lock_guard<std::mutex> lk(mu_);
  return menus_.size();
}

std::vector<native_handle> FakeShell::menu_handles() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<native_handle> out;
  for (const auto &kv : menus_)
    out.push_back(kv.first);
  return out;
}

std::size_t FakeShell::live_images() const {
  std::lock_guard<std::mutex> lk(mu_);
  return images_.size();
}

std::vector<FakeBalloon> FakeShell::balloons() const {
  std::lock_guard<std::mutex> lk(mu_);
  return balloons_;
}

std::optional<ClipboardData> FakeShell::clipboard() const {
  std::lock_guard<std::mutex> lk(mu_);
  return clipboard_;
}

void FakeShell::set_clipboard(ClipboardData data) {
  std::lock_guard<std::mutex> lk(mu_);
  clipboard_ = std::move(data);
}

} // namespace trayctx
