#include "trayctx/pump.hpp"
#include "trayctx/logger.hpp"

namespace trayctx {

const char *pump_state_name(PumpState state) {
  switch (state) {
  case PumpState::NotStarted:
    return "not-started";
  case PumpState::Running:
    return "running";
  case PumpState::ShuttingDown:
    return "shutting-down";
  case PumpState::Stopped:
    return "stopped";
  }
  return "unknown";
}

MessagePump::MessagePump(IShell *shell, PumpConfig config, IdRegistry registry,
                         std::shared_ptr<CommandChannel> inbox,
                         std::shared_ptr<EventChannel> events)
    : shell_(shell), config_(std::move(config)),
      registry_(std::move(registry)), inbox_(std::move(inbox)),
      events_(std::move(events)) {}

MessagePump::~MessagePump() { join(); }

void MessagePump::start() {
  if (state_.load() != PumpState::NotStarted || thread_.joinable())
    throw Error(ErrorCode::Setup, "pump already started");

  std::promise<void> started;
  std::future<void> ready = started.get_future();
  thread_ = std::thread(&MessagePump::run, this, std::move(started));
  try {
    ready.get();
  } catch (const Error &) {
    thread_.join();
    throw;
  }
}

void MessagePump::join() {
  if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id())
    thread_.join();
}

void MessagePump::run(std::promise<void> started) {
  Logger::set_thread_name("pump");

  auto fail = [&](const std::string &what, std::uint32_t os_error) {
    TRAYCTX_LOG_ERROR("pump: setup failed: " + what);
    teardown();
    inbox_->close();
    events_->close();
    state_ = PumpState::Stopped;
    started.set_exception(
        std::make_exception_ptr(Error(ErrorCode::Setup, what, os_error)));
  };

  try {
    setup();
  } catch (const Error &e) {
    fail(e.what(), e.os_error());
    return;
  } catch (const std::exception &e) {
    fail(e.what(), 0);
    return;
  }

  state_ = PumpState::Running;
  TRAYCTX_LOG_INFO("pump: running with " + std::to_string(icons_.size()) +
                   " icon(s)");
  started.set_value();

  loop();
  finish();
}

void MessagePump::setup() {
  window_ = shell_->create_window(config_.class_name, config_.window_name);
  TRAYCTX_LOG_DEBUG("pump: window created for class '" + config_.class_name +
                    "'");

  for (const auto &buffer : config_.images)
    images_.push_back(shell_->create_icon_image(buffer));

  std::vector<Area> areas = std::move(config_.areas);
  config_.areas.clear();
  for (auto &area : areas)
    install_icon(std::move(area));

  if (config_.clipboard_events) {
    shell_->add_clipboard_listener(window_);
    clipboard_listener_ = true;
  }
}

void MessagePump::loop() {
  while (state_.load() == PumpState::Running) {
    drain_inbox();
    if (state_.load() != PumpState::Running)
      break;

    NativeMessage msg;
    try {
      msg = shell_->wait_message(window_);
    } catch (const Error &e) {
      report("wait-message", e);
      begin_shutdown("native wait failed");
      break;
    }
    dispatch(std::move(msg));
  }
}

void MessagePump::finish() {
  inbox_->close();
  while (auto cmd = inbox_->try_pop())
    discard(*cmd);

  teardown();
  TRAYCTX_LOG_INFO("pump: stopped");
  emit(event::ShutdownComplete{});
  state_ = PumpState::Stopped;
  events_->close();
}

void MessagePump::teardown() {
  auto quietly = [](const char *what, auto &&fn) {
    try {
      fn();
    } catch (const Error &e) {
      TRAYCTX_LOG_WARN(std::string("pump: teardown ") + what +
                       " failed: " + e.what());
    }
  };

  for (auto &kv : icons_) {
    TrayIcon &icon = kv.second;
    if (icon.menu_handle) {
      quietly("destroy-menu", [&] { shell_->destroy_menu(icon.menu_handle); });
      icon.menu_handle = 0;
    }
  }
  for (auto &kv : icons_) {
    TrayIcon &icon = kv.second;
    if (icon.added) {
      quietly("delete-tray-icon",
              [&] { shell_->delete_tray_icon(window_, icon.id); });
      icon.added = false;
    }
  }
  for (native_handle image : images_)
    quietly("destroy-icon-image", [&] { shell_->destroy_icon_image(image); });
  images_.clear();

  if (clipboard_listener_) {
    quietly("remove-clipboard-listener",
            [&] { shell_->remove_clipboard_listener(window_); });
    clipboard_listener_ = false;
  }
  if (window_) {
    quietly("destroy-window", [&] { shell_->destroy_window(window_); });
    window_ = 0;
  }

  for (auto &kv : icons_)
    release_tokens(kv.second);
  icons_.clear();
  item_owner_.clear();
  TRAYCTX_LOG_DEBUG("pump: teardown done, " +
                    std::to_string(registry_.live(IdSpace::MenuItem)) +
                    " menu id(s) still bound");
}

void MessagePump::drain_inbox() {
  while (state_.load() == PumpState::Running) {
    auto cmd = inbox_->try_pop();
    if (!cmd)
      break;
    execute(*cmd);
  }
}

void MessagePump::discard(Command &cmd) {
  TRAYCTX_LOG_DEBUG(std::string("pump: dropping ") + command_name(cmd) +
                    " after shutdown");
  if (auto *read = std::get_if<command::ReadClipboard>(&cmd)) {
    read->reply->set_exception(std::make_exception_ptr(
        Error(ErrorCode::ChannelClosed, "pump stopped before reading")));
  }
}

void MessagePump::execute(Command &cmd) {
  const char *name = command_name(cmd);
  TRAYCTX_LOG_DEBUG(std::string("pump: command ") + name);
  try {
    std::visit([this](auto &c) { handle(c); }, cmd);
  } catch (const Error &e) {
    report(name, e);
  } catch (const std::exception &e) {
    report(name, Error(ErrorCode::Shell, e.what()));
  }
}

void MessagePump::begin_shutdown(const char *reason) {
  PumpState expected = PumpState::Running;
  if (state_.compare_exchange_strong(expected, PumpState::ShuttingDown))
    TRAYCTX_LOG_INFO(std::string("pump: shutting down (") + reason + ")");
}

void MessagePump::dispatch(NativeMessage msg) {
  switch (msg.kind) {
  case NativeMessageKind::Wake:
    break;
  case NativeMessageKind::IconCallback:
    on_icon(msg);
    break;
  case NativeMessageKind::MenuCommand:
    on_menu_command(msg.id);
    break;
  case NativeMessageKind::ClipboardUpdate:
    emit(event::ClipboardChanged{});
    break;
  case NativeMessageKind::CopyData:
    TRAYCTX_LOG_DEBUG("pump: copy data type " + std::to_string(msg.data_type) +
                      ", " + std::to_string(msg.bytes.size()) + " byte(s)");
    emit(event::CopyDataReceived{msg.sender, msg.data_type,
                                 std::move(msg.bytes)});
    break;
  case NativeMessageKind::TaskbarCreated:
    restore_icons();
    break;
  case NativeMessageKind::Close:
    begin_shutdown("window closed");
    break;
  case NativeMessageKind::Quit:
    begin_shutdown("quit message");
    break;
  }
}

void MessagePump::on_icon(const NativeMessage &msg) {
  auto token = registry_.resolve_token(IdSpace::Icon, msg.id);
  auto it = token ? icons_.find(*token) : icons_.end();
  if (it == icons_.end()) {
    TRAYCTX_LOG_DEBUG("pump: callback for stale icon id " +
                      std::to_string(msg.id));
    return;
  }
  TrayIcon &icon = it->second;

  switch (msg.action) {
  case IconAction::LeftClick:
    emit(event::IconClicked{icon.token});
    break;
  case IconAction::RightClick:
    if (!icon.menu_handle)
      break;
    try {
      shell_->track_popup_menu(window_, icon.menu_handle);
    } catch (const Error &e) {
      report("track-popup-menu", e);
    }
    break;
  case IconAction::DoubleClick:
    if (icon.menu && icon.menu->default_item())
      emit(event::MenuItemClicked{*icon.menu->default_item(), icon.token});
    break;
  case IconAction::BalloonShown:
    TRAYCTX_LOG_TRACE("pump: balloon shown on " + icon.token.to_string());
    break;
  case IconAction::BalloonClicked:
    on_balloon_done(icon.token, true);
    break;
  case IconAction::BalloonTimeout:
    on_balloon_done(icon.token, false);
    break;
  case IconAction::None:
    break;
  }
}

void MessagePump::on_menu_command(native_id id) {
  auto item = registry_.resolve_token(IdSpace::MenuItem, id);
  auto owner = item ? item_owner_.find(*item) : item_owner_.end();
  if (owner == item_owner_.end()) {
    TRAYCTX_LOG_DEBUG("pump: command for stale menu id " + std::to_string(id));
    return;
  }
  emit(event::MenuItemClicked{*item, owner->second});
}

void MessagePump::on_balloon_done(const Token &icon, bool clicked) {
  auto done = tracker_.complete(icon);
  if (!done.completed) {
    TRAYCTX_LOG_DEBUG("pump: balloon callback with nothing in flight on " +
                      icon.to_string());
    return;
  }
  if (clicked)
    emit(event::NotificationClicked{*done.completed, icon});
  else
    emit(event::NotificationDismissed{*done.completed, icon});
  registry_.release(*done.completed);

  if (done.next)
    display(std::move(*done.next));
}

void MessagePump::restore_icons() {
  TRAYCTX_LOG_INFO("pump: taskbar re-created, restoring " +
                   std::to_string(icons_.size()) + " icon(s)");
  std::vector<Token> interrupted;
  for (auto &kv : icons_) {
    TrayIcon &icon = kv.second;
    icon.added = false;
    try {
      show_icon(icon);
    } catch (const Error &e) {
      report("restore-icon", e);
    }
    if (tracker_.in_flight(icon.token))
      interrupted.push_back(icon.token);
  }
  // Balloons vanish with the old taskbar and never call back.
  for (const Token &icon : interrupted)
    on_balloon_done(icon, false);
}

void MessagePump::install_icon(Area area) {
  const Token token = area.id();
  if (icons_.count(token))
    throw Error(ErrorCode::Config, "icon " + token.to_string() +
                                       " is already in the notification area");

  std::unique_ptr<Menu> menu = area.take_menu();
  if (menu)
    menu->validate();
  if (area.image_id())
    image_handle(area.image_id());

  TrayIcon fresh;
  fresh.token = token;
  fresh.id = registry_.bind(token);
  fresh.image = area.image_id();
  fresh.tooltip = area.tooltip_text();
  fresh.menu = std::move(menu);
  TrayIcon &icon = icons_.emplace(token, std::move(fresh)).first->second;

  try {
    if (icon.menu) {
      for (const Token &item : icon.menu->tokens()) {
        registry_.bind(item);
        item_owner_[item] = token;
      }
      icon.menu_handle = build_menu(*icon.menu);
    }
    show_icon(icon);
  } catch (const Error &) {
    try {
      remove_icon(token);
    } catch (const Error &cleanup) {
      TRAYCTX_LOG_WARN(std::string("pump: rollback of ") + token.to_string() +
                       " incomplete: " + cleanup.what());
    }
    throw;
  }
  TRAYCTX_LOG_INFO("pump: icon " + token.to_string() + " added as id " +
                   std::to_string(icon.id));
}

void MessagePump::show_icon(TrayIcon &icon) {
  shell_->add_tray_icon(window_, icon.id);
  icon.added = true;
  shell_->set_tray_image(window_, icon.id, image_handle(icon.image));
  if (!icon.tooltip.empty())
    shell_->set_tray_tooltip(window_, icon.id, icon.tooltip);
}

void MessagePump::remove_icon(const Token &token) {
  auto it = icons_.find(token);
  if (it == icons_.end())
    throw Error(ErrorCode::UnknownToken, "no icon " + token.to_string());
  TrayIcon icon = std::move(it->second);
  icons_.erase(it);

  std::optional<Error> failure;
  auto attempt = [&](auto &&fn) {
    try {
      fn();
    } catch (const Error &e) {
      if (!failure)
        failure = e;
    }
  };
  if (icon.menu_handle)
    attempt([&] { shell_->destroy_menu(icon.menu_handle); });
  if (icon.added)
    attempt([&] { shell_->delete_tray_icon(window_, icon.id); });
  release_tokens(icon);

  TRAYCTX_LOG_INFO("pump: icon " + token.to_string() + " removed");
  if (failure)
    throw *failure;
}

void MessagePump::release_tokens(TrayIcon &icon) {
  if (icon.menu) {
    for (const Token &item : icon.menu->tokens()) {
      item_owner_.erase(item);
      registry_.release(item);
    }
  }
  for (const Token &n : tracker_.forget(icon.token)) {
    TRAYCTX_LOG_DEBUG("pump: dropping notification " + n.to_string() +
                      " of removed icon");
    registry_.release(n);
  }
  registry_.release(icon.token);
}

native_handle MessagePump::build_menu(const Menu &menu) {
  native_handle handle = shell_->create_popup_menu();
  try {
    for (const auto &node : menu.nodes()) {
      if (const auto *e = std::get_if<MenuEntry>(&node)) {
        shell_->append_menu_entry(handle, native_of(e->token), e->label,
                                  e->state, menu.is_default(e->token));
      } else if (std::holds_alternative<MenuSeparator>(node)) {
        shell_->append_menu_separator(handle);
      } else if (const auto *s = std::get_if<MenuSubmenu>(&node)) {
        native_handle sub = build_menu(*s->menu);
        try {
          shell_->append_submenu(handle, native_of(s->token), s->label, sub);
        } catch (const Error &) {
          shell_->destroy_menu(sub);
          throw;
        }
      }
    }
  } catch (const Error &) {
    shell_->destroy_menu(handle);
    throw;
  }
  return handle;
}

void MessagePump::display(NotificationRequest req) {
  for (;;) {
    auto it = icons_.find(req.icon);
    try {
      if (it == icons_.end())
        throw Error(ErrorCode::UnknownToken, "no icon " + req.icon.to_string());
      shell_->show_balloon(window_, it->second.id, req.content);
      TRAYCTX_LOG_DEBUG("pump: notification " + req.token.to_string() +
                        " shown on " + req.icon.to_string());
      emit(event::NotificationShown{req.token, req.icon});
      return;
    } catch (const Error &e) {
      report("show-notification", e);
    }
    registry_.release(req.token);
    auto done = tracker_.complete(req.icon);
    if (!done.next)
      return;
    req = std::move(*done.next);
  }
}

MessagePump::TrayIcon &MessagePump::icon_for(const Token &token) {
  auto it = icons_.find(token);
  if (it == icons_.end())
    throw Error(ErrorCode::UnknownToken, "no icon " + token.to_string());
  return it->second;
}

native_id MessagePump::native_of(const Token &token) const {
  auto id = registry_.resolve_native(token);
  if (!id)
    throw Error(ErrorCode::UnknownToken, token.to_string() + " is not bound");
  return *id;
}

native_handle MessagePump::image_handle(const std::optional<ImageId> &image) {
  if (image) {
    if (image->index >= images_.size())
      throw Error(ErrorCode::UnknownToken,
                  "no image " + std::to_string(image->index));
    return images_[image->index];
  }
  if (!stock_image_)
    stock_image_ = shell_->stock_icon_image();
  return stock_image_;
}

void MessagePump::emit(Event e) {
  const char *name = event_name(e);
  if (events_->push(std::move(e)))
    TRAYCTX_LOG_TRACE(std::string("pump: event ") + name);
  else
    TRAYCTX_LOG_DEBUG(std::string("pump: nobody listening for ") + name);
}

void MessagePump::report(const std::string &context, const Error &e) {
  TRAYCTX_LOG_WARN("pump: " + context + " failed: " + error_code_str(e.code()) +
                   " " + e.what());
  emit(event::OperationFailed{context, e.code(), e.what()});
}

// Commands

void MessagePump::handle(command::AddIcon &c) { install_icon(std::move(c.area)); }

void MessagePump::handle(command::SetIconImage &c) {
  TrayIcon &icon = icon_for(c.icon);
  shell_->set_tray_image(window_, icon.id, image_handle(c.image));
  icon.image = c.image;
}

void MessagePump::handle(command::SetTooltip &c) {
  TrayIcon &icon = icon_for(c.icon);
  shell_->set_tray_tooltip(window_, icon.id, c.tooltip);
  icon.tooltip = c.tooltip;
}

void MessagePump::handle(command::RemoveIcon &c) { remove_icon(c.icon); }

void MessagePump::handle(command::ModifyMenuItem &c) {
  auto owner = item_owner_.find(c.item);
  if (owner == item_owner_.end())
    throw Error(ErrorCode::UnknownToken, "no menu item " + c.item.to_string());
  TrayIcon &icon = icon_for(owner->second);
  MenuEntry *entry = icon.menu ? icon.menu->find_entry(c.item) : nullptr;
  if (!entry)
    throw Error(ErrorCode::UnknownToken,
                c.item.to_string() + " is a submenu, not an entry");
  if (c.change.empty())
    return;

  shell_->modify_menu_item(icon.menu_handle, native_of(c.item), c.change);
  if (c.change.label)
    entry->label = *c.change.label;
  if (c.change.checked)
    entry->state.checked = c.change.checked;
  if (c.change.enabled)
    entry->state.enabled = c.change.enabled;
  if (c.change.highlight)
    entry->state.highlight = c.change.highlight;
}

void MessagePump::handle(command::ShowNotification &c) {
  NotificationRequest &req = c.request;
  icon_for(req.icon);
  registry_.bind(req.token);
  if (auto now = tracker_.enqueue(req)) {
    display(std::move(*now));
  } else {
    TRAYCTX_LOG_DEBUG("pump: notification " + req.token.to_string() +
                      " queued, " + std::to_string(tracker_.pending(req.icon)) +
                      " waiting on " + req.icon.to_string());
  }
}

void MessagePump::handle(command::WriteClipboard &c) {
  shell_->write_clipboard(window_, c.data);
}

void MessagePump::handle(command::ReadClipboard &c) {
  try {
    c.reply->set_value(shell_->read_clipboard(window_));
  } catch (const Error &) {
    c.reply->set_exception(std::current_exception());
    throw;
  }
}

void MessagePump::handle(command::SendCopyData &c) {
  shell_->send_copy_data(window_, c.target, c.data_type, c.bytes);
}

void MessagePump::handle(command::Shutdown &) {
  begin_shutdown("shutdown requested");
}

} // namespace trayctx
