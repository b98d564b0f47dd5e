#include "doctest/doctest.h"
#include "trayctx/context.hpp"
#include "trayctx/fake_shell.hpp"
#include <algorithm>
#include <chrono>
#include <thread>

using namespace trayctx;

namespace {

template <typename T> T expect_event(EventReceiver &rx) {
  auto ev = rx.recv_for(std::chrono::seconds(5));
  DOCTEST_REQUIRE(ev.has_value());
  DOCTEST_REQUIRE_MESSAGE(std::holds_alternative<T>(*ev),
                          "unexpected event " << event_name(*ev));
  return std::get<T>(std::move(*ev));
}

// Commands run in order, so once this read is answered every command sent
// before it has been executed.
void sync(Sender &tx) { tx.read_clipboard().get(); }

// Native messages and commands travel on different queues, so effects of an
// injected message are polled for.
template <typename Pred> bool eventually(Pred pred) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (!pred()) {
    if (std::chrono::steady_clock::now() > deadline)
      return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return true;
}

std::ptrdiff_t call_index(const std::vector<std::string> &calls,
                          const std::string &call) {
  auto it = std::find(calls.begin(), calls.end(), call);
  return it == calls.end() ? -1 : std::distance(calls.begin(), it);
}

} // namespace

DOCTEST_TEST_CASE("Menu clicks are reported and shutdown completes once") {
  FakeShell shell;
  WindowBuilder builder("trayctx.Test");
  builder.clipboard_events(true);
  Area &area = builder.new_area();
  area.tooltip("Demo");
  Menu &menu = area.popup_menu();
  Token open = menu.push_entry("Open");
  Token quit = menu.push_entry("Quit");
  const Token icon = area.id();

  Context ctx = builder.build(&shell);
  EventReceiver rx = ctx.events();
  Sender tx = ctx.sender();
  DOCTEST_REQUIRE(ctx.state() == PumpState::Running);
  DOCTEST_REQUIRE(shell.window_alive());
  DOCTEST_REQUIRE(shell.clipboard_listening());

  auto icons = shell.tray_icons();
  DOCTEST_REQUIRE_EQ(icons.size(), 1u);
  DOCTEST_REQUIRE_EQ(icons.at(1).tooltip, "Demo");
  DOCTEST_REQUIRE(shell.has_call("append_menu_entry:1:Open"));
  DOCTEST_REQUIRE(shell.has_call("append_menu_entry:2:Quit"));

  shell.click_menu_item(1);
  auto clicked = expect_event<event::MenuItemClicked>(rx);
  DOCTEST_REQUIRE(clicked.item == open);
  DOCTEST_REQUIRE(clicked.icon == icon);

  shell.click_menu_item(2);
  clicked = expect_event<event::MenuItemClicked>(rx);
  DOCTEST_REQUIRE(clicked.item == quit);

  tx.shutdown();
  expect_event<event::ShutdownComplete>(rx);
  DOCTEST_REQUIRE(!rx.recv_for(std::chrono::milliseconds(50)));

  ctx.close();
  DOCTEST_REQUIRE(ctx.state() == PumpState::Stopped);
  DOCTEST_REQUIRE(!shell.window_alive());
  DOCTEST_REQUIRE(!shell.clipboard_listening());
  DOCTEST_REQUIRE(shell.tray_icons().empty());
  DOCTEST_REQUIRE_EQ(shell.live_menus(), 0u);

  // Menus go first, the window last.
  auto calls = shell.get_calls();
  auto menu_at = call_index(calls, "destroy_menu");
  auto icon_at = call_index(calls, "delete_tray_icon:1");
  auto listener_at = call_index(calls, "remove_clipboard_listener");
  auto window_at = call_index(calls, "destroy_window");
  DOCTEST_REQUIRE(menu_at >= 0);
  DOCTEST_REQUIRE(menu_at < icon_at);
  DOCTEST_REQUIRE(icon_at < listener_at);
  DOCTEST_REQUIRE(listener_at < window_at);
}

DOCTEST_TEST_CASE("Shutdown is idempotent and later commands are dropped") {
  FakeShell shell;
  WindowBuilder builder("trayctx.Test");
  const Token icon = builder.new_area().id();

  Context ctx = builder.build(&shell);
  EventReceiver rx = ctx.events();
  Sender tx = ctx.sender();

  tx.shutdown();
  tx.shutdown();
  expect_event<event::ShutdownComplete>(rx);
  ctx.close();
  DOCTEST_REQUIRE(!rx.recv());
  DOCTEST_REQUIRE(tx.closed());

  shell.clear_calls();
  tx.set_tooltip(icon, "late");
  tx.shutdown();
  auto reply = tx.read_clipboard();
  DOCTEST_REQUIRE_THROWS_AS(reply.get(), Error);
  DOCTEST_REQUIRE(shell.get_calls().empty());
}

DOCTEST_TEST_CASE("Dropping the context shuts the pump down") {
  FakeShell shell;
  std::optional<EventReceiver> rx;
  {
    WindowBuilder builder("trayctx.Test");
    builder.new_area();
    Context ctx = builder.build(&shell);
    rx = ctx.events();
  }
  DOCTEST_REQUIRE(!shell.window_alive());
  expect_event<event::ShutdownComplete>(*rx);
}

DOCTEST_TEST_CASE("Notifications on one icon are shown one at a time") {
  FakeShell shell;
  WindowBuilder builder("trayctx.Test");
  const Token icon = builder.new_area().id();
  Context ctx = builder.build(&shell);
  EventReceiver rx = ctx.events();
  Sender tx = ctx.sender();

  Token first = tx.show_notification(icon, {"A", "first"});
  Token second = tx.show_notification(icon, {"B", "second"});
  DOCTEST_REQUIRE(first != second);

  auto shown = expect_event<event::NotificationShown>(rx);
  DOCTEST_REQUIRE(shown.notification == first);
  DOCTEST_REQUIRE(shown.icon == icon);
  sync(tx);
  DOCTEST_REQUIRE_EQ(shell.balloons().size(), 1u);

  shell.icon_action(1, IconAction::BalloonClicked);
  auto clicked = expect_event<event::NotificationClicked>(rx);
  DOCTEST_REQUIRE(clicked.notification == first);

  shown = expect_event<event::NotificationShown>(rx);
  DOCTEST_REQUIRE(shown.notification == second);
  auto balloons = shell.balloons();
  DOCTEST_REQUIRE_EQ(balloons.size(), 2u);
  DOCTEST_REQUIRE_EQ(balloons[1].title, "B");
  DOCTEST_REQUIRE_EQ(balloons[1].message, "second");

  shell.icon_action(1, IconAction::BalloonTimeout);
  auto dismissed = expect_event<event::NotificationDismissed>(rx);
  DOCTEST_REQUIRE(dismissed.notification == second);

  // Nothing left in flight: a late callback is stale.
  shell.icon_action(1, IconAction::BalloonTimeout);
  shell.icon_action(1, IconAction::LeftClick);
  expect_event<event::IconClicked>(rx);
}

DOCTEST_TEST_CASE("A failed balloon moves on to the next request") {
  FakeShell shell;
  WindowBuilder builder("trayctx.Test");
  const Token icon = builder.new_area().id();
  Context ctx = builder.build(&shell);
  EventReceiver rx = ctx.events();
  Sender tx = ctx.sender();

  shell.fail_on("show_balloon");
  tx.show_notification(icon, {"A", "first"});
  Token second = tx.show_notification(icon, {"B", "second"});

  auto failed = expect_event<event::OperationFailed>(rx);
  DOCTEST_REQUIRE_EQ(failed.context, "show-notification");
  DOCTEST_REQUIRE(failed.code == ErrorCode::Shell);

  auto shown = expect_event<event::NotificationShown>(rx);
  DOCTEST_REQUIRE(shown.notification == second);
}

DOCTEST_TEST_CASE("Balloons can use a stock shell icon") {
  FakeShell shell;
  WindowBuilder builder("trayctx.Test");
  const Token icon = builder.new_area().id();
  Context ctx = builder.build(&shell);
  EventReceiver rx = ctx.events();
  Sender tx = ctx.sender();

  Notification n;
  n.title = "Synced";
  n.message = "All files are up to date";
  n.stock_icon = StockIcon::Folder;
  n.options = NOTIFY_ICON_SELECTED | NOTIFY_ICON_LINK_OVERLAY;
  tx.show_notification(icon, n);
  tx.show_notification(icon, {"Plain", "no stock icon"});

  expect_event<event::NotificationShown>(rx);
  sync(tx);
  auto balloons = shell.balloons();
  DOCTEST_REQUIRE_EQ(balloons.size(), 1u);
  DOCTEST_REQUIRE(balloons[0].stock_icon == StockIcon::Folder);
  DOCTEST_REQUIRE((balloons[0].options & NOTIFY_ICON_SELECTED) != 0);
  DOCTEST_REQUIRE((balloons[0].options & NOTIFY_ICON_LINK_OVERLAY) != 0);
  DOCTEST_REQUIRE(shell.has_call("show_balloon:1:Synced:stock=folder"));

  shell.icon_action(1, IconAction::BalloonTimeout);
  expect_event<event::NotificationDismissed>(rx);
  expect_event<event::NotificationShown>(rx);
  balloons = shell.balloons();
  DOCTEST_REQUIRE_EQ(balloons.size(), 2u);
  DOCTEST_REQUIRE(!balloons[1].stock_icon);
  DOCTEST_REQUIRE(shell.has_call("show_balloon:1:Plain"));
}

DOCTEST_TEST_CASE("Tooltip updates are applied in order") {
  FakeShell shell;
  WindowBuilder builder("trayctx.Test");
  const Token icon = builder.new_area().id();
  Context ctx = builder.build(&shell);
  Sender tx = ctx.sender();

  tx.set_tooltip(icon, "A");
  tx.set_tooltip(icon, "B");
  sync(tx);
  DOCTEST_REQUIRE_EQ(shell.tray_icons().at(1).tooltip, "B");
  auto calls = shell.get_calls();
  DOCTEST_REQUIRE(call_index(calls, "set_tray_tooltip:1=A") <
                  call_index(calls, "set_tray_tooltip:1=B"));

  tx.clear_tooltip(icon);
  sync(tx);
  DOCTEST_REQUIRE_EQ(shell.tray_icons().at(1).tooltip, "");
}

DOCTEST_TEST_CASE("Commands for a removed icon fail and the loop continues") {
  FakeShell shell;
  WindowBuilder builder("trayctx.Test");
  Area &area = builder.new_area();
  area.popup_menu().push_entry("Item");
  const Token icon = area.id();
  Context ctx = builder.build(&shell);
  EventReceiver rx = ctx.events();
  Sender tx = ctx.sender();

  tx.remove_icon(icon);
  tx.set_tooltip(icon, "gone");
  auto failed = expect_event<event::OperationFailed>(rx);
  DOCTEST_REQUIRE_EQ(failed.context, "set-tooltip");
  DOCTEST_REQUIRE(failed.code == ErrorCode::UnknownToken);
  DOCTEST_REQUIRE(shell.tray_icons().empty());
  DOCTEST_REQUIRE_EQ(shell.live_menus(), 0u);

  tx.remove_icon(icon);
  failed = expect_event<event::OperationFailed>(rx);
  DOCTEST_REQUIRE_EQ(failed.context, "remove-icon");

  // The freed native id is handed to the next icon.
  Area extra;
  extra.tooltip("second");
  Token second = tx.add_icon(std::move(extra));
  sync(tx);
  DOCTEST_REQUIRE_EQ(shell.tray_icons().at(1).tooltip, "second");

  shell.icon_action(1, IconAction::LeftClick);
  auto clicked = expect_event<event::IconClicked>(rx);
  DOCTEST_REQUIRE(clicked.icon == second);
}

DOCTEST_TEST_CASE("Removing an icon drops its pending notifications") {
  FakeShell shell;
  WindowBuilder builder("trayctx.Test");
  const Token icon = builder.new_area().id();
  Context ctx = builder.build(&shell);
  EventReceiver rx = ctx.events();
  Sender tx = ctx.sender();

  Token first = tx.show_notification(icon, {"A", "first"});
  tx.show_notification(icon, {"B", "second"});
  auto shown = expect_event<event::NotificationShown>(rx);
  DOCTEST_REQUIRE(shown.notification == first);

  tx.remove_icon(icon);
  sync(tx);
  shell.icon_action(1, IconAction::BalloonClicked);
  NativeMessage update;
  update.kind = NativeMessageKind::ClipboardUpdate;
  shell.inject(update);
  expect_event<event::ClipboardChanged>(rx);
  DOCTEST_REQUIRE_EQ(shell.balloons().size(), 1u);
}

DOCTEST_TEST_CASE("Icons added at runtime bring their menu") {
  FakeShell shell;
  WindowBuilder builder("trayctx.Test");
  builder.new_area();
  Context ctx = builder.build(&shell);
  EventReceiver rx = ctx.events();
  Sender tx = ctx.sender();

  Area extra;
  Menu &menu = extra.popup_menu();
  Token hello = menu.push_entry("Hello");
  menu.set_default(hello);
  Token icon = tx.add_icon(std::move(extra));
  sync(tx);
  DOCTEST_REQUIRE_EQ(shell.tray_icons().size(), 2u);

  shell.click_menu_item(1);
  auto clicked = expect_event<event::MenuItemClicked>(rx);
  DOCTEST_REQUIRE(clicked.item == hello);
  DOCTEST_REQUIRE(clicked.icon == icon);

  shell.icon_action(2, IconAction::DoubleClick);
  clicked = expect_event<event::MenuItemClicked>(rx);
  DOCTEST_REQUIRE(clicked.item == hello);
}

DOCTEST_TEST_CASE("Icon clicks open the popup menu") {
  FakeShell shell;
  WindowBuilder builder("trayctx.Test");
  Area &area = builder.new_area();
  Menu &menu = area.popup_menu();
  Token open = menu.push_entry("Open");
  menu.set_default(open);
  const Token icon = area.id();
  Context ctx = builder.build(&shell);
  EventReceiver rx = ctx.events();
  Sender tx = ctx.sender();

  shell.icon_action(1, IconAction::LeftClick);
  DOCTEST_REQUIRE(expect_event<event::IconClicked>(rx).icon == icon);

  shell.icon_action(1, IconAction::RightClick);
  DOCTEST_REQUIRE(eventually([&] { return shell.has_call("track_popup_menu"); }));

  shell.icon_action(1, IconAction::DoubleClick);
  auto clicked = expect_event<event::MenuItemClicked>(rx);
  DOCTEST_REQUIRE(clicked.item == open);

  shell.fail_on("track_popup_menu");
  shell.icon_action(1, IconAction::RightClick);
  auto failed = expect_event<event::OperationFailed>(rx);
  DOCTEST_REQUIRE_EQ(failed.context, "track-popup-menu");
}

DOCTEST_TEST_CASE("Stale native ids are ignored") {
  FakeShell shell;
  WindowBuilder builder("trayctx.Test");
  builder.new_area().popup_menu().push_entry("Only");
  Context ctx = builder.build(&shell);
  EventReceiver rx = ctx.events();
  Sender tx = ctx.sender();

  shell.click_menu_item(99);
  shell.icon_action(42, IconAction::LeftClick);
  shell.icon_action(1, IconAction::BalloonClicked);
  // Same queue as the stale ones, so this is the first event if they were
  // ignored.
  shell.click_menu_item(1);
  expect_event<event::MenuItemClicked>(rx);
  DOCTEST_REQUIRE(ctx.state() == PumpState::Running);
  tx.shutdown();
  expect_event<event::ShutdownComplete>(rx);
}

DOCTEST_TEST_CASE("Menu items can be modified") {
  FakeShell shell;
  WindowBuilder builder("trayctx.Test");
  Menu &menu = builder.new_area().popup_menu();
  Token open = menu.push_entry("Open");
  Menu &sub = menu.push_submenu("More");
  Token nested = sub.push_entry("Nested");
  Context ctx = builder.build(&shell);
  EventReceiver rx = ctx.events();
  Sender tx = ctx.sender();

  MenuItemState change;
  change.label = "Opened";
  change.checked = true;
  change.enabled = false;
  tx.modify_menu_item(open, change);
  tx.modify_menu_item(nested, {std::nullopt, true});
  sync(tx);

  auto handles = shell.menu_handles();
  DOCTEST_REQUIRE_EQ(handles.size(), 2u);
  auto root = shell.menu_items(handles[0]);
  DOCTEST_REQUIRE_EQ(root.size(), 2u);
  DOCTEST_REQUIRE_EQ(root[0].label, "Opened");
  DOCTEST_REQUIRE(root[0].checked);
  DOCTEST_REQUIRE(!root[0].enabled);
  DOCTEST_REQUIRE(root[1].kind == FakeMenuItem::Kind::Submenu);
  auto inner = shell.menu_items(root[1].submenu);
  DOCTEST_REQUIRE(inner[0].checked);

  tx.modify_menu_item(Token::mint(IdSpace::MenuItem), change);
  auto failed = expect_event<event::OperationFailed>(rx);
  DOCTEST_REQUIRE(failed.code == ErrorCode::UnknownToken);
  tx.modify_menu_item(*sub.token(), change);
  failed = expect_event<event::OperationFailed>(rx);
  DOCTEST_REQUIRE_EQ(failed.context, "modify-menu-item");
}

DOCTEST_TEST_CASE("Taskbar re-creation restores icons") {
  FakeShell shell;
  WindowBuilder builder("trayctx.Test");
  Area &area = builder.new_area();
  area.tooltip("Survivor");
  const Token icon = area.id();
  Context ctx = builder.build(&shell);
  EventReceiver rx = ctx.events();
  Sender tx = ctx.sender();

  Token pending = tx.show_notification(icon, {"A", "in flight"});
  expect_event<event::NotificationShown>(rx);

  shell.restart_taskbar();
  // The balloon vanished with the old taskbar.
  auto dismissed = expect_event<event::NotificationDismissed>(rx);
  DOCTEST_REQUIRE(dismissed.notification == pending);

  sync(tx);
  auto icons = shell.tray_icons();
  DOCTEST_REQUIRE_EQ(icons.size(), 1u);
  DOCTEST_REQUIRE_EQ(icons.at(1).tooltip, "Survivor");
  DOCTEST_REQUIRE(icons.at(1).image != 0);
}

DOCTEST_TEST_CASE("Copy data travels both ways") {
  FakeShell shell;
  WindowBuilder builder("trayctx.Test");
  Context ctx = builder.build(&shell);
  EventReceiver rx = ctx.events();
  Sender tx = ctx.sender();

  NativeMessage msg;
  msg.kind = NativeMessageKind::CopyData;
  msg.sender = 0x42;
  msg.data_type = 7;
  msg.bytes = {'h', 'i'};
  shell.inject(msg);

  auto got = expect_event<event::CopyDataReceived>(rx);
  DOCTEST_REQUIRE_EQ(got.sender, 0x42u);
  DOCTEST_REQUIRE_EQ(got.data_type, 7u);
  DOCTEST_REQUIRE_EQ(std::string(got.bytes.begin(), got.bytes.end()), "hi");

  tx.send_copy_data({"Other.Class", ""}, 3, {1, 2, 3});
  sync(tx);
  DOCTEST_REQUIRE(shell.has_call("send_copy_data:Other.Class:3:3"));
}

DOCTEST_TEST_CASE("Messages sent from other threads reach the pump") {
  FakeShell shell;
  WindowBuilder builder("trayctx.Test");
  builder.clipboard_events(true);
  Context ctx = builder.build(&shell);
  EventReceiver rx = ctx.events();
  Sender tx = ctx.sender();
  sync(tx);

  // Only a posted message ends the native wait, so a sent one needs the
  // wake the window procedure posts for it.
  std::thread other([&] {
    NativeMessage msg;
    msg.kind = NativeMessageKind::CopyData;
    msg.sender = 0x77;
    msg.data_type = 9;
    msg.bytes = {'o', 'k'};
    shell.send_message(msg);
  });
  other.join();
  auto got = expect_event<event::CopyDataReceived>(rx);
  DOCTEST_REQUIRE_EQ(got.sender, 0x77u);
  DOCTEST_REQUIRE_EQ(std::string(got.bytes.begin(), got.bytes.end()), "ok");

  NativeMessage update;
  update.kind = NativeMessageKind::ClipboardUpdate;
  shell.send_message(update);
  expect_event<event::ClipboardChanged>(rx);

  NativeMessage close;
  close.kind = NativeMessageKind::Close;
  shell.send_message(close);
  expect_event<event::ShutdownComplete>(rx);
  DOCTEST_REQUIRE(shell.has_call("send_message"));
}

DOCTEST_TEST_CASE("Clipboard reads, writes and change notifications") {
  FakeShell shell;
  WindowBuilder builder("trayctx.Test");
  builder.clipboard_events(true);
  Context ctx = builder.build(&shell);
  EventReceiver rx = ctx.events();
  Sender tx = ctx.sender();

  DOCTEST_REQUIRE(!tx.read_clipboard().get());

  shell.set_clipboard(ClipboardData::text("hello"));
  auto data = tx.read_clipboard().get();
  DOCTEST_REQUIRE(data.has_value());
  DOCTEST_REQUIRE(data->format == ClipboardFormat::Text);
  DOCTEST_REQUIRE_EQ(data->as_text(), "hello");

  tx.write_clipboard(ClipboardData::text("world"));
  sync(tx);
  DOCTEST_REQUIRE_EQ(shell.clipboard()->as_text(), "world");

  NativeMessage update;
  update.kind = NativeMessageKind::ClipboardUpdate;
  shell.inject(update);
  expect_event<event::ClipboardChanged>(rx);

  shell.fail_on("read_clipboard");
  auto reply = tx.read_clipboard();
  DOCTEST_REQUIRE_THROWS_AS(reply.get(), Error);
  auto failed = expect_event<event::OperationFailed>(rx);
  DOCTEST_REQUIRE_EQ(failed.context, "read-clipboard");
}

DOCTEST_TEST_CASE("A full event queue never drops ShutdownComplete") {
  FakeShell shell;
  WindowBuilder builder("trayctx.Test");
  ContextOptions opts;
  opts.event_capacity = 2;
  builder.options(opts);
  Context ctx = builder.build(&shell);
  EventReceiver rx = ctx.events();

  NativeMessage update;
  update.kind = NativeMessageKind::ClipboardUpdate;
  for (int i = 0; i < 5; i++)
    shell.inject(update);
  NativeMessage close;
  close.kind = NativeMessageKind::Close;
  shell.inject(close);
  ctx.close();

  std::vector<Event> events;
  while (auto ev = rx.try_recv())
    events.push_back(std::move(*ev));
  DOCTEST_REQUIRE_EQ(events.size(), 2u);
  DOCTEST_REQUIRE(std::holds_alternative<event::ClipboardChanged>(events[0]));
  DOCTEST_REQUIRE(is_terminal(events[1]));
  DOCTEST_REQUIRE_EQ(rx.dropped(), 4u);
}

DOCTEST_TEST_CASE("A failing native wait shuts the pump down") {
  FakeShell shell;
  WindowBuilder builder("trayctx.Test");
  builder.new_area();
  shell.fail_on("wait_message");
  Context ctx = builder.build(&shell);
  EventReceiver rx = ctx.events();

  auto failed = expect_event<event::OperationFailed>(rx);
  DOCTEST_REQUIRE_EQ(failed.context, "wait-message");
  expect_event<event::ShutdownComplete>(rx);
  ctx.close();
  DOCTEST_REQUIRE(!shell.window_alive());
  DOCTEST_REQUIRE(shell.tray_icons().empty());
}
