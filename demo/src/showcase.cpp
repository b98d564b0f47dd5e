#ifdef _WIN32
#include "trayctx/autostart.hpp"
#include "trayctx/context.hpp"
#include "trayctx/logger.hpp"
#include "trayctx/named_mutex.hpp"
#include "trayctx/win32_shell.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

using namespace trayctx;

namespace {

constexpr std::uint64_t COPY_DATA_GREETING = 0x7472;

std::optional<IconBuffer> load_icon(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in)
    return std::nullopt;
  IconBuffer buffer;
  buffer.bytes.assign(std::istreambuf_iterator<char>(in),
                      std::istreambuf_iterator<char>());
  buffer.width = 32;
  buffer.height = 32;
  return buffer;
}

} // namespace

int main(int argc, char **argv) {
  std::string class_name = "trayctx.Showcase";
  std::string icon_path;
  bool clipboard = true;

  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) == "--no-clipboard")
      clipboard = false;
    if (std::string(argv[i]) == "--class" && i + 1 < argc) {
      class_name = argv[++i];
    }
    if (std::string(argv[i]) == "--icon" && i + 1 < argc) {
      icon_path = argv[++i];
    }
    if (std::string(argv[i]) == "--log-level" && i + 1 < argc) {
      std::string lvl = argv[++i];
      if (auto level = parse_log_level(lvl))
        Logger::get().set_level(*level);
      else
        std::cerr << "unknown log level '" << lvl << "'" << std::endl;
    }
  }

  Logger::set_thread_name("main");
  Win32Shell shell;

  auto instance = NamedMutex::acquire(&shell, class_name + ".instance");
  if (!instance) {
    TRAYCTX_LOG_WARN("another showcase is already running");
    return 1;
  }

  AutoStart autostart(&shell, "trayctx-showcase", {"--no-clipboard"});

  WindowBuilder builder(class_name);
  builder.window_name("trayctx showcase").clipboard_events(clipboard);

  Area &area = builder.new_area();
  if (!icon_path.empty()) {
    if (auto buffer = load_icon(icon_path))
      area.image(builder.insert_image(std::move(*buffer)));
    else
      TRAYCTX_LOG_WARN("cannot read icon '" + icon_path + "', using stock icon");
  }
  area.tooltip("trayctx showcase");

  bool has_tooltip = true;
  bool is_checked = true;
  bool is_highlighted = false;

  Menu &menu = area.popup_menu();
  Token hello = menu.push_entry("Hello World");
  Token notify = menu.push_entry("Show notification");
  Token notify_many = menu.push_entry("Show multiple notifications");
  Token toggle_tooltip =
      menu.push_entry("Toggle tooltip", {std::nullopt, has_tooltip});
  Token toggle_checked =
      menu.push_entry("Toggle checked", {std::nullopt, is_checked});
  Token toggle_highlight = menu.push_entry(
      "Toggle highlighted", {std::nullopt, is_highlighted, std::nullopt,
                             is_highlighted});
  Menu &tools = menu.push_submenu("Tools");
  Token copy_text = tools.push_entry("Copy greeting to clipboard");
  Token send_self = tools.push_entry("Send copy data to self");
  Token open_temp = tools.push_entry("Open temp directory");
  Token toggle_autostart = tools.push_entry(
      "Start at login", {std::nullopt, autostart.is_installed()});
  menu.push_separator();
  Token quit = menu.push_entry("Quit");
  menu.set_default(hello);

  const Token icon = area.id();

  std::optional<Context> ctx;
  try {
    ctx.emplace(builder.build(&shell));
  } catch (const Error &e) {
    TRAYCTX_LOG_ERROR(std::string("cannot start: ") + error_code_str(e.code()) +
                      " " + e.what());
    return 1;
  }

  Sender sender = ctx->sender();
  EventReceiver events = ctx->events();

  while (auto ev = events.recv()) {
    if (auto *e = std::get_if<event::IconClicked>(&*ev)) {
      TRAYCTX_LOG_INFO("icon clicked: " + e->icon.to_string());
    } else if (auto *e = std::get_if<event::MenuItemClicked>(&*ev)) {
      const Token &item = e->item;
      TRAYCTX_LOG_INFO("menu entry clicked: " + item.to_string());
      if (item == notify) {
        Notification n;
        n.title = "This is a title";
        n.message = "This is a body";
        n.options = NOTIFY_LARGE_ICON;
        sender.show_notification(icon, n);
      } else if (item == notify_many) {
        sender.show_notification(icon, {"", "First"});
        sender.show_notification(icon, {"", "Second"});
      } else if (item == toggle_tooltip) {
        has_tooltip = !has_tooltip;
        if (has_tooltip)
          sender.set_tooltip(icon, "This is a tooltip!");
        else
          sender.clear_tooltip(icon);
        sender.modify_menu_item(item, {std::nullopt, has_tooltip});
      } else if (item == toggle_checked) {
        is_checked = !is_checked;
        sender.modify_menu_item(item, {std::nullopt, is_checked});
      } else if (item == toggle_highlight) {
        is_highlighted = !is_highlighted;
        sender.modify_menu_item(
            item, {std::nullopt, is_highlighted, std::nullopt, is_highlighted});
      } else if (item == copy_text) {
        sender.write_clipboard(ClipboardData::text("Hello from trayctx"));
      } else if (item == send_self) {
        std::string greeting = "hello, me";
        sender.send_copy_data({class_name, ""}, COPY_DATA_GREETING,
                              {greeting.begin(), greeting.end()});
      } else if (item == open_temp) {
        const char *tmp = std::getenv("TEMP");
        if (!tmp || !shell.open_directory(tmp))
          TRAYCTX_LOG_WARN("cannot open temp directory");
      } else if (item == toggle_autostart) {
        try {
          bool installed = autostart.is_installed();
          if (installed)
            autostart.uninstall();
          else
            autostart.install();
          sender.modify_menu_item(item, {std::nullopt, !installed});
        } catch (const Error &err) {
          TRAYCTX_LOG_ERROR(std::string("autostart: ") + err.what());
        }
      } else if (item == quit) {
        sender.shutdown();
      }
    } else if (auto *e = std::get_if<event::NotificationClicked>(&*ev)) {
      TRAYCTX_LOG_INFO("notification clicked: " + e->notification.to_string());
    } else if (auto *e = std::get_if<event::NotificationDismissed>(&*ev)) {
      TRAYCTX_LOG_INFO("notification dismissed: " + e->notification.to_string());
    } else if (std::holds_alternative<event::ClipboardChanged>(*ev)) {
      try {
        auto data = sender.read_clipboard().get();
        if (data && data->format == ClipboardFormat::Text)
          TRAYCTX_LOG_INFO("clipboard text: " + data->as_text());
        else if (data)
          TRAYCTX_LOG_INFO("clipboard bitmap, " +
                           std::to_string(data->bytes.size()) + " bytes");
      } catch (const Error &err) {
        TRAYCTX_LOG_WARN(std::string("clipboard: ") + err.what());
      }
    } else if (auto *e = std::get_if<event::CopyDataReceived>(&*ev)) {
      TRAYCTX_LOG_INFO("copy data " + std::to_string(e->data_type) + ": " +
                       std::string(e->bytes.begin(), e->bytes.end()));
    } else if (auto *e = std::get_if<event::OperationFailed>(&*ev)) {
      TRAYCTX_LOG_WARN(e->context + " failed: " + error_code_str(e->code) +
                       " " + e->message);
    } else if (std::holds_alternative<event::ShutdownComplete>(*ev)) {
      break;
    }
  }

  TRAYCTX_LOG_INFO("showcase exiting");
  return 0;
}
#endif
