#include "trayctx/messages.hpp"

namespace trayctx {

namespace {

struct CommandName {
  const char *operator()(const command::AddIcon &) const { return "add-icon"; }
  const char *operator()(const command::SetIconImage &) const {
    return "set-icon-image";
  }
  const char *operator()(const command::SetTooltip &) const {
    return "set-tooltip";
  }
  const char *operator()(const command::RemoveIcon &) const {
    return "remove-icon";
  }
  const char *operator()(const command::ModifyMenuItem &) const {
    return "modify-menu-item";
  }
  const char *operator()(const command::ShowNotification &) const {
    return "show-notification";
  }
  const char *operator()(const command::WriteClipboard &) const {
    return "write-clipboard";
  }
  const char *operator()(const command::ReadClipboard &) const {
    return "read-clipboard";
  }
  const char *operator()(const command::SendCopyData &) const {
    return "send-copy-data";
  }
  const char *operator()(const command::Shutdown &) const { return "shutdown"; }
};

struct EventName {
  const char *operator()(const event::MenuItemClicked &) const {
    return "menu-item-clicked";
  }
  const char *operator()(const event::IconClicked &) const {
    return "icon-clicked";
  }
  const char *operator()(const event::NotificationShown &) const {
    return "notification-shown";
  }
  const char *operator()(const event::NotificationClicked &) const {
    return "notification-clicked";
  }
  const char *operator()(const event::NotificationDismissed &) const {
    return "notification-dismissed";
  }
  const char *operator()(const event::ClipboardChanged &) const {
    return "clipboard-changed";
  }
  const char *operator()(const event::CopyDataReceived &) const {
    return "copy-data-received";
  }
  const char *operator()(const event::OperationFailed &) const {
    return "operation-failed";
  }
  const char *operator()(const event::ShutdownComplete &) const {
    return "shutdown-complete";
  }
};

} // namespace

const char *command_name(const Command &c) {
  return std::visit(CommandName{}, c);
}

const char *event_name(const Event &e) { return std::visit(EventName{}, e); }

bool is_terminal(const Event &e) {
  return std::holds_alternative<event::ShutdownComplete>(e);
}

} // namespace trayctx
