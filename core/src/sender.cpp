#include "trayctx/sender.hpp"
#include "trayctx/logger.hpp"

namespace trayctx {

Sender::Sender(std::shared_ptr<CommandChannel> inbox, IShell *shell,
               native_handle window)
    : inbox_(std::move(inbox)), shell_(shell), window_(window) {}

bool Sender::send(Command cmd) {
  const char *name = command_name(cmd);
  if (!inbox_->push(std::move(cmd))) {
    TRAYCTX_LOG_DEBUG(std::string("sender: ") + name +
                      " dropped, pump is gone");
    return false;
  }
  shell_->wake(window_);
  return true;
}

Token Sender::add_icon(Area area) {
  Token token = area.id();
  send(command::AddIcon{std::move(area)});
  return token;
}

void Sender::set_icon_image(const Token &icon, std::optional<ImageId> image) {
  send(command::SetIconImage{icon, image});
}

void Sender::set_tooltip(const Token &icon, std::string tooltip) {
  send(command::SetTooltip{icon, std::move(tooltip)});
}

void Sender::clear_tooltip(const Token &icon) { set_tooltip(icon, {}); }

void Sender::remove_icon(const Token &icon) {
  send(command::RemoveIcon{icon});
}

void Sender::modify_menu_item(const Token &item, MenuItemState change) {
  send(command::ModifyMenuItem{item, std::move(change)});
}

Token Sender::show_notification(const Token &icon, Notification notification) {
  Token token = Token::mint(IdSpace::Notification);
  send(command::ShowNotification{
      NotificationRequest{icon, token, std::move(notification)}});
  return token;
}

void Sender::write_clipboard(ClipboardData data) {
  send(command::WriteClipboard{std::move(data)});
}

std::future<std::optional<ClipboardData>> Sender::read_clipboard() {
  auto reply = std::make_shared<std::promise<std::optional<ClipboardData>>>();
  auto result = reply->get_future();
  if (!send(command::ReadClipboard{reply}))
    reply->set_exception(std::make_exception_ptr(
        Error(ErrorCode::ChannelClosed, "pump is not running")));
  return result;
}

void Sender::send_copy_data(CopyDataTarget target, std::uint64_t data_type,
                            std::vector<std::uint8_t> bytes) {
  send(command::SendCopyData{std::move(target), data_type, std::move(bytes)});
}

void Sender::shutdown() { send(command::Shutdown{}); }

EventReceiver::EventReceiver(std::shared_ptr<EventChannel> channel)
    : guard_(new Guard{std::move(channel)}) {}

std::optional<Event> EventReceiver::recv() { return guard_->channel->pop(); }

std::optional<Event> EventReceiver::try_recv() {
  return guard_->channel->try_pop();
}

std::optional<Event> EventReceiver::recv_for(std::chrono::milliseconds timeout) {
  return guard_->channel->pop_for(timeout);
}

std::size_t EventReceiver::dropped() const {
  return guard_->channel->dropped();
}

} // namespace trayctx
