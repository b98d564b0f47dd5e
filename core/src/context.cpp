#include "trayctx/context.hpp"
#include "trayctx/logger.hpp"

namespace trayctx {

Context::Context(std::unique_ptr<MessagePump> pump, Sender sender,
                 EventReceiver events)
    : pump_(std::move(pump)), sender_(std::move(sender)),
      events_(std::move(events)) {}

Context::~Context() {
  if (pump_)
    close();
}

void Context::close() {
  sender_.shutdown();
  pump_->join();
}

WindowBuilder::WindowBuilder(std::string class_name)
    : class_name_(std::move(class_name)),
      registry_(std::make_unique<IdRegistry>()) {}

WindowBuilder &WindowBuilder::window_name(std::string name) {
  window_name_ = std::move(name);
  return *this;
}

WindowBuilder &WindowBuilder::clipboard_events(bool enabled) {
  clipboard_events_ = enabled;
  return *this;
}

WindowBuilder &WindowBuilder::options(const ContextOptions &opts) {
  options_ = opts;
  registry_->set_limit(IdSpace::MenuItem, opts.max_menu_items);
  registry_->set_limit(IdSpace::Icon, opts.max_icons);
  registry_->set_limit(IdSpace::Notification, opts.max_notifications);
  return *this;
}

ImageId WindowBuilder::insert_image(IconBuffer buffer) {
  images_.push_back(std::move(buffer));
  return ImageId{static_cast<std::uint32_t>(images_.size() - 1)};
}

Area &WindowBuilder::new_area() {
  areas_.emplace_back(registry_.get());
  return areas_.back();
}

void WindowBuilder::validate() const {
  if (class_name_.empty())
    throw Error(ErrorCode::Config, "window class name is empty");
  if (class_name_.size() > MAX_CLASS_NAME)
    throw Error(ErrorCode::Config, "window class name longer than " +
                                       std::to_string(MAX_CLASS_NAME));
  if (options_.event_capacity == 0)
    throw Error(ErrorCode::Config, "event capacity must be at least 1");

  for (std::size_t i = 0; i < images_.size(); i++) {
    if (images_[i].bytes.empty())
      throw Error(ErrorCode::Config, "image " + std::to_string(i) + " is empty");
  }
  for (const Area &area : areas_) {
    if (area.image_id() && area.image_id()->index >= images_.size())
      throw Error(ErrorCode::Config,
                  area.id().to_string() + " uses unknown image " +
                      std::to_string(area.image_id()->index));
    if (area.menu())
      area.menu()->validate();
  }
}

Context WindowBuilder::build(IShell *shell) {
  if (built_)
    throw Error(ErrorCode::Config, "builder was already used");
  if (!shell)
    throw Error(ErrorCode::Config, "no shell given");
  validate();
  built_ = true;

  PumpConfig config;
  config.class_name = class_name_;
  config.window_name = window_name_;
  config.clipboard_events = clipboard_events_;
  config.images = std::move(images_);
  for (Area &area : areas_)
    config.areas.push_back(std::move(area));
  areas_.clear();

  auto inbox = std::make_shared<CommandChannel>();
  auto events = std::make_shared<EventChannel>(
      options_.event_capacity, [](const Event &e) { return !is_terminal(e); });

  auto pump = std::make_unique<MessagePump>(shell, std::move(config),
                                            std::move(*registry_), inbox,
                                            events);
  pump->start();
  TRAYCTX_LOG_INFO("context: '" + class_name_ + "' started");

  Sender sender(inbox, shell, pump->window());
  EventReceiver receiver(events);
  return Context(std::move(pump), std::move(sender), std::move(receiver));
}

} // namespace trayctx
