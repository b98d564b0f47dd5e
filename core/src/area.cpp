#include "trayctx/area.hpp"
#include "trayctx/id_registry.hpp"

namespace trayctx {

Area::Area() : id_(Token::mint(IdSpace::Icon)) {}

Area::Area(IdRegistry *registry)
    : registry_(registry), id_(registry->allocate(IdSpace::Icon).first) {}

Area &Area::image(ImageId image) {
  image_ = image;
  return *this;
}

Area &Area::tooltip(std::string tooltip) {
  tooltip_ = std::move(tooltip);
  return *this;
}

Menu &Area::popup_menu() {
  if (!menu_)
    menu_ = registry_ ? std::make_unique<Menu>(registry_)
                      : std::make_unique<Menu>();
  return *menu_;
}

} // namespace trayctx
