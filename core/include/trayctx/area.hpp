#pragma once
#include "menu.hpp"
#include "token.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>

namespace trayctx {

class IdRegistry;

// One icon in the notification area with its tooltip and popup menu. Without
// an image the stock application icon is shown.
class Area {
public:
  // Token minted now, native id assigned by the pump when the area is added.
  Area();
  explicit Area(IdRegistry *registry);

  Area(Area &&) noexcept = default;
  Area &operator=(Area &&) noexcept = default;

  Token id() const { return id_; }

  Area &image(ImageId image);
  Area &tooltip(std::string tooltip);
  // Created on first use.
  Menu &popup_menu();

  const std::optional<ImageId> &image_id() const { return image_; }
  const std::string &tooltip_text() const { return tooltip_; }
  const Menu *menu() const { return menu_.get(); }
  Menu *menu() { return menu_.get(); }
  std::unique_ptr<Menu> take_menu() { return std::move(menu_); }

private:
  IdRegistry *registry_ = nullptr;
  Token id_;
  std::optional<ImageId> image_;
  std::string tooltip_;
  std::unique_ptr<Menu> menu_;
};

} // namespace trayctx
