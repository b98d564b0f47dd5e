#include "trayctx/menu.hpp"
#include "trayctx/error.hpp"
#include "trayctx/id_registry.hpp"

namespace trayctx {

Menu::Menu() = default;

Menu::Menu(IdRegistry *registry) : registry_(registry) {}

Menu::Menu(IdRegistry *registry, Token token)
    : registry_(registry), token_(token) {}

Menu::~Menu() = default;
Menu::Menu(Menu &&) noexcept = default;
Menu &Menu::operator=(Menu &&) noexcept = default;

Token Menu::mint() {
  if (registry_)
    return registry_->allocate(IdSpace::MenuItem).first;
  return Token::mint(IdSpace::MenuItem);
}

Token Menu::push_entry(std::string label, MenuItemState initial) {
  Token token = mint();
  nodes_.push_back(MenuEntry{token, std::move(label), std::move(initial)});
  return token;
}

void Menu::push_separator() { nodes_.push_back(MenuSeparator{}); }

Menu &Menu::push_submenu(std::string label) {
  Token token = mint();
  std::unique_ptr<Menu> sub(new Menu(registry_, token));
  Menu &ref = *sub;
  nodes_.push_back(MenuSubmenu{token, std::move(label), std::move(sub)});
  return ref;
}

Menu *Menu::level_of(const Token &item) {
  for (auto &node : nodes_) {
    if (auto *e = std::get_if<MenuEntry>(&node)) {
      if (e->token == item)
        return this;
    } else if (auto *s = std::get_if<MenuSubmenu>(&node)) {
      if (Menu *m = s->menu->level_of(item))
        return m;
    }
  }
  return nullptr;
}

void Menu::set_default(const Token &item) {
  Menu *level = level_of(item);
  if (!level) {
    bad_defaults_.push_back(item);
    return;
  }
  level->default_ = item;
}

bool Menu::is_default(const Token &item) const {
  return default_ && *default_ == item;
}

std::vector<Token> Menu::tokens() const {
  std::vector<Token> out;
  for (const auto &node : nodes_) {
    if (const auto *e = std::get_if<MenuEntry>(&node)) {
      out.push_back(e->token);
    } else if (const auto *s = std::get_if<MenuSubmenu>(&node)) {
      out.push_back(s->token);
      auto sub = s->menu->tokens();
      out.insert(out.end(), sub.begin(), sub.end());
    }
  }
  return out;
}

const MenuEntry *Menu::find_entry(const Token &item) const {
  for (const auto &node : nodes_) {
    if (const auto *e = std::get_if<MenuEntry>(&node)) {
      if (e->token == item)
        return e;
    } else if (const auto *s = std::get_if<MenuSubmenu>(&node)) {
      if (const MenuEntry *found = s->menu->find_entry(item))
        return found;
    }
  }
  return nullptr;
}

MenuEntry *Menu::find_entry(const Token &item) {
  return const_cast<MenuEntry *>(
      static_cast<const Menu *>(this)->find_entry(item));
}

void Menu::validate() const {
  if (!bad_defaults_.empty())
    throw Error(ErrorCode::Config,
                "default item " + bad_defaults_.front().to_string() +
                    " is not an entry of this menu");
  for (const auto &node : nodes_) {
    if (const auto *s = std::get_if<MenuSubmenu>(&node))
      s->menu->validate();
  }
}

} // namespace trayctx
