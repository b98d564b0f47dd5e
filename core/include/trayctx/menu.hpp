#pragma once
#include "token.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace trayctx {

class IdRegistry;
class Menu;

struct MenuEntry {
  Token token;
  std::string label;
  MenuItemState state;
};

struct MenuSeparator {};

struct MenuSubmenu {
  Token token;
  std::string label;
  std::unique_ptr<Menu> menu;
};

using MenuNode = std::variant<MenuEntry, MenuSeparator, MenuSubmenu>;

// One level of a popup menu. Submenus are owned by their parent node, so the
// references returned by push_submenu stay valid while the root lives.
class Menu {
public:
  // Tokens are minted but left unbound; the pump binds them when the menu is
  // attached at runtime.
  Menu();
  // Tokens are bound into `registry` as they are created.
  explicit Menu(IdRegistry *registry);
  ~Menu();

  Menu(Menu &&) noexcept;
  Menu &operator=(Menu &&) noexcept;
  Menu(const Menu &) = delete;
  Menu &operator=(const Menu &) = delete;

  Token push_entry(std::string label, MenuItemState initial = {});
  void push_separator();
  Menu &push_submenu(std::string label);

  // Makes `item` the default entry of the level that contains it, replacing
  // any previous default there. Tokens that are not entries of this tree are
  // reported by validate().
  void set_default(const Token &item);

  std::optional<Token> default_item() const { return default_; }
  bool is_default(const Token &item) const;

  // Set on submenus only.
  std::optional<Token> token() const { return token_; }

  const std::vector<MenuNode> &nodes() const { return nodes_; }
  bool empty() const { return nodes_.empty(); }

  // Entry and submenu tokens, depth-first.
  std::vector<Token> tokens() const;
  const MenuEntry *find_entry(const Token &item) const;
  MenuEntry *find_entry(const Token &item);

  // Throws Error(E_CONFIG).
  void validate() const;

private:
  Menu(IdRegistry *registry, Token token);

  Token mint();
  Menu *level_of(const Token &item);

  IdRegistry *registry_ = nullptr;
  std::optional<Token> token_;
  std::optional<Token> default_;
  std::vector<MenuNode> nodes_;
  std::vector<Token> bad_defaults_;
};

} // namespace trayctx
