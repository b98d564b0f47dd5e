#pragma once
#include "token.hpp"
#include "types.hpp"
#include <array>
#include <map>
#include <optional>
#include <set>
#include <utility>

namespace trayctx {

// WM_COMMAND carries the menu item id in LOWORD(wParam).
inline constexpr native_id MAX_MENU_ITEM_ID = 0xFFFF;
inline constexpr native_id MAX_ICON_ID = 0xFFFF;
inline constexpr native_id MAX_NOTIFICATION_ID = 0xFFFFFFFE;

// Bidirectional Token <-> native id index, one table per id-space. Ids start
// at 1 and the smallest free id is always handed out next.
//
// Not synchronized: the builder fills it before the pump starts, after that
// only the pump thread touches it.
class IdRegistry {
public:
  IdRegistry();

  std::pair<Token, native_id> allocate(IdSpace space);
  // Assigns an id to a token minted elsewhere. Binding twice returns the
  // id already held.
  native_id bind(const Token &token);
  // Unknown tokens are ignored.
  void release(const Token &token);

  std::optional<native_id> resolve_native(const Token &token) const;
  std::optional<Token> resolve_token(IdSpace space, native_id id) const;

  std::size_t live(IdSpace space) const;
  void set_limit(IdSpace space, native_id max_id);
  native_id limit(IdSpace space) const;

private:
  struct Table {
    std::map<Token, native_id> by_token;
    std::map<native_id, Token> by_native;
    // Released ids below next; the smallest one is reused first.
    std::set<native_id> free;
    native_id next = 1;
    native_id max_id = 0;
  };

  Table &table(IdSpace space);
  const Table &table(IdSpace space) const;

  std::array<Table, ID_SPACE_COUNT> tables_;
};

} // namespace trayctx
