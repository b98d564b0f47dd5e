#include "trayctx/id_registry.hpp"
#include "trayctx/error.hpp"
#include "trayctx/logger.hpp"

namespace trayctx {

IdRegistry::IdRegistry() {
  table(IdSpace::MenuItem).max_id = MAX_MENU_ITEM_ID;
  table(IdSpace::Icon).max_id = MAX_ICON_ID;
  table(IdSpace::Notification).max_id = MAX_NOTIFICATION_ID;
}

IdRegistry::Table &IdRegistry::table(IdSpace space) {
  return tables_[static_cast<std::size_t>(space)];
}

const IdRegistry::Table &IdRegistry::table(IdSpace space) const {
  return tables_[static_cast<std::size_t>(space)];
}

std::pair<Token, native_id> IdRegistry::allocate(IdSpace space) {
  Token token = Token::mint(space);
  return {token, bind(token)};
}

native_id IdRegistry::bind(const Token &token) {
  if (!token.valid())
    throw Error(ErrorCode::UnknownToken, "cannot bind an empty token");

  Table &t = table(token.space());
  auto it = t.by_token.find(token);
  if (it != t.by_token.end())
    return it->second;

  native_id id = 0;
  if (!t.free.empty() && *t.free.begin() <= t.max_id) {
    id = *t.free.begin();
    t.free.erase(t.free.begin());
  } else if (t.next <= t.max_id) {
    id = t.next++;
  } else {
    throw Error(ErrorCode::IdExhausted,
                std::string("no free ") + id_space_name(token.space()) +
                    " id left (limit " + std::to_string(t.max_id) + ")");
  }

  t.by_token.emplace(token, id);
  t.by_native.emplace(id, token);
  TRAYCTX_LOG_TRACE("registry: bound " + token.to_string() + " -> " +
                    std::to_string(id));
  return id;
}

void IdRegistry::release(const Token &token) {
  Table &t = table(token.space());
  auto it = t.by_token.find(token);
  if (it == t.by_token.end())
    return;
  native_id id = it->second;
  t.by_native.erase(id);
  t.by_token.erase(it);
  t.free.insert(id);
  TRAYCTX_LOG_TRACE("registry: released " + token.to_string());
}

std::optional<native_id> IdRegistry::resolve_native(const Token &token) const {
  const Table &t = table(token.space());
  auto it = t.by_token.find(token);
  if (it == t.by_token.end())
    return std::nullopt;
  return it->second;
}

std::optional<Token> IdRegistry::resolve_token(IdSpace space,
                                               native_id id) const {
  const Table &t = table(space);
  auto it = t.by_native.find(id);
  if (it == t.by_native.end())
    return std::nullopt;
  return it->second;
}

std::size_t IdRegistry::live(IdSpace space) const {
  return table(space).by_token.size();
}

void IdRegistry::set_limit(IdSpace space, native_id max_id) {
  table(space).max_id = max_id;
}

native_id IdRegistry::limit(IdSpace space) const { return table(space).max_id; }

} // namespace trayctx
