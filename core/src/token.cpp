#include "trayctx/token.hpp"
#include <atomic>

namespace trayctx {

namespace {
std::atomic<std::uint64_t> g_next_serial{1};
}

const char *id_space_name(IdSpace space) {
  switch (space) {
  case IdSpace::MenuItem:
    return "menu-item";
  case IdSpace::Icon:
    return "icon";
  case IdSpace::Notification:
    return "notification";
  }
  return "unknown";
}

Token Token::mint(IdSpace space) {
  return Token(space, g_next_serial.fetch_add(1, std::memory_order_relaxed));
}

std::string Token::to_string() const {
  return std::string(id_space_name(space_)) + "#" + std::to_string(serial_);
}

} // namespace trayctx
