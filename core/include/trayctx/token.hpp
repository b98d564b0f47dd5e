#pragma once
#include <cstdint>
#include <functional>
#include <string>

namespace trayctx {

enum class IdSpace : std::uint8_t { MenuItem = 0, Icon, Notification };

inline constexpr std::size_t ID_SPACE_COUNT = 3;

const char *id_space_name(IdSpace space);

// Opaque handle given to application code for a menu item, tray icon or
// notification. Serials are process-unique and never reused.
class Token {
public:
  Token() = default;

  static Token mint(IdSpace space);

  IdSpace space() const { return space_; }
  std::uint64_t serial() const { return serial_; }
  bool valid() const { return serial_ != 0; }

  std::string to_string() const;

  bool operator==(const Token &o) const {
    return space_ == o.space_ && serial_ == o.serial_;
  }
  bool operator!=(const Token &o) const { return !(*this == o); }
  bool operator<(const Token &o) const {
    if (space_ != o.space_)
      return space_ < o.space_;
    return serial_ < o.serial_;
  }

private:
  Token(IdSpace space, std::uint64_t serial) : space_(space), serial_(serial) {}

  IdSpace space_ = IdSpace::MenuItem;
  std::uint64_t serial_ = 0;
};

} // namespace trayctx

namespace std {
template <> struct hash<trayctx::Token> {
  std::size_t operator()(const trayctx::Token &t) const noexcept {
    return std::hash<std::uint64_t>{}(t.serial()) ^
           (static_cast<std::size_t>(t.space()) << 1);
  }
};
} // namespace std
