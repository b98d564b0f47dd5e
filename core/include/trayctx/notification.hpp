#pragma once
#include "token.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace trayctx {

enum class NotificationIcon : std::uint8_t { None, Info, Warning, Error };

// Shell stock icons usable as the balloon icon (SHSTOCKICONID on Windows).
enum class StockIcon : std::uint8_t {
  DocNoAssoc,
  DocAssoc,
  Application,
  Folder,
  FolderOpen,
  DriveFixed,
  DriveNet,
  DriveCD,
  Server,
  Printer,
  Find,
  Help,
  Share,
  Link,
  Recycler,
  RecyclerFull,
  Lock,
  Shield,
  Warning,
  Info,
  Error,
  Key,
  Software,
  Rename,
  Delete,
  Users,
  Internet,
  ZipFile,
  Settings,
  DesktopPC,
  NetworkConnect,
};

const char *stock_icon_name(StockIcon icon);

enum NotificationOption : std::uint32_t {
  NOTIFY_NO_SOUND = 1u << 0,
  NOTIFY_LARGE_ICON = 1u << 1,
  NOTIFY_RESPECT_QUIET_TIME = 1u << 2,
  // Stock icons only.
  NOTIFY_ICON_SELECTED = 1u << 3,
  NOTIFY_ICON_LINK_OVERLAY = 1u << 4,
};

struct Notification {
  std::string title;
  std::string message;
  NotificationIcon icon = NotificationIcon::Info;
  // Replaces `icon` when set.
  std::optional<StockIcon> stock_icon;
  // The shell clamps this and ignores it entirely on recent Windows versions.
  std::optional<std::chrono::milliseconds> timeout;
  std::uint32_t options = 0;
};

struct NotificationRequest {
  Token icon;
  Token token;
  Notification content;
};

// The shell shows one balloon per icon at a time and its callbacks carry no
// request identity, so requests are serialized per icon and callbacks are
// matched against the single one in flight.
class NotificationTracker {
public:
  struct Completion {
    std::optional<Token> completed; // empty: stale callback
    std::optional<NotificationRequest> next;
  };

  // Returns the request back when it has to be displayed right away; it is
  // then in flight. Otherwise it waits behind the current one.
  std::optional<NotificationRequest> enqueue(NotificationRequest req);

  // Resolves the request in flight for `icon` and promotes the next waiting
  // one, which is in flight on return.
  Completion complete(const Token &icon);

  std::optional<Token> in_flight(const Token &icon) const;
  std::size_t pending(const Token &icon) const;

  // Drops everything queued for a removed icon and returns the dropped
  // notification tokens, in-flight first.
  std::vector<Token> forget(const Token &icon);

private:
  struct Slot {
    std::optional<NotificationRequest> current;
    std::deque<NotificationRequest> waiting;
  };
  std::map<Token, Slot> slots_;
};

} // namespace trayctx
