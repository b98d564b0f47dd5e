#include "trayctx/notification.hpp"

namespace trayctx {

const char *stock_icon_name(StockIcon icon) {
  switch (icon) {
  case StockIcon::DocNoAssoc:
    return "doc-no-assoc";
  case StockIcon::DocAssoc:
    return "doc-assoc";
  case StockIcon::Application:
    return "application";
  case StockIcon::Folder:
    return "folder";
  case StockIcon::FolderOpen:
    return "folder-open";
  case StockIcon::DriveFixed:
    return "drive-fixed";
  case StockIcon::DriveNet:
    return "drive-net";
  case StockIcon::DriveCD:
    return "drive-cd";
  case StockIcon::Server:
    return "server";
  case StockIcon::Printer:
    return "printer";
  case StockIcon::Find:
    return "find";
  case StockIcon::Help:
    return "help";
  case StockIcon::Share:
    return "share";
  case StockIcon::Link:
    return "link";
  case StockIcon::Recycler:
    return "recycler";
  case StockIcon::RecyclerFull:
    return "recycler-full";
  case StockIcon::Lock:
    return "lock";
  case StockIcon::Shield:
    return "shield";
  case StockIcon::Warning:
    return "warning";
  case StockIcon::Info:
    return "info";
  case StockIcon::Error:
    return "error";
  case StockIcon::Key:
    return "key";
  case StockIcon::Software:
    return "software";
  case StockIcon::Rename:
    return "rename";
  case StockIcon::Delete:
    return "delete";
  case StockIcon::Users:
    return "users";
  case StockIcon::Internet:
    return "internet";
  case StockIcon::ZipFile:
    return "zip-file";
  case StockIcon::Settings:
    return "settings";
  case StockIcon::DesktopPC:
    return "desktop-pc";
  case StockIcon::NetworkConnect:
    return "network-connect";
  }
  return "unknown";
}

std::optional<NotificationRequest>
NotificationTracker::enqueue(NotificationRequest req) {
  Slot &slot = slots_[req.icon];
  if (!slot.current) {
    slot.current = req;
    return req;
  }
  slot.waiting.push_back(std::move(req));
  return std::nullopt;
}

NotificationTracker::Completion
NotificationTracker::complete(const Token &icon) {
  Completion out;
  auto it = slots_.find(icon);
  if (it == slots_.end() || !it->second.current)
    return out;

  Slot &slot = it->second;
  out.completed = slot.current->token;
  slot.current.reset();
  if (!slot.waiting.empty()) {
    slot.current = std::move(slot.waiting.front());
    slot.waiting.pop_front();
    out.next = slot.current;
  } else {
    slots_.erase(it);
  }
  return out;
}

std::optional<Token> NotificationTracker::in_flight(const Token &icon) const {
  auto it = slots_.find(icon);
  if (it == slots_.end() || !it->second.current)
    return std::nullopt;
  return it->second.current->token;
}

std::size_t NotificationTracker::pending(const Token &icon) const {
  auto it = slots_.find(icon);
  if (it == slots_.end())
    return 0;
  return it->second.waiting.size();
}

std::vector<Token> NotificationTracker::forget(const Token &icon) {
  std::vector<Token> dropped;
  auto it = slots_.find(icon);
  if (it == slots_.end())
    return dropped;
  if (it->second.current)
    dropped.push_back(it->second.current->token);
  for (const auto &req : it->second.waiting)
    dropped.push_back(req.token);
  slots_.erase(it);
  return dropped;
}

} // namespace trayctx
