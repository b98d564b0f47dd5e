#include "trayctx/named_mutex.hpp"
#include "trayctx/error.hpp"
#include "trayctx/logger.hpp"

namespace trayctx {

std::optional<NamedMutex> NamedMutex::acquire(IShell *shell,
                                              const std::string &name) {
  auto handle = shell->acquire_named_mutex(name);
  if (!handle) {
    TRAYCTX_LOG_INFO("named mutex '" + name + "' is held by another process");
    return std::nullopt;
  }
  return NamedMutex(shell, name, *handle);
}

NamedMutex::NamedMutex(IShell *shell, std::string name, native_handle handle)
    : shell_(shell), name_(std::move(name)), handle_(handle) {}

NamedMutex::NamedMutex(NamedMutex &&other) noexcept
    : shell_(other.shell_), name_(std::move(other.name_)),
      handle_(other.handle_) {
  other.shell_ = nullptr;
  other.handle_ = 0;
}

NamedMutex &NamedMutex::operator=(NamedMutex &&other) noexcept {
  if (this != &other) {
    release();
    shell_ = other.shell_;
    name_ = std::move(other.name_);
    handle_ = other.handle_;
    other.shell_ = nullptr;
    other.handle_ = 0;
  }
  return *this;
}

NamedMutex::~NamedMutex() { release(); }

void NamedMutex::release() {
  if (!shell_ || !handle_)
    return;
  try {
    shell_->release_named_mutex(handle_);
  } catch (const Error &e) {
    TRAYCTX_LOG_WARN("named mutex '" + name_ + "' release failed: " + e.what());
  }
  shell_ = nullptr;
  handle_ = 0;
}

} // namespace trayctx
