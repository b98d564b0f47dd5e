#pragma once
#include "shell.hpp"
#include <optional>
#include <string>

namespace trayctx {

// Held for the lifetime of the object; used to keep a single instance of an
// application running.
class NamedMutex {
public:
  // Empty when another process already holds `name`.
  static std::optional<NamedMutex> acquire(IShell *shell,
                                           const std::string &name);

  NamedMutex(NamedMutex &&other) noexcept;
  NamedMutex &operator=(NamedMutex &&other) noexcept;
  NamedMutex(const NamedMutex &) = delete;
  NamedMutex &operator=(const NamedMutex &) = delete;
  ~NamedMutex();

  const std::string &name() const { return name_; }

private:
  NamedMutex(IShell *shell, std::string name, native_handle handle);
  void release();

  IShell *shell_ = nullptr;
  std::string name_;
  native_handle handle_{};
};

} // namespace trayctx
