#pragma once
#include "shell.hpp"
#include <string>
#include <vector>

namespace trayctx {

// Start-at-login entry for the current executable under the per-user Run key.
class AutoStart {
public:
  static constexpr const char *RUN_KEY =
      "Software\\Microsoft\\Windows\\CurrentVersion\\Run";

  AutoStart(IShell *shell, std::string name,
            std::vector<std::string> args = {});

  // "<exe>" followed by the arguments, quoted where they contain spaces.
  std::string command_line() const;

  // True only when the entry exists and points at this executable.
  bool is_installed() const;
  void install() const;
  void uninstall() const;

private:
  IShell *shell_;
  std::string name_;
  std::vector<std::string> args_;
};

} // namespace trayctx
