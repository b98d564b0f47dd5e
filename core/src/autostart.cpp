#include "trayctx/autostart.hpp"
#include "trayctx/logger.hpp"

namespace trayctx {

namespace {

std::string quote_if_needed(const std::string &arg) {
  if (arg.find_first_of(" \t") == std::string::npos && !arg.empty())
    return arg;
  return "\"" + arg + "\"";
}

} // namespace

AutoStart::AutoStart(IShell *shell, std::string name,
                     std::vector<std::string> args)
    : shell_(shell), name_(std::move(name)), args_(std::move(args)) {}

std::string AutoStart::command_line() const {
  std::string cmd = "\"" + shell_->current_executable() + "\"";
  for (const auto &arg : args_)
    cmd += " " + quote_if_needed(arg);
  return cmd;
}

bool AutoStart::is_installed() const {
  auto value = shell_->registry_get(RUN_KEY, name_);
  return value && *value == command_line();
}

void AutoStart::install() const {
  std::string cmd = command_line();
  shell_->registry_set(RUN_KEY, name_, cmd);
  TRAYCTX_LOG_INFO("autostart: installed '" + name_ + "' -> " + cmd);
}

void AutoStart::uninstall() const {
  shell_->registry_delete(RUN_KEY, name_);
  TRAYCTX_LOG_INFO("autostart: removed '" + name_ + "'");
}

} // namespace trayctx
