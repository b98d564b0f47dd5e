#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace trayctx {

enum class ErrorCode : std::uint8_t {
  Setup,         // window, class, icon or menu creation during startup
  Config,        // invalid builder configuration, caught before startup
  UnknownToken,  // command refers to an entity that no longer exists
  IdExhausted,   // no free native id left in an id-space
  Shell,         // a native call failed while running
  ChannelClosed, // the pump is gone
};

const char *error_code_str(ErrorCode code);

class Error : public std::runtime_error {
public:
  Error(ErrorCode code, const std::string &msg, std::uint32_t os_error = 0);

  ErrorCode code() const { return code_; }
  // GetLastError() value of the failing call, 0 when not from the OS.
  std::uint32_t os_error() const { return os_error_; }

private:
  ErrorCode code_;
  std::uint32_t os_error_;
};

} // namespace trayctx
