#include "trayctx/error.hpp"

namespace trayctx {

const char *error_code_str(ErrorCode code) {
  switch (code) {
  case ErrorCode::Setup:
    return "E_SETUP";
  case ErrorCode::Config:
    return "E_CONFIG";
  case ErrorCode::UnknownToken:
    return "E_UNKNOWN_TOKEN";
  case ErrorCode::IdExhausted:
    return "E_ID_EXHAUSTED";
  case ErrorCode::Shell:
    return "E_SHELL";
  case ErrorCode::ChannelClosed:
    return "E_CHANNEL_CLOSED";
  }
  return "E_UNKNOWN";
}

Error::Error(ErrorCode code, const std::string &msg, std::uint32_t os_error)
    : std::runtime_error(msg), code_(code), os_error_(os_error) {}

} // namespace trayctx
