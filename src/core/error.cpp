#include "core/error.hpp"

namespace harness {

std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::SpawnError:
      return "spawn_error";
    case ErrorKind::AlreadyStarted:
      return "already_started";
    case ErrorKind::InvalidState:
      return "invalid_state";
    case ErrorKind::StreamError:
      return "stream_error";
    case ErrorKind::ToolInvocationError:
      return "tool_invocation_error";
    case ErrorKind::Cancelled:
      return "cancelled";
    case ErrorKind::DisposalError:
      return "disposal_error";
    case ErrorKind::ConfigError:
      return "config_error";
  }
  return "unknown";
}

HarnessError::HarnessError(ErrorKind kind, const std::string& message) : std::runtime_error(message), kind_(kind) {}

}  // namespace harness
