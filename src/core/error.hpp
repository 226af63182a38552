#pragma once

#include <stdexcept>
#include <string>

namespace harness {

enum class ErrorKind {
  SpawnError,           // Child process could not be created
  AlreadyStarted,       // start() called twice on a process session
  InvalidState,         // Operation not allowed in the current lifecycle state
  StreamError,          // Model stream faulted mid-response
  ToolInvocationError,  // A tool call failed
  Cancelled,            // Abort signal fired
  DisposalError,        // Cleanup step failed (diagnostic only)
  ConfigError           // Configuration file could not be read
};

std::string to_string(ErrorKind kind);

// Error value for paths that report failures instead of throwing
struct Error {
  ErrorKind kind;
  std::string message;

  std::string describe() const {
    return to_string(kind) + ": " + message;
  }
};

class HarnessError : public std::runtime_error {
 public:
  HarnessError(ErrorKind kind, const std::string& message);

  ErrorKind kind() const noexcept {
    return kind_;
  }

  Error to_error() const {
    return Error{kind_, what()};
  }

 private:
  ErrorKind kind_;
};

}  // namespace harness
