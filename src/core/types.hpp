#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace harness {

using json = nlohmann::json;

// Forward declarations
class Tool;

class Message;

// Type aliases
using SessionId = std::string;
using MessageId = std::string;
using ToolId = std::string;

using Timestamp = std::chrono::system_clock::time_point;

// Cooperative cancellation flag shared between a caller and a long-running operation
using AbortSignal = std::shared_ptr<std::atomic<bool>>;

inline AbortSignal make_abort_signal() {
  return std::make_shared<std::atomic<bool>>(false);
}

inline bool is_aborted(const AbortSignal& signal) {
  return signal && signal->load();
}

// Result type for operations that can fail
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<std::string> error;

  bool ok() const {
    return value.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  static Result success(T val) {
    return Result{std::move(val), std::nullopt};
  }

  static Result failure(std::string err) {
    return Result{std::nullopt, std::move(err)};
  }
};

// Token usage tracking
struct TokenUsage {
  int64_t input_tokens = 0;
  int64_t output_tokens = 0;

  int64_t total() const {
    return input_tokens + output_tokens;
  }

  TokenUsage& operator+=(const TokenUsage& other) {
    input_tokens += other.input_tokens;
    output_tokens += other.output_tokens;
    return *this;
  }
};

// Finish reason for a streamed response
enum class FinishReason {
  Stop,       // Natural completion
  ToolCalls,  // Ended on a tool request
  Length,     // Token limit reached
  Error,      // Stream faulted
  Cancelled   // Caller cancelled
};

std::string to_string(FinishReason reason);

FinishReason finish_reason_from_string(const std::string& str);

}  // namespace harness
