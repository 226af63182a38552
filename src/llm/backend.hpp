#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "core/message.hpp"
#include "core/types.hpp"
#include "tool/tool.hpp"

namespace harness::llm {

// Stream event types

// Incremental text. Sequence numbers increase within one stream.
struct TextDelta {
  uint64_t sequence = 0;
  std::string text;
};

// The model asks for a tool to be invoked with complete arguments
struct ToolCallRequest {
  std::string id;
  std::string name;
  json arguments;
};

struct FinishStep {
  FinishReason reason = FinishReason::Stop;
  TokenUsage usage;
};

struct StreamError {
  std::string message;
};

using StreamEvent = std::variant<TextDelta, ToolCallRequest, FinishStep, StreamError>;

// Stream callback
using StreamCallback = std::function<void(const StreamEvent&)>;

// Chat request
struct ChatRequest {
  std::string model;
  std::vector<Message> messages;

  // Tool definitions
  std::vector<std::shared_ptr<Tool>> tools;

  // Generation parameters
  std::optional<double> temperature;
  std::optional<int> max_tokens;

  // Chat-completions style payload
  json to_json() const;
};

// Abstract streaming model backend
class ChatBackend {
 public:
  virtual ~ChatBackend() = default;

  virtual std::string name() const = 0;

  // Start streaming a response. callback may run on any thread; on_complete
  // runs exactly once after the last event, including after cancel().
  virtual void stream(const ChatRequest& request, StreamCallback callback, std::function<void()> on_complete) = 0;

  // Cancel current request
  virtual void cancel() = 0;
};

}  // namespace harness::llm
