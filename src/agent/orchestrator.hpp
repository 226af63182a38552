#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/error.hpp"
#include "core/transcript.hpp"
#include "core/types.hpp"
#include "llm/backend.hpp"
#include "tool/tool.hpp"

namespace spdlog {
class logger;
}

namespace harness {

struct ChatOptions {
  // Tools offered to the model; every registered tool when empty
  std::vector<std::string> allowed_tools;

  std::optional<double> temperature;
  std::optional<int> max_tokens;

  // Longest wait between two stream events before the exchange fails
  std::optional<std::chrono::milliseconds> fragment_timeout;

  AbortSignal abort;
};

// Outcome of one exchange. The transcript is kept even when the exchange failed.
struct ChatResponse {
  std::string exchange_id;
  ConversationTranscript transcript;
  FinishReason finish_reason = FinishReason::Stop;
  TokenUsage usage;
  std::optional<Error> error;

  bool ok() const {
    return !error.has_value();
  }

  // All assistant text of the exchange
  std::string text() const {
    return transcript.assistant_text();
  }
};

// Drives one conversational exchange: streams a response from the backend,
// folds text fragments into assistant messages and runs requested tools.
class AgentOrchestrator {
 public:
  AgentOrchestrator(AgentConfig config, std::shared_ptr<llm::ChatBackend> backend, std::shared_ptr<ToolRegistry> tools = nullptr,
                    std::shared_ptr<spdlog::logger> diagnostics = nullptr);

  // Run one exchange to completion, failure or cancellation.
  // Throws HarnessError(InvalidState) when another chat() is in progress.
  ChatResponse chat(const std::string& prompt, const ChatOptions& options = {});

  bool busy() const {
    return busy_.load();
  }

  const AgentConfig& config() const {
    return config_;
  }

  ToolRegistry& tools() {
    return *tools_;
  }

  // Callbacks
  using StreamCallback = std::function<void(const std::string& text)>;
  using ToolCallCallback = std::function<void(const std::string& id, const std::string& name, const json& args)>;
  using ToolResultCallback = std::function<void(const std::string& id, const std::string& name, const ToolResult& result)>;

  void on_stream(StreamCallback cb) {
    on_stream_ = std::move(cb);
  }

  void on_tool_call(ToolCallCallback cb) {
    on_tool_call_ = std::move(cb);
  }

  void on_tool_result(ToolResultCallback cb) {
    on_tool_result_ = std::move(cb);
  }

 private:
  ToolResult invoke_tool(const std::string& exchange_id, const llm::ToolCallRequest& call, const ChatOptions& options);

  AgentConfig config_;
  std::shared_ptr<llm::ChatBackend> backend_;
  std::shared_ptr<ToolRegistry> tools_;
  std::shared_ptr<spdlog::logger> diagnostics_;

  std::atomic<bool> busy_{false};

  StreamCallback on_stream_;
  ToolCallCallback on_tool_call_;
  ToolResultCallback on_tool_result_;
};

}  // namespace harness
