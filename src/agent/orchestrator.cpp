#include "agent/orchestrator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "agent/event_channel.hpp"
#include "bus/bus.hpp"
#include "core/uuid.hpp"
#include "log/log.h"

namespace harness {

namespace {

// Clears the busy flag when chat() leaves by any path
class BusyGuard {
 public:
  explicit BusyGuard(std::atomic<bool>& flag) : flag_(flag) {}

  ~BusyGuard() {
    flag_ = false;
  }

 private:
  std::atomic<bool>& flag_;
};

// User callbacks observe the exchange; a throwing one must not end it
template <typename Fn>
void notify(spdlog::logger& diagnostics, const std::string& exchange_id, const char* which, Fn&& fn) {
  try {
    fn();
  } catch (const std::exception& e) {
    diagnostics.error("[Orchestrator {}] {} callback threw: {}", exchange_id, which, e.what());
  } catch (...) {
    diagnostics.error("[Orchestrator {}] {} callback threw a non-standard exception", exchange_id, which);
  }
}

}  // namespace

AgentOrchestrator::AgentOrchestrator(AgentConfig config, std::shared_ptr<llm::ChatBackend> backend, std::shared_ptr<ToolRegistry> tools,
                                     std::shared_ptr<spdlog::logger> diagnostics)
    : config_(std::move(config)),
      backend_(std::move(backend)),
      tools_(tools ? std::move(tools) : std::make_shared<ToolRegistry>()),
      diagnostics_(diagnostics ? std::move(diagnostics) : null_logger()) {
  if (!backend_) {
    throw HarnessError(ErrorKind::InvalidState, "Orchestrator requires a chat backend");
  }
}

ChatResponse AgentOrchestrator::chat(const std::string& prompt, const ChatOptions& options) {
  bool expected = false;
  if (!busy_.compare_exchange_strong(expected, true)) {
    throw HarnessError(ErrorKind::InvalidState, "A chat exchange is already in progress");
  }
  BusyGuard busy_guard(busy_);

  ChatResponse response;
  response.exchange_id = UUID::generate();
  const auto& exchange_id = response.exchange_id;

  response.transcript.append(Message::system(config_.system_prompt));
  response.transcript.append(Message::user(prompt));

  if (is_aborted(options.abort)) {
    response.finish_reason = FinishReason::Cancelled;
    response.error = Error{ErrorKind::Cancelled, "Chat cancelled before streaming"};
    return response;
  }

  // Build request
  llm::ChatRequest request;
  request.model = config_.model;
  request.messages = response.transcript.messages();
  request.tools = tools_->filtered(options.allowed_tools);
  request.temperature = options.temperature;
  request.max_tokens = options.max_tokens;

  spdlog::debug("[Orchestrator {}] Request: model={}, messages={}, tools={}", exchange_id, request.model, request.messages.size(),
                request.tools.size());

  // Backend callbacks only enqueue; the transcript is built on this thread
  auto channel = std::make_shared<EventChannel<llm::StreamEvent>>();
  try {
    backend_->stream(
        request,
        [channel](const llm::StreamEvent& event) {
          channel->push(event);
        },
        [channel]() {
          channel->close();
        });
  } catch (const std::exception& e) {
    spdlog::error("[Orchestrator {}] Failed to open stream: {}", exchange_id, e.what());
    response.finish_reason = FinishReason::Error;
    response.error = Error{ErrorKind::StreamError, std::string("Failed to open stream: ") + e.what()};
    return response;
  }

  std::string accumulated_text;
  std::optional<uint64_t> last_sequence;
  FinishReason finish_reason = FinishReason::Stop;
  bool assistant_appended = false;

  auto fail = [&](ErrorKind kind, const std::string& message) {
    response.error = Error{kind, message};
    backend_->cancel();
  };

  while (!response.error) {
    llm::StreamEvent event;
    auto status = channel->next(event, options.abort, options.fragment_timeout);

    if (status == EventChannel<llm::StreamEvent>::Status::Closed) {
      break;
    }
    if (status == EventChannel<llm::StreamEvent>::Status::Aborted) {
      spdlog::info("[Orchestrator {}] Cancelled", exchange_id);
      fail(ErrorKind::Cancelled, "Chat cancelled");
      break;
    }
    if (status == EventChannel<llm::StreamEvent>::Status::TimedOut) {
      spdlog::warn("[Orchestrator {}] No stream event within {}ms", exchange_id, options.fragment_timeout->count());
      fail(ErrorKind::StreamError, "No stream event within " + std::to_string(options.fragment_timeout->count()) + "ms");
      break;
    }

    std::visit(
        [&](auto&& e) {
          using T = std::decay_t<decltype(e)>;

          if constexpr (std::is_same_v<T, llm::TextDelta>) {
            if (last_sequence && e.sequence <= *last_sequence) {
              spdlog::error("[Orchestrator {}] Fragment {} arrived after {}", exchange_id, e.sequence, *last_sequence);
              fail(ErrorKind::StreamError,
                   "Out-of-order fragment: sequence " + std::to_string(e.sequence) + " after " + std::to_string(*last_sequence));
              return;
            }
            last_sequence = e.sequence;
            accumulated_text += e.text;
            spdlog::trace("[Orchestrator {}] Text delta {}: {}", exchange_id, e.sequence, e.text);

            if (on_stream_) {
              notify(*diagnostics_, exchange_id, "on_stream", [&]() {
                on_stream_(e.text);
              });
            }
            Bus::instance().publish(events::StreamDelta{exchange_id, e.sequence, e.text});
          } else if constexpr (std::is_same_v<T, llm::ToolCallRequest>) {
            // Text produced before the request stays ahead of the call
            Message msg(Role::Assistant, "");
            if (!accumulated_text.empty()) {
              msg.add_text(accumulated_text);
              accumulated_text.clear();
            }
            msg.add_tool_call(e.id, e.name, e.arguments);
            msg.set_finished(true);
            msg.set_finish_reason(FinishReason::ToolCalls);
            response.transcript.append(std::move(msg));
            assistant_appended = true;

            auto result = invoke_tool(exchange_id, e, options);

            auto result_msg = Message::tool_result(e.id, e.name, result.output, result.is_error);
            for (auto* part : result_msg.tool_results()) {
              part->title = result.title;
              part->metadata = result.metadata;
            }
            response.transcript.append(std::move(result_msg));
          } else if constexpr (std::is_same_v<T, llm::FinishStep>) {
            finish_reason = e.reason;
            response.usage += e.usage;
            spdlog::debug("[Orchestrator {}] Finish step: reason={}, input_tokens={}, output_tokens={}", exchange_id, to_string(e.reason),
                          e.usage.input_tokens, e.usage.output_tokens);
          } else if constexpr (std::is_same_v<T, llm::StreamError>) {
            spdlog::error("[Orchestrator {}] Stream error: {}", exchange_id, e.message);
            fail(ErrorKind::StreamError, e.message);
          }
        },
        event);
  }

  if (response.error) {
    response.finish_reason = response.error->kind == ErrorKind::Cancelled ? FinishReason::Cancelled : FinishReason::Error;

    // Partial output is kept in an unfinished message
    if (!accumulated_text.empty()) {
      Message partial(Role::Assistant, accumulated_text);
      partial.set_finished(false);
      partial.set_finish_reason(response.finish_reason);
      response.transcript.append(std::move(partial));
    }
    diagnostics_->warn("[Orchestrator {}] Exchange ended early: {}", exchange_id, response.error->describe());
    return response;
  }

  if (!accumulated_text.empty() || !assistant_appended) {
    Message msg(Role::Assistant, accumulated_text);
    msg.set_finished(true);
    msg.set_finish_reason(finish_reason);
    msg.set_usage(response.usage);
    response.transcript.append(std::move(msg));
  }

  response.finish_reason = finish_reason;
  spdlog::debug("[Orchestrator {}] Completed: {} messages, {} chars", exchange_id, response.transcript.size(), response.text().size());
  return response;
}

ToolResult AgentOrchestrator::invoke_tool(const std::string& exchange_id, const llm::ToolCallRequest& call, const ChatOptions& options) {
  spdlog::debug("[Orchestrator {}] Tool call: name={}, args={}", exchange_id, call.name, call.arguments.dump());

  if (on_tool_call_) {
    notify(*diagnostics_, exchange_id, "on_tool_call", [&]() {
      on_tool_call_(call.id, call.name, call.arguments);
    });
  }
  Bus::instance().publish(events::ToolCallStarted{exchange_id, call.id, call.name});

  ToolResult result;
  auto tool = tools_->get(call.name);
  const auto& allowed = options.allowed_tools;

  if (!tool) {
    result = ToolResult::error("Tool not found: " + call.name);
  } else if (!allowed.empty() && std::find(allowed.begin(), allowed.end(), call.name) == allowed.end()) {
    result = ToolResult::error("Tool not allowed in this exchange: " + call.name);
  } else if (auto validated = tool->validate_args(call.arguments); !validated.ok()) {
    result = ToolResult::error("Invalid arguments for " + call.name + ": " + validated.error.value_or("unknown"));
  } else {
    ToolContext ctx;
    ctx.exchange_id = exchange_id;
    ctx.tool_call_id = call.id;
    ctx.abort_signal = options.abort;

    try {
      result = tool->execute(*validated.value, ctx).get();
    } catch (const std::exception& e) {
      result = ToolResult::error("Tool " + call.name + " failed: " + e.what());
    } catch (...) {
      result = ToolResult::error("Tool " + call.name + " failed with a non-standard exception");
    }
  }

  if (result.is_error) {
    if (!result.metadata.is_object()) {
      result.metadata = json::object();
    }
    result.metadata["error_kind"] = to_string(ErrorKind::ToolInvocationError);
    diagnostics_->warn("[Orchestrator {}] Tool {} failed: {}", exchange_id, call.name, result.output);
  }

  Bus::instance().publish(events::ToolCallCompleted{exchange_id, call.id, call.name, !result.is_error});
  if (on_tool_result_) {
    notify(*diagnostics_, exchange_id, "on_tool_result", [&]() {
      on_tool_result_(call.id, call.name, result);
    });
  }

  return result;
}

}  // namespace harness
