#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "agent/agent.hpp"
#include "agent/orchestrator.hpp"
#include "llm/scripted_backend.hpp"
#include "test_util.hpp"

using namespace harness;
using namespace harness::test;
using namespace std::chrono_literals;

namespace {

std::shared_ptr<Tool> add_tool() {
  return std::make_shared<FunctionTool>("add", "Add two integers",
                                        std::vector<ParameterSchema>{{"a", "integer", "First operand"}, {"b", "integer", "Second operand"}},
                                        [](const json& args, const ToolContext&) {
                                          return ToolResult::success(std::to_string(args["a"].get<int>() + args["b"].get<int>()));
                                        });
}

std::shared_ptr<Tool> failing_tool() {
  return std::make_shared<FunctionTool>("flaky", "Always fails", std::vector<ParameterSchema>{},
                                        [](const json&, const ToolContext&) -> ToolResult {
                                          throw std::runtime_error("disk full");
                                        });
}

std::shared_ptr<Tool> echo_tool() {
  return std::make_shared<FunctionTool>("echo", "Echo the text", std::vector<ParameterSchema>{{"text", "string", "Text to echo"}},
                                        [](const json& args, const ToolContext&) {
                                          return ToolResult::success(args["text"].get<std::string>());
                                        });
}

class OrchestratorTest : public ::testing::Test {
 protected:
  AgentOrchestrator make(std::vector<llm::StreamEvent> events, std::chrono::milliseconds delay = 0ms) {
    backend = std::make_shared<llm::ScriptedBackend>(std::move(events), delay);
    return AgentOrchestrator(config, backend, tools);
  }

  AgentConfig config{"test-model", "You are terse."};
  std::shared_ptr<ToolRegistry> tools = std::make_shared<ToolRegistry>();
  std::shared_ptr<llm::ScriptedBackend> backend;
};

}  // namespace

TEST_F(OrchestratorTest, AggregatesFragmentsInArrivalOrder) {
  auto orchestrator = make({
      llm::TextDelta{1, "Hello"},
      llm::TextDelta{2, " world"},
      llm::TextDelta{3, "!"},
      llm::FinishStep{FinishReason::Stop, {12, 3}},
  });

  std::vector<std::string> streamed;
  orchestrator.on_stream([&](const std::string& text) {
    streamed.push_back(text);
  });

  auto response = orchestrator.chat("Say hello");

  ASSERT_TRUE(response.ok());
  EXPECT_EQ(response.text(), "Hello world!");
  EXPECT_EQ(response.finish_reason, FinishReason::Stop);
  EXPECT_EQ(response.usage.input_tokens, 12);
  EXPECT_EQ(response.usage.output_tokens, 3);
  EXPECT_EQ(streamed, (std::vector<std::string>{"Hello", " world", "!"}));

  const auto& messages = response.transcript.messages();
  ASSERT_EQ(messages.size(), 3u);
  EXPECT_EQ(messages[0].role(), Role::System);
  EXPECT_EQ(messages[0].text(), "You are terse.");
  EXPECT_EQ(messages[1].role(), Role::User);
  EXPECT_EQ(messages[1].text(), "Say hello");
  EXPECT_EQ(messages[2].role(), Role::Assistant);
  EXPECT_EQ(messages[2].text(), "Hello world!");
  EXPECT_TRUE(messages[2].is_finished());
}

TEST_F(OrchestratorTest, SequenceGapsAreAccepted) {
  auto orchestrator = make({llm::TextDelta{1, "a"}, llm::TextDelta{5, "b"}, llm::TextDelta{9, "c"}});

  auto response = orchestrator.chat("go");
  ASSERT_TRUE(response.ok());
  EXPECT_EQ(response.text(), "abc");
}

TEST_F(OrchestratorTest, ToolCallIsInvokedAndRecorded) {
  ASSERT_TRUE(tools->register_tool(add_tool()).ok());
  auto orchestrator = make({
      llm::TextDelta{1, "Computing. "},
      llm::ToolCallRequest{"call_1", "add", {{"a", 2}, {"b", 3}}},
      llm::TextDelta{2, "The sum is 5."},
      llm::FinishStep{FinishReason::Stop, {}},
  });

  std::vector<std::string> calls;
  orchestrator.on_tool_call([&](const std::string& id, const std::string& name, const json&) {
    calls.push_back(id + ":" + name);
  });

  auto response = orchestrator.chat("What is 2 + 3?");
  ASSERT_TRUE(response.ok());
  EXPECT_EQ(calls, (std::vector<std::string>{"call_1:add"}));

  const auto& messages = response.transcript.messages();
  ASSERT_EQ(messages.size(), 5u);

  // Text that preceded the request stays ahead of the call
  EXPECT_EQ(messages[2].role(), Role::Assistant);
  EXPECT_EQ(messages[2].text(), "Computing. ");
  ASSERT_EQ(messages[2].tool_calls().size(), 1u);
  EXPECT_EQ(messages[2].tool_calls()[0]->name, "add");

  EXPECT_EQ(messages[3].role(), Role::Tool);
  ASSERT_EQ(messages[3].tool_results().size(), 1u);
  EXPECT_EQ(messages[3].tool_results()[0]->tool_call_id, "call_1");
  EXPECT_EQ(messages[3].tool_results()[0]->output, "5");
  EXPECT_FALSE(messages[3].tool_results()[0]->is_error);

  EXPECT_EQ(messages[4].role(), Role::Assistant);
  EXPECT_EQ(messages[4].text(), "The sum is 5.");
  EXPECT_EQ(response.transcript.final_text(), "The sum is 5.");
}

TEST_F(OrchestratorTest, ToolFailureMidStreamIsRecordedAndExchangeContinues) {
  ASSERT_TRUE(tools->register_tool(failing_tool()).ok());
  auto orchestrator = make({
      llm::ToolCallRequest{"call_1", "flaky", json::object()},
      llm::TextDelta{1, "The tool failed, sorry."},
  });

  std::vector<bool> outcomes;
  orchestrator.on_tool_result([&](const std::string&, const std::string&, const ToolResult& result) {
    outcomes.push_back(result.is_error);
  });

  auto response = orchestrator.chat("Try the tool");
  ASSERT_TRUE(response.ok());
  EXPECT_EQ(outcomes, (std::vector<bool>{true}));

  auto tool_messages = response.transcript.with_role(Role::Tool);
  ASSERT_EQ(tool_messages.size(), 1u);
  auto results = tool_messages[0]->tool_results();
  ASSERT_EQ(results.size(), 1u);
  EXPECT_TRUE(results[0]->is_error);
  EXPECT_NE(results[0]->output.find("disk full"), std::string::npos);
  EXPECT_EQ(results[0]->metadata["error_kind"], to_string(ErrorKind::ToolInvocationError));

  EXPECT_EQ(response.transcript.final_text(), "The tool failed, sorry.");
}

TEST_F(OrchestratorTest, NonStandardToolExceptionBecomesErrorResult) {
  ASSERT_TRUE(tools->register_tool(std::make_shared<FunctionTool>("boom", "Throws an int", std::vector<ParameterSchema>{},
                                                                  [](const json&, const ToolContext&) -> ToolResult {
                                                                    throw 42;
                                                                  }))
                  .ok());
  auto orchestrator = make({
      llm::TextDelta{1, "Hello"},
      llm::ToolCallRequest{"call_1", "boom", json::object()},
      llm::TextDelta{2, " world"},
  });

  auto response = orchestrator.chat("Try it");
  ASSERT_TRUE(response.ok());

  auto tool_messages = response.transcript.with_role(Role::Tool);
  ASSERT_EQ(tool_messages.size(), 1u);
  auto results = tool_messages[0]->tool_results();
  ASSERT_EQ(results.size(), 1u);
  EXPECT_TRUE(results[0]->is_error);
  EXPECT_EQ(results[0]->metadata["error_kind"], to_string(ErrorKind::ToolInvocationError));
  EXPECT_EQ(response.text(), "Hello world");
  EXPECT_EQ(response.transcript.final_text(), " world");
}

TEST_F(OrchestratorTest, ThrowingCallbacksDoNotEndExchange) {
  ASSERT_TRUE(tools->register_tool(echo_tool()).ok());
  auto orchestrator = make({
      llm::TextDelta{1, "a"},
      llm::ToolCallRequest{"call_1", "echo", {{"text", "x"}}},
      llm::TextDelta{2, "b"},
  });

  orchestrator.on_stream([](const std::string&) {
    throw std::runtime_error("stream observer broke");
  });
  orchestrator.on_tool_call([](const std::string&, const std::string&, const json&) {
    throw 7;
  });
  orchestrator.on_tool_result([](const std::string&, const std::string&, const ToolResult&) {
    throw std::logic_error("result observer broke");
  });

  auto response = orchestrator.chat("go");
  ASSERT_TRUE(response.ok());
  EXPECT_EQ(response.text(), "ab");

  auto tool_messages = response.transcript.with_role(Role::Tool);
  ASSERT_EQ(tool_messages.size(), 1u);
  EXPECT_EQ(tool_messages[0]->tool_results()[0]->output, "x");
  EXPECT_FALSE(tool_messages[0]->tool_results()[0]->is_error);
}

TEST_F(OrchestratorTest, UnknownToolProducesErrorResult) {
  auto orchestrator = make({llm::ToolCallRequest{"call_1", "missing", json::object()}});

  auto response = orchestrator.chat("Use a tool");
  ASSERT_TRUE(response.ok());

  auto tool_messages = response.transcript.with_role(Role::Tool);
  ASSERT_EQ(tool_messages.size(), 1u);
  EXPECT_TRUE(tool_messages[0]->tool_results()[0]->is_error);
  EXPECT_EQ(tool_messages[0]->tool_results()[0]->output, "Tool not found: missing");
}

TEST_F(OrchestratorTest, InvalidArgumentsProduceErrorResult) {
  ASSERT_TRUE(tools->register_tool(add_tool()).ok());
  auto orchestrator = make({llm::ToolCallRequest{"call_1", "add", {{"a", 2}}}});

  auto response = orchestrator.chat("Add");
  ASSERT_TRUE(response.ok());

  auto tool_messages = response.transcript.with_role(Role::Tool);
  ASSERT_EQ(tool_messages.size(), 1u);
  const auto* result = tool_messages[0]->tool_results()[0];
  EXPECT_TRUE(result->is_error);
  EXPECT_NE(result->output.find("Missing required parameter: b"), std::string::npos);
}

TEST_F(OrchestratorTest, DisallowedToolIsNotOfferedOrRun) {
  ASSERT_TRUE(tools->register_tool(add_tool()).ok());
  ASSERT_TRUE(tools->register_tool(echo_tool()).ok());
  auto orchestrator = make({llm::ToolCallRequest{"call_1", "add", {{"a", 1}, {"b", 1}}}});

  ChatOptions options;
  options.allowed_tools = {"echo"};
  auto response = orchestrator.chat("Add", options);

  auto request = backend->last_request();
  ASSERT_TRUE(request.has_value());
  ASSERT_EQ(request->tools.size(), 1u);
  EXPECT_EQ(request->tools[0]->id(), "echo");

  auto tool_messages = response.transcript.with_role(Role::Tool);
  ASSERT_EQ(tool_messages.size(), 1u);
  EXPECT_TRUE(tool_messages[0]->tool_results()[0]->is_error);
}

TEST_F(OrchestratorTest, RequestCarriesModelAndMessages) {
  auto orchestrator = make({llm::TextDelta{1, "ok"}});

  ChatOptions options;
  options.temperature = 0.2;
  options.max_tokens = 64;
  orchestrator.chat("ping", options);

  auto request = backend->last_request();
  ASSERT_TRUE(request.has_value());
  EXPECT_EQ(request->model, "test-model");
  ASSERT_EQ(request->messages.size(), 2u);
  EXPECT_EQ(request->messages[1].text(), "ping");
  EXPECT_EQ(request->temperature, 0.2);
  EXPECT_EQ(request->max_tokens, 64);
}

TEST_F(OrchestratorTest, OutOfOrderFragmentFailsExchange) {
  auto orchestrator = make({
      llm::TextDelta{1, "a"},
      llm::TextDelta{3, "b"},
      llm::TextDelta{2, "c"},
      llm::TextDelta{4, "d"},
  });

  auto response = orchestrator.chat("go");

  ASSERT_FALSE(response.ok());
  EXPECT_EQ(response.error->kind, ErrorKind::StreamError);
  EXPECT_EQ(response.finish_reason, FinishReason::Error);

  // Accepted fragments survive in an unfinished message
  const auto& last = response.transcript.back();
  EXPECT_EQ(last.role(), Role::Assistant);
  EXPECT_EQ(last.text(), "ab");
  EXPECT_FALSE(last.is_finished());
}

TEST_F(OrchestratorTest, DuplicateSequenceFailsExchange) {
  auto orchestrator = make({llm::TextDelta{1, "a"}, llm::TextDelta{1, "a"}});

  auto response = orchestrator.chat("go");
  ASSERT_FALSE(response.ok());
  EXPECT_EQ(response.error->kind, ErrorKind::StreamError);
}

TEST_F(OrchestratorTest, StreamErrorKeepsPartialTranscript) {
  auto orchestrator = make({
      llm::TextDelta{1, "partial "},
      llm::TextDelta{2, "answer"},
      llm::StreamError{"connection reset"},
      llm::TextDelta{3, "never seen"},
  });

  auto response = orchestrator.chat("go");

  ASSERT_FALSE(response.ok());
  EXPECT_EQ(response.error->kind, ErrorKind::StreamError);
  EXPECT_EQ(response.error->message, "connection reset");
  ASSERT_EQ(response.transcript.size(), 3u);
  EXPECT_EQ(response.transcript.back().text(), "partial answer");
  EXPECT_FALSE(response.transcript.back().is_finished());
}

TEST_F(OrchestratorTest, CancellationStopsAwaitingFragments) {
  std::vector<llm::StreamEvent> events;
  for (uint64_t i = 1; i <= 50; ++i) {
    events.push_back(llm::TextDelta{i, "x"});
  }
  auto orchestrator = make(std::move(events), 50ms);

  ChatOptions options;
  options.abort = make_abort_signal();
  std::thread canceller([abort = options.abort]() {
    std::this_thread::sleep_for(180ms);
    abort->store(true);
  });

  auto begin = std::chrono::steady_clock::now();
  auto response = orchestrator.chat("go", options);
  auto elapsed = std::chrono::steady_clock::now() - begin;
  canceller.join();

  ASSERT_FALSE(response.ok());
  EXPECT_EQ(response.error->kind, ErrorKind::Cancelled);
  EXPECT_EQ(response.finish_reason, FinishReason::Cancelled);
  EXPECT_LT(elapsed, 2s);
  EXPECT_TRUE(backend->was_cancelled());
  EXPECT_FALSE(orchestrator.busy());

  // Whatever arrived before the abort is kept
  EXPECT_LT(response.text().size(), 50u);
}

TEST_F(OrchestratorTest, AbortBeforeChatDoesNotStream) {
  auto orchestrator = make({llm::TextDelta{1, "x"}});

  ChatOptions options;
  options.abort = make_abort_signal();
  options.abort->store(true);

  auto response = orchestrator.chat("go", options);
  ASSERT_FALSE(response.ok());
  EXPECT_EQ(response.error->kind, ErrorKind::Cancelled);
  EXPECT_EQ(response.transcript.size(), 2u);
  EXPECT_EQ(backend->stream_count(), 0u);
}

TEST_F(OrchestratorTest, FragmentTimeoutFailsExchange) {
  auto orchestrator = make({llm::TextDelta{1, "late"}}, 1000ms);

  ChatOptions options;
  options.fragment_timeout = 50ms;
  auto response = orchestrator.chat("go", options);

  ASSERT_FALSE(response.ok());
  EXPECT_EQ(response.error->kind, ErrorKind::StreamError);
  EXPECT_TRUE(backend->was_cancelled());
}

TEST_F(OrchestratorTest, ConcurrentChatIsRejected) {
  auto orchestrator = make({llm::TextDelta{1, "slow"}, llm::TextDelta{2, " reply"}}, 200ms);

  ChatResponse first;
  std::thread runner([&]() {
    first = orchestrator.chat("first");
  });

  ASSERT_TRUE(eventually([&]() {
    return orchestrator.busy();
  }));
  EXPECT_EQ(error_kind_of([&]() {
              orchestrator.chat("second");
            }),
            ErrorKind::InvalidState);

  runner.join();
  EXPECT_TRUE(first.ok());
  EXPECT_EQ(first.text(), "slow reply");

  // Free again once the first exchange is over
  backend->set_events({llm::TextDelta{1, "again"}});
  EXPECT_EQ(orchestrator.chat("third").text(), "again");
}

TEST_F(OrchestratorTest, AgentForwardsToOrchestrator) {
  backend = std::make_shared<llm::ScriptedBackend>(std::vector<llm::StreamEvent>{llm::TextDelta{1, "hi"}});
  Agent agent(config, backend, tools);

  EXPECT_EQ(agent.model_id(), "test-model");
  EXPECT_TRUE(agent.servers().empty());
  EXPECT_EQ(agent.chat("hello").text(), "hi");

  // No servers: the guard is empty
  auto scope = agent.run_servers();
  EXPECT_EQ(scope->size(), 0u);
}
