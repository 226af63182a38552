#include <unistd.h>

#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <string>

#include "harness/harness.hpp"

using namespace harness;

static AbortSignal g_abort = make_abort_signal();

static void sigint_handler(int) {
  g_abort->store(true);
  const char* msg = "\n[Interrupted]\n";
  ssize_t ignored = ::write(STDOUT_FILENO, msg, strlen(msg));
  (void)ignored;
}

// Sends one line to the child and logs the first line it answers with.
// Stands in for a real protocol endpoint.
class LineProbeServer : public ProtocolServer {
 public:
  explicit LineProbeServer(std::shared_ptr<StdioTransport> transport) : transport_(std::move(transport)) {}

  void run(const AbortSignal& abort) override {
    transport_->write("ping\n");

    std::string line;
    char buf[256];
    while (!is_aborted(abort) && line.find('\n') == std::string::npos) {
      auto n = transport_->read_some(buf, sizeof(buf));
      if (n == 0) break;
      line.append(buf, n);
    }
    spdlog::info("[LineProbeServer] Child answered: {}", line.substr(0, line.find('\n')));
  }

  void release() override {
    transport_->close_input();
  }

 private:
  std::shared_ptr<StdioTransport> transport_;
};

static bool parse_date(const std::string& text, std::chrono::sys_days& out) {
  int y = 0;
  unsigned m = 0;
  unsigned d = 0;
  if (std::sscanf(text.c_str(), "%d-%u-%u", &y, &m, &d) != 3) {
    return false;
  }
  std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{m}, std::chrono::day{d}};
  if (!ymd.ok()) {
    return false;
  }
  out = std::chrono::sys_days{ymd};
  return true;
}

static std::shared_ptr<Tool> make_days_between_tool() {
  return std::make_shared<FunctionTool>(
      "days_between", "Number of days between two ISO dates",
      std::vector<ParameterSchema>{{"from", "string", "Start date, YYYY-MM-DD"}, {"to", "string", "End date, YYYY-MM-DD"}},
      [](const json& args, const ToolContext&) {
        std::chrono::sys_days from;
        std::chrono::sys_days to;
        if (!parse_date(args["from"].get<std::string>(), from) || !parse_date(args["to"].get<std::string>(), to)) {
          return ToolResult::error("Dates must be YYYY-MM-DD");
        }
        return ToolResult::success(std::to_string((to - from).count()));
      });
}

int main(int argc, char* argv[]) {
  std::signal(SIGINT, sigint_handler);

  auto config = Config::load_default();
  init(config);

  if (config.servers.empty()) {
    // Default: a plain echo child
    ServerConfig echo;
    echo.name = "echo";
    echo.command = argc > 1 ? argv[1] : "cat";
    for (int i = 2; i < argc; ++i) {
      echo.args.push_back(argv[i]);
    }
    config.servers.push_back(echo);
  }

  std::cout << "agent-harness " << version() << "\n";

  Runtime runtime(config.worker_threads);

  auto tools = std::make_shared<ToolRegistry>();
  auto registered = tools->register_tool(make_days_between_tool());
  if (!registered.ok()) {
    std::cerr << "Error: " << *registered.error << "\n";
    return 1;
  }

  // Replays what a model would answer to the question below
  auto backend = std::make_shared<llm::ScriptedBackend>(
      std::vector<llm::StreamEvent>{
          llm::TextDelta{1, "Let me count the days. "},
          llm::ToolCallRequest{"call_1", "days_between", {{"from", "2000-01-01"}, {"to", "2025-03-18"}}},
          llm::TextDelta{2, "There are 9208 days between "},
          llm::TextDelta{3, "2000-01-01 and 2025-03-18."},
          llm::FinishStep{FinishReason::Stop, {42, 17}},
      },
      std::chrono::milliseconds(50));

  Agent agent(config.agent, backend, tools, get_logger());
  agent.orchestrator().on_stream([](const std::string& text) {
    std::cout << text << std::flush;
  });
  agent.orchestrator().on_tool_call([](const std::string&, const std::string& name, const json& args) {
    std::cout << "\n[Calling tool: " << name << "]\n[Arguments: " << args.dump() << "]\n";
  });
  agent.orchestrator().on_tool_result([](const std::string&, const std::string& name, const ToolResult& result) {
    std::cout << "[Tool " << name << " " << (result.is_error ? "failed" : "completed") << ": " << result.output << "]\n";
  });

  for (auto& session : make_server_sessions(
           config, runtime,
           [](std::shared_ptr<StdioTransport> transport) {
             return std::make_unique<LineProbeServer>(std::move(transport));
           },
           get_logger())) {
    agent.add_server(session);
  }

  int rc = 0;
  try {
    auto scope = agent.run_servers(g_abort);
    std::cout << "Servers started. Running example query...\n";

    for (const auto& session : agent.servers()) {
      session->run(g_abort);
    }

    ChatOptions options;
    options.abort = g_abort;
    auto response = agent.chat("How many days between 2000-01-01 and 2025-03-18?", options);

    std::cout << "\n\nResult (" << to_string(response.finish_reason) << "):\n" << response.transcript.final_text() << "\n";
    if (!response.ok()) {
      std::cerr << "Error: " << response.error->describe() << "\n";
      rc = 1;
    }

    for (const auto& failure : scope->release()) {
      std::cerr << "Cleanup of " << failure.name << " failed: " << failure.message << "\n";
    }
    std::cout << "Servers have been stopped.\n";
  } catch (const HarnessError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    rc = 1;
  }

  runtime.stop();
  shutdown();
  return rc;
}
