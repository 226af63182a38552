#pragma once

#include <memory>
#include <string>
#include <vector>

#include "agent/orchestrator.hpp"
#include "core/config.hpp"
#include "core/runtime.hpp"
#include "scope/resource_guard.hpp"
#include "server/server_session.hpp"

namespace harness {

// A model identity, its orchestrator and the external servers it works with.
// Servers are started together and disposed together through run_servers().
class Agent {
 public:
  Agent(AgentConfig config, std::shared_ptr<llm::ChatBackend> backend, std::shared_ptr<ToolRegistry> tools = nullptr,
        std::shared_ptr<spdlog::logger> diagnostics = nullptr);

  const std::string& model_id() const {
    return orchestrator_.config().model;
  }

  void add_server(std::shared_ptr<ServerSession> session);

  const std::vector<std::shared_ptr<ServerSession>>& servers() const {
    return servers_;
  }

  // Start every server; all of them are disposed when the guard goes away.
  // If one fails to start the others are disposed and the error propagates.
  std::unique_ptr<ScopedResourceGuard> run_servers(const AbortSignal& abort = nullptr);

  ChatResponse chat(const std::string& prompt, const ChatOptions& options = {});

  AgentOrchestrator& orchestrator() {
    return orchestrator_;
  }

  ToolRegistry& tools() {
    return orchestrator_.tools();
  }

 private:
  AgentOrchestrator orchestrator_;
  std::shared_ptr<spdlog::logger> diagnostics_;
  std::vector<std::shared_ptr<ServerSession>> servers_;
};

// One session per enabled entry of the servers section
std::vector<std::shared_ptr<ServerSession>> make_server_sessions(const Config& config, Runtime& runtime, const ProtocolServerFactory& factory,
                                                                 std::shared_ptr<spdlog::logger> diagnostics = nullptr);

// Initialize logging from the configuration
void init(const Config& config);

// Flush and drop loggers
void shutdown();

// Get version string
std::string version();

}  // namespace harness
