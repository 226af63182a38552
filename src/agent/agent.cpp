#include "agent/agent.hpp"

#include <spdlog/spdlog.h>

#include "core/version.hpp"
#include "log/log.h"

namespace harness {

Agent::Agent(AgentConfig config, std::shared_ptr<llm::ChatBackend> backend, std::shared_ptr<ToolRegistry> tools,
             std::shared_ptr<spdlog::logger> diagnostics)
    : orchestrator_(std::move(config), std::move(backend), std::move(tools), diagnostics), diagnostics_(std::move(diagnostics)) {}

void Agent::add_server(std::shared_ptr<ServerSession> session) {
  if (!session) return;
  spdlog::debug("[Agent] Added server: {}", session->name());
  servers_.push_back(std::move(session));
}

std::unique_ptr<ScopedResourceGuard> Agent::run_servers(const AbortSignal& abort) {
  spdlog::info("[Agent] Starting {} server(s) for model {}", servers_.size(), model_id());
  return guard_sessions(servers_, abort, diagnostics_);
}

ChatResponse Agent::chat(const std::string& prompt, const ChatOptions& options) {
  return orchestrator_.chat(prompt, options);
}

std::vector<std::shared_ptr<ServerSession>> make_server_sessions(const Config& config, Runtime& runtime, const ProtocolServerFactory& factory,
                                                                 std::shared_ptr<spdlog::logger> diagnostics) {
  std::vector<std::shared_ptr<ServerSession>> sessions;
  for (const auto& server : config.servers) {
    if (!server.enabled) {
      spdlog::debug("[Agent] Skipping disabled server: {}", server.name);
      continue;
    }
    sessions.push_back(ServerSession::create(runtime.io_context(), ChildProcessDescriptor::from_config(server), factory, config.process,
                                             diagnostics, server.name));
  }
  return sessions;
}

void init(const Config& config) {
  init_log(config.log_file ? config.log_file->string() : std::string(), 10, config.log_level);
  spdlog::info("agent-harness {} initialized", version());
}

void shutdown() {
  spdlog::shutdown();
}

std::string version() {
  return HARNESS_VERSION_STRING;
}

}  // namespace harness
