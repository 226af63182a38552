#pragma once

#include <asio.hpp>
#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "core/config.hpp"
#include "core/releasable.hpp"
#include "core/types.hpp"
#include "process/process_session.hpp"
#include "server/protocol_server.hpp"

namespace spdlog {
class logger;
}

namespace harness {

// Session lifecycle
//
//   Created --start()--> Starting --> Running --dispose()--> Disposing --> Disposed
//                           |
//                           +--> Failed --dispose()--> Disposed
enum class ServerState { Created, Starting, Running, Failed, Disposing, Disposed };

std::string to_string(ServerState state);

// One child process paired with one protocol-server instance and a single
// disposal lifecycle.
class ServerSession : public Releasable, public std::enable_shared_from_this<ServerSession> {
 public:
  static std::shared_ptr<ServerSession> create(asio::io_context& io_ctx, ChildProcessDescriptor descriptor, ProtocolServerFactory factory,
                                               ProcessSettings settings = {}, std::shared_ptr<spdlog::logger> diagnostics = nullptr,
                                               std::string name = "");

  ~ServerSession() override;

  ServerSession(const ServerSession&) = delete;
  ServerSession& operator=(const ServerSession&) = delete;

  const SessionId& id() const {
    return id_;
  }

  const std::string& name() const {
    return name_;
  }

  const ChildProcessDescriptor& descriptor() const {
    return descriptor_;
  }

  ServerState state() const {
    return state_.load();
  }

  bool is_running() const {
    return state_ == ServerState::Running;
  }

  // Spawn the process and create the protocol server.
  // Throws HarnessError(InvalidState) unless the session is Created. Spawn and
  // factory failures leave the session Failed with nothing allocated.
  void start(const AbortSignal& abort = nullptr);

  // Start if needed, then serve until the protocol server returns.
  // When abort fires the session is disposed and HarnessError(Cancelled) is thrown.
  void run(const AbortSignal& abort = nullptr);

  // Release the protocol server, then kill the process. Idempotent, never throws.
  void dispose() noexcept;

  std::future<void> dispose_async();

  void release() override {
    dispose();
  }

  // Null unless Running
  std::shared_ptr<ProtocolServer> server() const;

  std::shared_ptr<ProcessSession> process() const;

  std::shared_ptr<StdioTransport> transport() const;

  // Must be set before start()
  void on_stderr(ProcessSession::StderrCallback cb) {
    on_stderr_ = std::move(cb);
  }

 private:
  ServerSession(asio::io_context& io_ctx, ChildProcessDescriptor descriptor, ProtocolServerFactory factory, ProcessSettings settings,
                std::shared_ptr<spdlog::logger> diagnostics, std::string name);

  // Process and server exist together or not at all
  struct Running {
    std::shared_ptr<ProcessSession> process;
    std::shared_ptr<StdioTransport> transport;
    std::shared_ptr<ProtocolServer> server;
  };

  void set_state(ServerState to);

  void release_step(const std::string& step, Releasable& resource) noexcept;

  asio::io_context& io_ctx_;
  const ChildProcessDescriptor descriptor_;
  ProtocolServerFactory factory_;
  ProcessSettings settings_;
  std::shared_ptr<spdlog::logger> diagnostics_;
  ProcessSession::StderrCallback on_stderr_;

  SessionId id_;
  std::string name_;

  mutable std::mutex lifecycle_mutex_;
  std::atomic<ServerState> state_{ServerState::Created};
  std::atomic<bool> disposed_{false};
  std::optional<Running> running_;
};

}  // namespace harness
