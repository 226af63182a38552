#pragma once

#include <sys/types.h>

#include <asio.hpp>
#include <atomic>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/releasable.hpp"
#include "core/types.hpp"

namespace spdlog {
class logger;
}

namespace harness {

class StdioTransport;
class StderrDrain;

// What to launch. No shell is involved: command is resolved through PATH and
// each argument reaches the child as one argv entry.
struct ChildProcessDescriptor {
  std::string command;
  std::vector<std::string> args;
  // Overrides applied on top of the parent environment
  std::map<std::string, std::string> env;
  std::optional<std::filesystem::path> working_dir;

  // "command arg1 arg2" for log lines
  std::string display() const;

  static ChildProcessDescriptor from_config(const ServerConfig& server);
};

// Identity of a spawned child. Owned by exactly one ProcessSession.
struct ProcessHandle {
  pid_t pid = -1;
  int stdin_fd = -1;
  int stdout_fd = -1;
  int stderr_fd = -1;
  bool running = false;
};

// Owns one child process and its three standard streams.
//
// stdin/stdout are exposed through a StdioTransport; stderr is drained on the
// runtime's worker pool so a chatty child can never block the primary channel.
class ProcessSession : public Releasable {
 public:
  using StderrCallback = std::function<void(const std::string& line)>;

  explicit ProcessSession(asio::io_context& io_ctx, ProcessSettings settings = {}, std::shared_ptr<spdlog::logger> diagnostics = nullptr);

  ~ProcessSession() override;

  ProcessSession(const ProcessSession&) = delete;
  ProcessSession& operator=(const ProcessSession&) = delete;

  // Spawn the child. Throws HarnessError:
  //   SpawnError     - the executable could not be launched
  //   AlreadyStarted - start() was already called on this session
  //   Cancelled      - abort was set; the child (if any) is killed before throwing
  const ProcessHandle& start(const ChildProcessDescriptor& descriptor, const AbortSignal& abort = nullptr);

  // SIGTERM the process group, wait up to kill_timeout for the child, then SIGKILL.
  // Group members that outlive the child are SIGKILLed before it is reaped.
  // No-op if never started or already reaped.
  void kill() noexcept;

  // Block until the child exits and return its exit code (128 + signal when signalled).
  // When abort fires first the child is killed and HarnessError(Cancelled) is thrown.
  int wait(const AbortSignal& abort = nullptr);

  // Non-blocking exit check
  std::optional<int> try_wait();

  void release() noexcept override {
    kill();
  }

  // Must be set before start()
  void on_stderr(StderrCallback cb) {
    on_stderr_ = std::move(cb);
  }

  // Block until the stderr drain reached end of stream, or the timeout elapsed
  bool wait_for_drain(std::chrono::milliseconds timeout);

  bool is_started() const;

  bool is_running() const;

  bool has_exited() const {
    return exited_.load();
  }

  pid_t pid() const;

  std::optional<int> exit_code() const;

  const std::optional<ChildProcessDescriptor>& descriptor() const {
    return descriptor_;
  }

  // Byte channel over the child's stdin/stdout; null before start()
  std::shared_ptr<StdioTransport> transport() const;

  size_t stderr_lines() const;

 private:
  // Reap the child if it has exited. mutex_ must be held.
  bool reap_locked(bool block);

  // Exit check that leaves the child unreaped. mutex_ must be held.
  bool leader_exited_locked();

  void signal_group(int sig);

  asio::io_context& io_ctx_;
  ProcessSettings settings_;
  std::shared_ptr<spdlog::logger> diagnostics_;
  StderrCallback on_stderr_;

  mutable std::mutex mutex_;
  std::optional<ChildProcessDescriptor> descriptor_;
  std::optional<ProcessHandle> handle_;
  std::atomic<bool> exited_{false};
  std::optional<int> exit_code_;

  std::shared_ptr<StdioTransport> transport_;
  std::shared_ptr<StderrDrain> drain_;
};

}  // namespace harness
