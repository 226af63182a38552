#include "process/process_session.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <future>
#include <thread>

#include "bus/bus.hpp"
#include "core/error.hpp"
#include "log/log.h"
#include "transport/stdio_transport.hpp"

extern char** environ;

namespace harness {

namespace {

constexpr size_t kMaxStderrLine = 64 * 1024;
constexpr auto kPollInterval = std::chrono::milliseconds(10);

void ignore_sigpipe_once() {
  // Writing to a dead child's stdin must surface as EPIPE, not terminate us
  static std::once_flag flag;
  std::call_once(flag, []() {
    ::signal(SIGPIPE, SIG_IGN);
  });
}

void close_fd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

struct Pipe {
  int fds[2] = {-1, -1};

  ~Pipe() {
    close_fd(fds[0]);
    close_fd(fds[1]);
  }

  bool open() {
    return ::pipe2(fds, O_CLOEXEC) == 0;
  }

  int release_read() {
    int fd = fds[0];
    fds[0] = -1;
    return fd;
  }

  int release_write() {
    int fd = fds[1];
    fds[1] = -1;
    return fd;
  }
};

// "KEY=VALUE" strings of the current environment with overrides applied
std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
  std::map<std::string, std::string> merged;
  for (char** entry = environ; entry && *entry; ++entry) {
    std::string kv(*entry);
    auto eq = kv.find('=');
    if (eq == std::string::npos) continue;
    merged[kv.substr(0, eq)] = kv.substr(eq + 1);
  }
  for (const auto& [key, value] : overrides) {
    merged[key] = value;
  }

  std::vector<std::string> result;
  result.reserve(merged.size());
  for (const auto& [key, value] : merged) {
    result.push_back(key + "=" + value);
  }
  return result;
}

}  // namespace

// ============================================================================
// StderrDrain
// ============================================================================

// Reads a child's stderr to end of stream on a strand of the worker pool and
// forwards each line to the diagnostic sink.
class StderrDrain : public std::enable_shared_from_this<StderrDrain> {
 public:
  StderrDrain(asio::io_context& io_ctx, int fd, pid_t pid, std::shared_ptr<spdlog::logger> diagnostics, ProcessSession::StderrCallback callback)
      : strand_(asio::make_strand(io_ctx)),
        descriptor_(strand_, fd),
        pid_(pid),
        diagnostics_(std::move(diagnostics)),
        callback_(std::move(callback)),
        done_(done_promise_.get_future().share()) {}

  void start() {
    asio::post(strand_, [self = shared_from_this()]() {
      self->read_next();
    });
  }

  // Stop reading even if the write end is still held open (e.g. by a grandchild)
  void close() {
    asio::post(strand_, [self = shared_from_this()]() {
      asio::error_code ec;
      self->descriptor_.cancel(ec);
      self->descriptor_.close(ec);
      self->finish();
    });
  }

  bool wait_finished(std::chrono::milliseconds timeout) const {
    return done_.wait_for(timeout) == std::future_status::ready;
  }

  size_t lines() const {
    return lines_.load();
  }

 private:
  void read_next() {
    if (!descriptor_.is_open()) {
      finish();
      return;
    }

    descriptor_.async_read_some(asio::buffer(buffer_), [self = shared_from_this()](const asio::error_code& ec, size_t n) {
      if (n > 0) {
        self->consume(n);
      }
      if (ec) {
        if (ec != asio::error::eof && ec != asio::error::operation_aborted) {
          self->diagnostics_->debug("[pid {}] stderr read stopped: {}", self->pid_, ec.message());
        }
        self->flush_partial();
        self->finish();
        return;
      }
      self->read_next();
    });
  }

  void consume(size_t n) {
    pending_.append(buffer_.data(), n);

    size_t start = 0;
    size_t pos;
    while ((pos = pending_.find('\n', start)) != std::string::npos) {
      size_t end = pos;
      if (end > start && pending_[end - 1] == '\r') --end;
      emit(pending_.substr(start, end - start));
      start = pos + 1;
    }
    pending_.erase(0, start);

    // Unterminated output is emitted in bounded chunks
    while (pending_.size() >= kMaxStderrLine) {
      emit(pending_.substr(0, kMaxStderrLine));
      pending_.erase(0, kMaxStderrLine);
    }
  }

  void flush_partial() {
    if (!pending_.empty()) {
      emit(pending_);
      pending_.clear();
    }
  }

  void emit(const std::string& line) {
    lines_++;
    diagnostics_->warn("[pid {}] stderr: {}", pid_, line);
    Bus::instance().publish(events::StderrLine{static_cast<int>(pid_), line});

    if (callback_) {
      try {
        callback_(line);
      } catch (const std::exception& e) {
        diagnostics_->error("[pid {}] stderr callback threw: {}", pid_, e.what());
      }
    }
  }

  void finish() {
    if (finished_) return;
    finished_ = true;
    spdlog::debug("[pid {}] stderr drained ({} lines)", pid_, lines_.load());
    done_promise_.set_value();
  }

  asio::strand<asio::io_context::executor_type> strand_;
  asio::posix::stream_descriptor descriptor_;
  pid_t pid_;
  std::shared_ptr<spdlog::logger> diagnostics_;
  ProcessSession::StderrCallback callback_;

  std::array<char, 4096> buffer_{};
  std::string pending_;
  std::atomic<size_t> lines_{0};

  bool finished_ = false;  // strand-confined
  std::promise<void> done_promise_;
  std::shared_future<void> done_;
};

// ============================================================================
// ChildProcessDescriptor
// ============================================================================

std::string ChildProcessDescriptor::display() const {
  std::string result = command;
  for (const auto& arg : args) {
    result += " " + arg;
  }
  return result;
}

ChildProcessDescriptor ChildProcessDescriptor::from_config(const ServerConfig& server) {
  return ChildProcessDescriptor{server.command, server.args, server.env, server.working_dir};
}

// ============================================================================
// ProcessSession
// ============================================================================

ProcessSession::ProcessSession(asio::io_context& io_ctx, ProcessSettings settings, std::shared_ptr<spdlog::logger> diagnostics)
    : io_ctx_(io_ctx), settings_(settings), diagnostics_(diagnostics ? std::move(diagnostics) : null_logger()) {}

ProcessSession::~ProcessSession() {
  kill();
  if (drain_) {
    drain_->close();
  }
}

const ProcessHandle& ProcessSession::start(const ChildProcessDescriptor& descriptor, const AbortSignal& abort) {
  if (is_aborted(abort)) {
    throw HarnessError(ErrorKind::Cancelled, "Start cancelled before spawning " + descriptor.command);
  }

  std::unique_lock<std::mutex> lock(mutex_);
  if (handle_) {
    throw HarnessError(ErrorKind::AlreadyStarted, "Process already started (pid " + std::to_string(handle_->pid) + ")");
  }
  if (descriptor.command.empty()) {
    throw HarnessError(ErrorKind::SpawnError, "Empty command");
  }

  ignore_sigpipe_once();

  spdlog::info("[ProcessSession] Starting: {}", descriptor.display());

  Pipe in_pipe, out_pipe, err_pipe, status_pipe;
  if (!in_pipe.open() || !out_pipe.open() || !err_pipe.open() || !status_pipe.open()) {
    throw HarnessError(ErrorKind::SpawnError, "Failed to create pipes: " + std::string(strerror(errno)));
  }

  // Everything the child needs is prepared before fork
  std::vector<std::string> env_strings = build_environment(descriptor.env);
  std::vector<char*> envp;
  envp.reserve(env_strings.size() + 1);
  for (auto& entry : env_strings) {
    envp.push_back(entry.data());
  }
  envp.push_back(nullptr);

  std::vector<std::string> argv_strings;
  argv_strings.reserve(descriptor.args.size() + 1);
  argv_strings.push_back(descriptor.command);
  argv_strings.insert(argv_strings.end(), descriptor.args.begin(), descriptor.args.end());
  std::vector<char*> argv;
  argv.reserve(argv_strings.size() + 1);
  for (auto& arg : argv_strings) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);

  std::string workdir = descriptor.working_dir ? descriptor.working_dir->string() : std::string();

  pid_t pid = ::fork();
  if (pid == -1) {
    throw HarnessError(ErrorKind::SpawnError, "Failed to fork: " + std::string(strerror(errno)));
  }

  if (pid == 0) {
    // ---- Child process ----
    ::setpgid(0, 0);

    // Ignored dispositions survive exec; the child gets the default back
    ::signal(SIGPIPE, SIG_DFL);

    ::dup2(in_pipe.fds[0], STDIN_FILENO);
    ::dup2(out_pipe.fds[1], STDOUT_FILENO);
    ::dup2(err_pipe.fds[1], STDERR_FILENO);

    if (!workdir.empty() && ::chdir(workdir.c_str()) != 0) {
      int err = errno;
      ssize_t ignored = ::write(status_pipe.fds[1], &err, sizeof(err));
      (void)ignored;
      ::_exit(127);
    }

    ::execvpe(argv[0], argv.data(), envp.data());

    // exec failed: report errno through the close-on-exec status pipe
    int err = errno;
    ssize_t ignored = ::write(status_pipe.fds[1], &err, sizeof(err));
    (void)ignored;
    ::_exit(127);
  }

  // ---- Parent process ----
  ::setpgid(pid, pid);  // Races with the child's own call; either one wins

  close_fd(in_pipe.fds[0]);
  close_fd(out_pipe.fds[1]);
  close_fd(err_pipe.fds[1]);
  close_fd(status_pipe.fds[1]);

  // EOF means exec succeeded; an int means it failed
  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(status_pipe.fds[0], &child_errno, sizeof(child_errno));
  } while (n == -1 && errno == EINTR);

  if (n > 0) {
    int status = 0;
    while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
    }
    spdlog::error("[ProcessSession] Failed to launch {}: {}", descriptor.command, strerror(child_errno));
    throw HarnessError(ErrorKind::SpawnError, "Failed to launch '" + descriptor.command + "': " + std::string(strerror(child_errno)));
  }

  ProcessHandle handle;
  handle.pid = pid;
  handle.stdin_fd = in_pipe.release_write();
  handle.stdout_fd = out_pipe.release_read();
  handle.stderr_fd = err_pipe.release_read();
  handle.running = true;

  descriptor_ = descriptor;
  handle_ = handle;
  exited_ = false;

  transport_ = std::make_shared<StdioTransport>(io_ctx_, handle.stdin_fd, handle.stdout_fd);
  drain_ = std::make_shared<StderrDrain>(io_ctx_, handle.stderr_fd, pid, diagnostics_, on_stderr_);
  drain_->start();

  spdlog::info("[ProcessSession] Started pid {}", pid);
  Bus::instance().publish(events::ProcessStarted{static_cast<int>(pid), descriptor.command});

  if (is_aborted(abort)) {
    lock.unlock();
    kill();
    throw HarnessError(ErrorKind::Cancelled, "Start cancelled after spawning pid " + std::to_string(pid));
  }

  return *handle_;
}

void ProcessSession::kill() noexcept {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!handle_ || exited_) {
    return;
  }

  try {
    pid_t pid = handle_->pid;
    bool signalled = false;
    bool forced = false;

    if (!leader_exited_locked()) {
      spdlog::debug("[ProcessSession] Sending SIGTERM to process group {}", pid);
      signal_group(SIGTERM);
      signalled = true;

      auto deadline = std::chrono::steady_clock::now() + settings_.kill_timeout;
      while (!leader_exited_locked()) {
        if (std::chrono::steady_clock::now() >= deadline) {
          spdlog::warn("[ProcessSession] pid {} ignored SIGTERM for {}ms, sending SIGKILL", pid, settings_.kill_timeout.count());
          signal_group(SIGKILL);
          forced = true;
          break;
        }
        std::this_thread::sleep_for(kPollInterval);
      }
    }

    // The unreaped leader pins its group id, so survivors can still be addressed
    if (!forced && ::kill(-pid, SIGKILL) == -1 && errno != ESRCH && errno != EPERM) {
      diagnostics_->warn("[ProcessSession] kill(-{}, SIGKILL) failed: {}", pid, strerror(errno));
    }
    reap_locked(true);

    if (signalled) {
      Bus::instance().publish(events::ProcessSignalled{static_cast<int>(pid), forced});
    }

    auto drain = drain_;
    lock.unlock();

    if (drain && !drain->wait_finished(settings_.drain_timeout)) {
      // A grandchild outside the process group may still hold stderr open
      drain->close();
    }
  } catch (const std::exception& e) {
    diagnostics_->error("[ProcessSession] kill failed: {}", e.what());
  }
}

bool ProcessSession::leader_exited_locked() {
  if (exited_) {
    return true;
  }

  siginfo_t info{};
  int r;
  do {
    r = ::waitid(P_PID, static_cast<id_t>(handle_->pid), &info, WEXITED | WNOHANG | WNOWAIT);
  } while (r == -1 && errno == EINTR);

  // ECHILD: already reaped elsewhere; reap_locked records that
  return r == -1 || info.si_pid != 0;
}

int ProcessSession::wait(const AbortSignal& abort) {
  while (true) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!handle_) {
        throw HarnessError(ErrorKind::InvalidState, "Process not started");
      }
      if (reap_locked(false)) {
        return *exit_code_;
      }
    }

    if (is_aborted(abort)) {
      kill();
      throw HarnessError(ErrorKind::Cancelled, "Wait cancelled; process " + std::to_string(pid()) + " killed");
    }

    std::this_thread::sleep_for(kPollInterval);
  }
}

std::optional<int> ProcessSession::try_wait() {
  // A concurrent kill() owns the exit transition; report what is known
  std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
  if (!lock.owns_lock()) {
    return std::nullopt;
  }
  if (!handle_) {
    return std::nullopt;
  }
  if (reap_locked(false)) {
    return exit_code_;
  }
  return std::nullopt;
}

bool ProcessSession::reap_locked(bool block) {
  if (exited_) {
    return true;
  }

  int status = 0;
  pid_t r;
  do {
    r = ::waitpid(handle_->pid, &status, block ? 0 : WNOHANG);
  } while (r == -1 && errno == EINTR);

  if (r == 0) {
    return false;
  }

  if (r == -1) {
    // ECHILD: reaped elsewhere (e.g. SIGCHLD ignored); the exit status is lost
    spdlog::warn("[ProcessSession] waitpid({}) failed: {}", handle_->pid, strerror(errno));
    exit_code_ = -1;
  } else if (WIFEXITED(status)) {
    exit_code_ = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    exit_code_ = 128 + WTERMSIG(status);
  } else {
    exit_code_ = -1;
  }

  handle_->running = false;
  exited_ = true;

  spdlog::debug("[ProcessSession] pid {} exited with code {}", handle_->pid, *exit_code_);
  Bus::instance().publish(events::ProcessExited{static_cast<int>(handle_->pid), *exit_code_});
  return true;
}

void ProcessSession::signal_group(int sig) {
  pid_t pid = handle_->pid;
  if (::kill(-pid, sig) == -1) {
    // The child may have left its group (setsid); signal it directly
    if (::kill(pid, sig) == -1 && errno != ESRCH) {
      diagnostics_->error("[ProcessSession] kill({}, {}) failed: {}", pid, sig, strerror(errno));
    }
  }
}

bool ProcessSession::wait_for_drain(std::chrono::milliseconds timeout) {
  std::shared_ptr<StderrDrain> drain;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    drain = drain_;
  }
  return !drain || drain->wait_finished(timeout);
}

bool ProcessSession::is_started() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handle_.has_value();
}

bool ProcessSession::is_running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handle_.has_value() && !exited_;
}

pid_t ProcessSession::pid() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handle_ ? handle_->pid : -1;
}

std::optional<int> ProcessSession::exit_code() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return exit_code_;
}

std::shared_ptr<StdioTransport> ProcessSession::transport() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return transport_;
}

size_t ProcessSession::stderr_lines() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return drain_ ? drain_->lines() : 0;
}

}  // namespace harness
