#include "server/server_session.hpp"

#include <spdlog/spdlog.h>

#include "bus/bus.hpp"
#include "core/error.hpp"
#include "core/uuid.hpp"
#include "log/log.h"
#include "transport/stdio_transport.hpp"

namespace harness {

std::string to_string(ServerState state) {
  switch (state) {
    case ServerState::Created:
      return "created";
    case ServerState::Starting:
      return "starting";
    case ServerState::Running:
      return "running";
    case ServerState::Failed:
      return "failed";
    case ServerState::Disposing:
      return "disposing";
    case ServerState::Disposed:
      return "disposed";
  }
  return "unknown";
}

ServerSession::ServerSession(asio::io_context& io_ctx, ChildProcessDescriptor descriptor, ProtocolServerFactory factory, ProcessSettings settings,
                             std::shared_ptr<spdlog::logger> diagnostics, std::string name)
    : io_ctx_(io_ctx),
      descriptor_(std::move(descriptor)),
      factory_(std::move(factory)),
      settings_(settings),
      diagnostics_(diagnostics ? std::move(diagnostics) : null_logger()),
      id_(UUID::generate()),
      name_(name.empty() ? "External Process (" + descriptor_.command + ")" : std::move(name)) {}

std::shared_ptr<ServerSession> ServerSession::create(asio::io_context& io_ctx, ChildProcessDescriptor descriptor, ProtocolServerFactory factory,
                                                     ProcessSettings settings, std::shared_ptr<spdlog::logger> diagnostics, std::string name) {
  return std::shared_ptr<ServerSession>(
      new ServerSession(io_ctx, std::move(descriptor), std::move(factory), settings, std::move(diagnostics), std::move(name)));
}

ServerSession::~ServerSession() {
  dispose();
}

void ServerSession::start(const AbortSignal& abort) {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);

  auto current = state_.load();
  if (disposed_ || current != ServerState::Created) {
    throw HarnessError(ErrorKind::InvalidState, "Cannot start session " + name_ + " in state " + to_string(current));
  }
  if (is_aborted(abort)) {
    throw HarnessError(ErrorKind::Cancelled, "Start of " + name_ + " cancelled");
  }

  set_state(ServerState::Starting);
  spdlog::info("[ServerSession {}] Starting external process: {}", id_, descriptor_.display());

  auto process = std::make_shared<ProcessSession>(io_ctx_, settings_, diagnostics_);
  process->on_stderr(on_stderr_);

  try {
    process->start(descriptor_, abort);
  } catch (const std::exception& e) {
    diagnostics_->error("[ServerSession {}] Failed to start process: {}", id_, e.what());
    process->kill();
    set_state(ServerState::Failed);
    throw;
  }

  auto transport = process->transport();
  std::shared_ptr<ProtocolServer> server;
  try {
    server = factory_ ? factory_(transport) : nullptr;
    if (!server) {
      throw HarnessError(ErrorKind::SpawnError, "Protocol server factory produced no server");
    }
  } catch (const std::exception& e) {
    diagnostics_->error("[ServerSession {}] Failed to create protocol server: {}", id_, e.what());
    process->kill();
    set_state(ServerState::Failed);
    throw;
  }

  if (is_aborted(abort)) {
    release_step("protocol server", *server);
    process->kill();
    set_state(ServerState::Failed);
    throw HarnessError(ErrorKind::Cancelled, "Start of " + name_ + " cancelled");
  }

  running_ = Running{std::move(process), std::move(transport), std::move(server)};
  set_state(ServerState::Running);
}

void ServerSession::run(const AbortSignal& abort) {
  if (state_ == ServerState::Created) {
    start(abort);
  }

  std::shared_ptr<ProtocolServer> server;
  {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (state_ != ServerState::Running || !running_) {
      throw HarnessError(ErrorKind::InvalidState, "Cannot run session " + name_ + " in state " + to_string(state_.load()));
    }
    server = running_->server;
  }

  spdlog::debug("[ServerSession {}] Running protocol server", id_);
  try {
    server->run(abort);
  } catch (const std::exception& e) {
    if (!is_aborted(abort)) {
      throw;
    }
    diagnostics_->debug("[ServerSession {}] Protocol server stopped on cancel: {}", id_, e.what());
  }

  // Cancellation ends the session; the process does not outlive the run
  if (is_aborted(abort)) {
    spdlog::info("[ServerSession {}] Run cancelled, disposing", id_);
    server.reset();
    dispose();
    throw HarnessError(ErrorKind::Cancelled, "Run of " + name_ + " cancelled");
  }
}

void ServerSession::dispose() noexcept {
  if (disposed_.exchange(true)) {
    return;
  }

  // Waits for an in-flight start() to settle
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);

  if (state_ == ServerState::Running && running_) {
    set_state(ServerState::Disposing);

    // The process is killed even when the server refuses to let go
    release_step("protocol server", *running_->server);
    release_step("process", *running_->process);

    if (running_->process->is_running()) {
      diagnostics_->error("[ServerSession {}] Process {} still running after kill", id_, running_->process->pid());
      Bus::instance().publish(events::DisposalFailed{id_, "process", "still running after kill"});
    }

    running_.reset();
  }

  set_state(ServerState::Disposed);
  spdlog::debug("[ServerSession {}] Disposed", id_);
}

std::future<void> ServerSession::dispose_async() {
  return std::async(std::launch::async, [self = shared_from_this()]() {
    self->dispose();
  });
}

std::shared_ptr<ProtocolServer> ServerSession::server() const {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  return running_ ? running_->server : nullptr;
}

std::shared_ptr<ProcessSession> ServerSession::process() const {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  return running_ ? running_->process : nullptr;
}

std::shared_ptr<StdioTransport> ServerSession::transport() const {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  return running_ ? running_->transport : nullptr;
}

void ServerSession::set_state(ServerState to) {
  auto from = state_.exchange(to);
  if (from == to) return;

  spdlog::debug("[ServerSession {}] {} -> {}", id_, to_string(from), to_string(to));
  Bus::instance().publish(events::ServerStateChanged{id_, to_string(from), to_string(to)});
}

void ServerSession::release_step(const std::string& step, Releasable& resource) noexcept {
  try {
    resource.release();
  } catch (const std::exception& e) {
    diagnostics_->error("[ServerSession {}] Error releasing {}: {}", id_, step, e.what());
    Bus::instance().publish(events::DisposalFailed{id_, step, e.what()});
  }
}

}  // namespace harness
