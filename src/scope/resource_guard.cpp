#include "scope/resource_guard.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <future>

#include "log/log.h"
#include "server/server_session.hpp"

namespace harness {

ScopedResourceGuard::ScopedResourceGuard(std::vector<Resource> resources, std::shared_ptr<spdlog::logger> diagnostics)
    : diagnostics_(diagnostics ? std::move(diagnostics) : null_logger()) {
  std::vector<std::future<void>> pending;
  pending.reserve(resources.size());
  for (const auto& resource : resources) {
    pending.push_back(std::async(std::launch::async, resource.acquire));
  }

  // Every acquisition is awaited before deciding, so none is left running
  std::vector<Resource> acquired;
  std::exception_ptr first_error;
  for (size_t i = 0; i < pending.size(); ++i) {
    try {
      pending[i].get();
      acquired.push_back(resources[i]);
    } catch (const std::exception& e) {
      spdlog::error("[ResourceGuard] Failed to acquire {}: {}", resources[i].name, e.what());
      if (!first_error) {
        first_error = std::current_exception();
      }
    }
  }

  if (first_error) {
    for (const auto& failure : release_all(acquired, *diagnostics_)) {
      diagnostics_->warn("[ResourceGuard] Cleanup of {} after failed setup also failed: {}", failure.name, failure.message);
    }
    released_ = true;
    std::rethrow_exception(first_error);
  }

  resources_ = std::move(acquired);
  spdlog::debug("[ResourceGuard] Acquired {} resources", resources_.size());
}

ScopedResourceGuard::~ScopedResourceGuard() {
  release();
}

std::vector<ScopedResourceGuard::CleanupFailure> ScopedResourceGuard::release() {
  if (released_.exchange(true)) {
    return {};
  }
  return release_all(resources_, *diagnostics_);
}

std::vector<ScopedResourceGuard::CleanupFailure> ScopedResourceGuard::release_all(const std::vector<Resource>& resources,
                                                                                 spdlog::logger& diagnostics) {
  std::vector<CleanupFailure> failures;
  for (auto it = resources.rbegin(); it != resources.rend(); ++it) {
    if (!it->release) continue;
    try {
      it->release();
    } catch (const std::exception& e) {
      diagnostics.error("[ResourceGuard] Failed to release {}: {}", it->name, e.what());
      failures.push_back({it->name, e.what()});
    }
  }
  return failures;
}

std::unique_ptr<ScopedResourceGuard> guard_sessions(const std::vector<std::shared_ptr<ServerSession>>& sessions, const AbortSignal& abort,
                                                    std::shared_ptr<spdlog::logger> diagnostics) {
  std::vector<ScopedResourceGuard::Resource> resources;
  resources.reserve(sessions.size());
  for (const auto& session : sessions) {
    resources.push_back({session->name(),
                         [session, abort]() {
                           session->start(abort);
                         },
                         [session]() {
                           session->dispose();
                         }});
  }
  return std::make_unique<ScopedResourceGuard>(std::move(resources), std::move(diagnostics));
}

}  // namespace harness
