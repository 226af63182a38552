#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace spdlog {
class logger;
}

namespace harness {

class ServerSession;

// Pairs setup with cleanup over a scope.
//
// All resources are acquired concurrently by the constructor. If any
// acquisition throws, the ones that succeeded are released and the first
// acquisition error propagates unchanged. Otherwise cleanup runs exactly once,
// in reverse order, from release() or the destructor.
class ScopedResourceGuard {
 public:
  struct Resource {
    std::string name;
    std::function<void()> acquire;
    std::function<void()> release;
  };

  struct CleanupFailure {
    std::string name;
    std::string message;
  };

  explicit ScopedResourceGuard(std::vector<Resource> resources, std::shared_ptr<spdlog::logger> diagnostics = nullptr);

  ~ScopedResourceGuard();

  ScopedResourceGuard(const ScopedResourceGuard&) = delete;
  ScopedResourceGuard& operator=(const ScopedResourceGuard&) = delete;

  // Run every cleanup step even when earlier ones fail. Returns the failures;
  // calls after the first return an empty list.
  std::vector<CleanupFailure> release();

  bool released() const {
    return released_.load();
  }

  size_t size() const {
    return resources_.size();
  }

 private:
  static std::vector<CleanupFailure> release_all(const std::vector<Resource>& resources, spdlog::logger& diagnostics);

  std::vector<Resource> resources_;
  std::shared_ptr<spdlog::logger> diagnostics_;
  std::atomic<bool> released_{false};
};

// Start every session on entry and dispose all of them on scope exit
std::unique_ptr<ScopedResourceGuard> guard_sessions(const std::vector<std::shared_ptr<ServerSession>>& sessions,
                                                    const AbortSignal& abort = nullptr,
                                                    std::shared_ptr<spdlog::logger> diagnostics = nullptr);

}  // namespace harness
