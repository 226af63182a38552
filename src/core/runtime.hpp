#pragma once

#include <asio.hpp>
#include <optional>
#include <thread>
#include <vector>

namespace harness {

// Small worker pool that runs an io_context on a fixed number of threads.
// Asynchronous loops (stderr drains) are scheduled on it.
class Runtime {
 public:
  explicit Runtime(size_t threads = 2);

  ~Runtime();

  Runtime(const Runtime&) = delete;
  Runtime& operator=(const Runtime&) = delete;

  asio::io_context& io_context() {
    return io_ctx_;
  }

  size_t thread_count() const {
    return workers_.size();
  }

  // Stop accepting work and join all workers. Safe to call more than once.
  void stop();

 private:
  asio::io_context io_ctx_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::vector<std::thread> workers_;
};

}  // namespace harness
