#include "core/runtime.hpp"

#include <spdlog/spdlog.h>

namespace harness {

Runtime::Runtime(size_t threads) : work_(asio::make_work_guard(io_ctx_)) {
  if (threads == 0) threads = 1;

  workers_.reserve(threads);
  for (size_t i = 0; i < threads; ++i) {
    workers_.emplace_back([this, i]() {
      spdlog::trace("[Runtime] worker {} started", i);
      io_ctx_.run();
      spdlog::trace("[Runtime] worker {} finished", i);
    });
  }
}

Runtime::~Runtime() {
  stop();
}

void Runtime::stop() {
  work_.reset();
  io_ctx_.stop();

  for (auto& worker : workers_) {
    if (!worker.joinable()) continue;
    if (worker.get_id() == std::this_thread::get_id()) {
      // Called from inside a handler: the worker unwinds once run() returns
      worker.detach();
    } else {
      worker.join();
    }
  }
}

}  // namespace harness
