#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

#include "core/types.hpp"

namespace harness {

// Unbounded single-consumer queue. Producers push from any thread; the
// consumer pulls one item at a time with next().
template <typename T>
class EventChannel {
 public:
  enum class Status { Item, Closed, Aborted, TimedOut };

  void push(T item) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_) return;
      queue_.push_back(std::move(item));
    }
    cv_.notify_one();
  }

  // No more items will be accepted; queued ones are still delivered
  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  // Wait for the next item, end of stream, abort or timeout
  Status next(T& out, const AbortSignal& abort = nullptr, std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = timeout ? std::optional(std::chrono::steady_clock::now() + *timeout) : std::nullopt;

    while (true) {
      if (is_aborted(abort)) {
        return Status::Aborted;
      }
      if (!queue_.empty()) {
        out = std::move(queue_.front());
        queue_.pop_front();
        return Status::Item;
      }
      if (closed_) {
        return Status::Closed;
      }

      auto now = std::chrono::steady_clock::now();
      if (deadline && now >= *deadline) {
        return Status::TimedOut;
      }

      // The abort flag has no notifier, so waits are sliced
      auto wake = now + kAbortPoll;
      if (deadline && *deadline < wake) {
        wake = *deadline;
      }
      cv_.wait_until(lock, wake);
    }
  }

  size_t pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

 private:
  static constexpr std::chrono::milliseconds kAbortPoll{20};

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<T> queue_;
  bool closed_ = false;
};

}  // namespace harness
