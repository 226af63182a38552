#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "llm/backend.hpp"

namespace harness::llm {

// Replays a fixed list of events on a background thread. Stands in for a real
// model in examples and tests.
class ScriptedBackend : public ChatBackend {
 public:
  explicit ScriptedBackend(std::vector<StreamEvent> events, std::chrono::milliseconds delay = std::chrono::milliseconds(0));

  ~ScriptedBackend() override;

  std::string name() const override {
    return "scripted";
  }

  void stream(const ChatRequest& request, StreamCallback callback, std::function<void()> on_complete) override;

  void cancel() override;

  // Replace the events used by the next stream() call
  void set_events(std::vector<StreamEvent> events);

  std::optional<ChatRequest> last_request() const;

  size_t stream_count() const {
    return stream_count_.load();
  }

  bool was_cancelled() const {
    return cancelled_.load();
  }

 private:
  void join();

  mutable std::mutex mutex_;
  std::vector<StreamEvent> events_;
  std::chrono::milliseconds delay_;
  std::optional<ChatRequest> last_request_;

  std::thread worker_;
  std::atomic<bool> cancelled_{false};
  std::atomic<size_t> stream_count_{0};
};

}  // namespace harness::llm
