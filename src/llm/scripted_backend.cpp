#include "llm/scripted_backend.hpp"

#include <spdlog/spdlog.h>

namespace harness::llm {

namespace {

constexpr auto kCancelPoll = std::chrono::milliseconds(5);

}  // namespace

ScriptedBackend::ScriptedBackend(std::vector<StreamEvent> events, std::chrono::milliseconds delay) : events_(std::move(events)), delay_(delay) {}

ScriptedBackend::~ScriptedBackend() {
  cancel();
  join();
}

void ScriptedBackend::stream(const ChatRequest& request, StreamCallback callback, std::function<void()> on_complete) {
  join();

  std::vector<StreamEvent> events;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    last_request_ = request;
    events = events_;
  }
  cancelled_ = false;
  stream_count_++;

  spdlog::debug("[ScriptedBackend] Replaying {} events", events.size());

  worker_ = std::thread([this, events = std::move(events), callback = std::move(callback), on_complete = std::move(on_complete)]() {
    for (const auto& event : events) {
      // Sleep in slices so cancel() is honoured promptly
      auto deadline = std::chrono::steady_clock::now() + delay_;
      while (!cancelled_ && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(kCancelPoll, deadline - std::chrono::steady_clock::now()));
      }
      if (cancelled_) {
        spdlog::debug("[ScriptedBackend] Replay cancelled");
        break;
      }
      callback(event);
    }
    if (on_complete) {
      on_complete();
    }
  });
}

void ScriptedBackend::cancel() {
  cancelled_ = true;
}

void ScriptedBackend::set_events(std::vector<StreamEvent> events) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_ = std::move(events);
}

std::optional<ChatRequest> ScriptedBackend::last_request() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_request_;
}

void ScriptedBackend::join() {
  if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
    worker_.join();
  }
}

}  // namespace harness::llm
