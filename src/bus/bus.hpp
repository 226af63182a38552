#pragma once

#include <algorithm>
#include <any>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <typeindex>
#include <vector>

namespace harness {

// Type-safe event bus for internal notifications
class Bus {
 public:
  using SubscriptionId = uint64_t;

  static Bus& instance();

  // Subscribe to events of type T
  template <typename T>
  SubscriptionId subscribe(std::function<void(const T&)> handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = next_id_++;
    auto type_idx = std::type_index(typeid(T));

    handlers_[type_idx].push_back({id, [handler](const std::any& event) {
                                     handler(std::any_cast<const T&>(event));
                                   }});

    return id;
  }

  void unsubscribe(SubscriptionId id);

  template <typename T>
  void publish(const T& event) {
    std::vector<std::function<void(const std::any&)>> to_call;

    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = handlers_.find(std::type_index(typeid(T)));
      if (it != handlers_.end()) {
        for (const auto& entry : it->second) {
          to_call.push_back(entry.handler);
        }
      }
    }

    // Handlers run outside the lock so they may subscribe or publish
    std::any wrapped = event;
    for (const auto& handler : to_call) {
      handler(wrapped);
    }
  }

 private:
  Bus() = default;

  struct HandlerEntry {
    SubscriptionId id;
    std::function<void(const std::any&)> handler;
  };

  std::mutex mutex_;
  SubscriptionId next_id_ = 1;
  std::map<std::type_index, std::vector<HandlerEntry>> handlers_;
};

// Unsubscribes on scope exit
class ScopedSubscription {
 public:
  ScopedSubscription() = default;

  explicit ScopedSubscription(Bus::SubscriptionId id) : id_(id) {}

  ~ScopedSubscription() {
    reset();
  }

  ScopedSubscription(ScopedSubscription&& other) noexcept : id_(other.id_) {
    other.id_ = 0;
  }

  ScopedSubscription& operator=(ScopedSubscription&& other) noexcept {
    if (this != &other) {
      reset();
      id_ = other.id_;
      other.id_ = 0;
    }
    return *this;
  }

  ScopedSubscription(const ScopedSubscription&) = delete;
  ScopedSubscription& operator=(const ScopedSubscription&) = delete;

  void reset() {
    if (id_ != 0) {
      Bus::instance().unsubscribe(id_);
      id_ = 0;
    }
  }

 private:
  Bus::SubscriptionId id_ = 0;
};

// Common events
namespace events {

struct ServerStateChanged {
  std::string session_id;
  std::string from;
  std::string to;
};

struct ProcessStarted {
  int pid;
  std::string command;
};

// A termination sequence was sent to a process group
struct ProcessSignalled {
  int pid;
  bool forced;  // SIGKILL was needed
};

struct ProcessExited {
  int pid;
  int exit_code;
};

struct StderrLine {
  int pid;
  std::string line;
};

struct DisposalFailed {
  std::string session_id;
  std::string step;
  std::string reason;
};

struct ToolCallStarted {
  std::string exchange_id;
  std::string tool_call_id;
  std::string tool_name;
};

struct ToolCallCompleted {
  std::string exchange_id;
  std::string tool_call_id;
  std::string tool_name;
  bool success;
};

struct StreamDelta {
  std::string exchange_id;
  uint64_t sequence;
  std::string text;
};

}  // namespace events

}  // namespace harness
