#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "core/types.hpp"
#include "core/uuid.hpp"

namespace harness {

// Message part types
struct TextPart {
  std::string text;
};

struct ToolCallPart {
  std::string id;
  std::string name;
  json arguments;
};

struct ToolResultPart {
  std::string tool_call_id;
  std::string tool_name;
  std::string output;
  bool is_error = false;

  std::optional<std::string> title;
  json metadata;
};

using MessagePart = std::variant<TextPart, ToolCallPart, ToolResultPart>;

// Message role
enum class Role { System, User, Assistant, Tool };

std::string to_string(Role role);

Role role_from_string(const std::string& str);

class Message {
 public:
  Message() = default;

  Message(Role role, const std::string& content);

  // Factory methods
  static Message system(const std::string& content);

  static Message user(const std::string& content);

  static Message assistant(const std::string& content);

  static Message tool_result(const std::string& call_id, const std::string& name, const std::string& output, bool is_error = false);

  const MessageId& id() const {
    return id_;
  }

  Role role() const {
    return role_;
  }

  const std::vector<MessagePart>& parts() const {
    return parts_;
  }

  std::vector<MessagePart>& parts() {
    return parts_;
  }

  // Completion state (assistant messages)
  bool is_finished() const {
    return finished_;
  }

  void set_finished(bool finished) {
    finished_ = finished;
  }

  FinishReason finish_reason() const {
    return finish_reason_;
  }

  void set_finish_reason(FinishReason reason) {
    finish_reason_ = reason;
  }

  const TokenUsage& usage() const {
    return usage_;
  }

  void set_usage(const TokenUsage& usage) {
    usage_ = usage;
  }

  Timestamp created_at() const {
    return created_at_;
  }

  void add_part(MessagePart part);

  void add_text(const std::string& text);

  void add_tool_call(const std::string& id, const std::string& name, const json& args);

  void add_tool_result(const std::string& call_id, const std::string& name, const std::string& output, bool is_error = false);

  // Text parts joined in order
  std::string text() const;

  std::vector<const ToolCallPart*> tool_calls() const;

  std::vector<const ToolResultPart*> tool_results() const;

  std::vector<ToolResultPart*> tool_results();

  json to_json() const;

  // Chat-completions style payload handed to a backend
  json to_api_format() const;

 private:
  MessageId id_ = UUID::generate();
  Role role_ = Role::User;
  std::vector<MessagePart> parts_;

  bool finished_ = false;
  FinishReason finish_reason_ = FinishReason::Stop;
  TokenUsage usage_;

  Timestamp created_at_ = std::chrono::system_clock::now();
};

}  // namespace harness
