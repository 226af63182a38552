#include "core/message.hpp"

namespace harness {

std::string to_string(Role role) {
  switch (role) {
    case Role::System:
      return "system";
    case Role::User:
      return "user";
    case Role::Assistant:
      return "assistant";
    case Role::Tool:
      return "tool";
  }
  return "user";
}

Role role_from_string(const std::string& str) {
  if (str == "system") return Role::System;
  if (str == "user") return Role::User;
  if (str == "assistant") return Role::Assistant;
  if (str == "tool") return Role::Tool;
  return Role::User;
}

Message::Message(Role role, const std::string& content) : role_(role) {
  if (!content.empty()) {
    parts_.push_back(TextPart{content});
  }
}

Message Message::system(const std::string& content) {
  return Message(Role::System, content);
}

Message Message::user(const std::string& content) {
  return Message(Role::User, content);
}

Message Message::assistant(const std::string& content) {
  return Message(Role::Assistant, content);
}

Message Message::tool_result(const std::string& call_id, const std::string& name, const std::string& output, bool is_error) {
  Message msg(Role::Tool, "");
  msg.add_tool_result(call_id, name, output, is_error);
  msg.set_finished(true);
  return msg;
}

void Message::add_part(MessagePart part) {
  parts_.push_back(std::move(part));
}

void Message::add_text(const std::string& text) {
  parts_.push_back(TextPart{text});
}

void Message::add_tool_call(const std::string& id, const std::string& name, const json& args) {
  parts_.push_back(ToolCallPart{id, name, args});
}

void Message::add_tool_result(const std::string& call_id, const std::string& name, const std::string& output, bool is_error) {
  parts_.push_back(ToolResultPart{call_id, name, output, is_error, std::nullopt, json::object()});
}

std::string Message::text() const {
  std::string result;
  for (const auto& part : parts_) {
    if (auto* text = std::get_if<TextPart>(&part)) {
      result += text->text;
    }
  }
  return result;
}

std::vector<const ToolCallPart*> Message::tool_calls() const {
  std::vector<const ToolCallPart*> result;
  for (const auto& part : parts_) {
    if (auto* tc = std::get_if<ToolCallPart>(&part)) {
      result.push_back(tc);
    }
  }
  return result;
}

std::vector<const ToolResultPart*> Message::tool_results() const {
  std::vector<const ToolResultPart*> result;
  for (const auto& part : parts_) {
    if (auto* tr = std::get_if<ToolResultPart>(&part)) {
      result.push_back(tr);
    }
  }
  return result;
}

std::vector<ToolResultPart*> Message::tool_results() {
  std::vector<ToolResultPart*> result;
  for (auto& part : parts_) {
    if (auto* tr = std::get_if<ToolResultPart>(&part)) {
      result.push_back(tr);
    }
  }
  return result;
}

json Message::to_json() const {
  json j;
  j["id"] = id_;
  j["role"] = to_string(role_);
  j["finished"] = finished_;
  j["finish_reason"] = to_string(finish_reason_);

  json parts_json = json::array();
  for (const auto& part : parts_) {
    json part_json;
    if (auto* text = std::get_if<TextPart>(&part)) {
      part_json["type"] = "text";
      part_json["text"] = text->text;
    } else if (auto* tc = std::get_if<ToolCallPart>(&part)) {
      part_json["type"] = "tool_call";
      part_json["id"] = tc->id;
      part_json["name"] = tc->name;
      part_json["arguments"] = tc->arguments;
    } else if (auto* tr = std::get_if<ToolResultPart>(&part)) {
      part_json["type"] = "tool_result";
      part_json["tool_call_id"] = tr->tool_call_id;
      part_json["tool_name"] = tr->tool_name;
      part_json["output"] = tr->output;
      part_json["is_error"] = tr->is_error;
      if (!tr->metadata.empty()) {
        part_json["metadata"] = tr->metadata;
      }
    }
    parts_json.push_back(part_json);
  }
  j["parts"] = parts_json;

  j["usage"] = {{"input_tokens", usage_.input_tokens}, {"output_tokens", usage_.output_tokens}};

  return j;
}

json Message::to_api_format() const {
  json msg;
  msg["role"] = to_string(role_);

  for (const auto& part : parts_) {
    if (auto* tc = std::get_if<ToolCallPart>(&part)) {
      if (!msg.contains("tool_calls")) {
        msg["tool_calls"] = json::array();
      }
      msg["tool_calls"].push_back({{"id", tc->id}, {"type", "function"}, {"function", {{"name", tc->name}, {"arguments", tc->arguments.dump()}}}});
    } else if (auto* tr = std::get_if<ToolResultPart>(&part)) {
      // One tool message per result in chat-completions format
      msg["tool_call_id"] = tr->tool_call_id;
      msg["content"] = tr->output;
    }
  }

  if (!msg.contains("content")) {
    msg["content"] = text();
  }

  return msg;
}

}  // namespace harness
