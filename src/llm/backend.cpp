#include "llm/backend.hpp"

namespace harness::llm {

json ChatRequest::to_json() const {
  json request;
  request["model"] = model;
  request["stream"] = true;

  if (temperature) {
    request["temperature"] = *temperature;
  }

  if (max_tokens) {
    request["max_tokens"] = *max_tokens;
  }

  json msgs = json::array();
  for (const auto& msg : messages) {
    if (msg.role() == Role::Tool) {
      // One tool message per result
      for (const auto* result : msg.tool_results()) {
        msgs.push_back({{"role", "tool"}, {"tool_call_id", result->tool_call_id}, {"content", result->output}});
      }
      continue;
    }
    msgs.push_back(msg.to_api_format());
  }
  request["messages"] = msgs;

  if (!tools.empty()) {
    json tools_json = json::array();
    for (const auto& tool : tools) {
      auto schema = tool->to_json_schema();
      tools_json.push_back({{"type", "function"},
                            {"function", {{"name", schema["name"]}, {"description", schema["description"]}, {"parameters", schema["input_schema"]}}}});
    }
    request["tools"] = tools_json;
  }

  return request;
}

}  // namespace harness::llm
