#include "tool/tool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace harness {

namespace {

bool matches_type(const json& value, const std::string& type) {
  if (type == "string") return value.is_string();
  if (type == "number") return value.is_number();
  if (type == "integer") return value.is_number_integer();
  if (type == "boolean") return value.is_boolean();
  if (type == "object") return value.is_object();
  if (type == "array") return value.is_array();
  return true;
}

}  // namespace

// Parameter schema to JSON
json ParameterSchema::to_json_schema() const {
  json schema;
  schema["type"] = type;
  schema["description"] = description;

  if (default_value) {
    schema["default"] = *default_value;
  }

  if (enum_values && !enum_values->empty()) {
    schema["enum"] = *enum_values;
  }

  return schema;
}

// Tool to JSON schema
json Tool::to_json_schema() const {
  json schema;
  schema["name"] = id();
  schema["description"] = description();

  json properties = json::object();
  json required_props = json::array();

  for (const auto& param : parameters()) {
    properties[param.name] = param.to_json_schema();
    if (param.required) {
      required_props.push_back(param.name);
    }
  }

  schema["input_schema"] = {{"type", "object"}, {"properties", properties}, {"required", required_props}};

  return schema;
}

Result<json> Tool::validate_args(const json& args) const {
  if (!args.is_object()) {
    return Result<json>::failure("Arguments must be an object");
  }

  json validated = args;
  for (const auto& param : parameters()) {
    auto it = args.find(param.name);
    if (it == args.end()) {
      if (param.required) {
        return Result<json>::failure("Missing required parameter: " + param.name);
      }
      if (param.default_value) {
        validated[param.name] = *param.default_value;
      }
      continue;
    }

    if (!matches_type(*it, param.type)) {
      return Result<json>::failure("Parameter " + param.name + " must be of type " + param.type);
    }

    if (param.enum_values && !param.enum_values->empty() && it->is_string()) {
      const auto& allowed = *param.enum_values;
      if (std::find(allowed.begin(), allowed.end(), it->get<std::string>()) == allowed.end()) {
        return Result<json>::failure("Parameter " + param.name + " has unsupported value: " + it->get<std::string>());
      }
    }
  }

  return Result<json>::success(validated);
}

// SimpleTool implementation
SimpleTool::SimpleTool(std::string id, std::string description) : id_(std::move(id)), description_(std::move(description)) {}

// FunctionTool implementation
FunctionTool::FunctionTool(std::string id, std::string description, std::vector<ParameterSchema> parameters, Handler handler)
    : SimpleTool(std::move(id), std::move(description)), parameters_(std::move(parameters)), handler_(std::move(handler)) {}

std::future<ToolResult> FunctionTool::execute(const json& args, const ToolContext& ctx) {
  std::promise<ToolResult> promise;
  try {
    promise.set_value(handler_(args, ctx));
  } catch (...) {
    promise.set_exception(std::current_exception());
  }
  return promise.get_future();
}

// Tool Registry
Result<ToolId> ToolRegistry::register_tool(std::shared_ptr<Tool> tool) {
  if (!tool) {
    return Result<ToolId>::failure("Tool is null");
  }

  auto id = tool->id();
  if (id.empty()) {
    return Result<ToolId>::failure("Tool name is empty");
  }

  std::lock_guard lock(mutex_);
  if (tools_.count(id)) {
    return Result<ToolId>::failure("Tool already registered: " + id);
  }
  tools_[id] = std::move(tool);

  spdlog::debug("[ToolRegistry] Registered tool: {}", id);
  return Result<ToolId>::success(id);
}

bool ToolRegistry::unregister_tool(const std::string& id) {
  std::lock_guard lock(mutex_);
  return tools_.erase(id) > 0;
}

std::shared_ptr<Tool> ToolRegistry::get(const std::string& id) const {
  std::lock_guard lock(mutex_);
  auto it = tools_.find(id);
  if (it != tools_.end()) {
    return it->second;
  }
  return nullptr;
}

bool ToolRegistry::contains(const std::string& id) const {
  std::lock_guard lock(mutex_);
  return tools_.count(id) > 0;
}

std::vector<std::shared_ptr<Tool>> ToolRegistry::all() const {
  std::lock_guard lock(mutex_);
  std::vector<std::shared_ptr<Tool>> result;
  result.reserve(tools_.size());
  for (const auto& [id, tool] : tools_) {
    result.push_back(tool);
  }
  return result;
}

std::vector<std::shared_ptr<Tool>> ToolRegistry::filtered(const std::vector<std::string>& allowed) const {
  auto all_tools = all();
  if (allowed.empty()) {
    return all_tools;
  }

  std::vector<std::shared_ptr<Tool>> result;
  for (const auto& tool : all_tools) {
    if (std::find(allowed.begin(), allowed.end(), tool->id()) != allowed.end()) {
      result.push_back(tool);
    }
  }
  return result;
}

std::vector<std::string> ToolRegistry::names() const {
  std::lock_guard lock(mutex_);
  std::vector<std::string> result;
  result.reserve(tools_.size());
  for (const auto& [id, tool] : tools_) {
    result.push_back(id);
  }
  return result;
}

size_t ToolRegistry::size() const {
  std::lock_guard lock(mutex_);
  return tools_.size();
}

}  // namespace harness
