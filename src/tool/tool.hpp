#pragma once

#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace harness {

// Tool execution context
struct ToolContext {
  std::string exchange_id;
  std::string tool_call_id;

  // Abort signal of the owning exchange
  AbortSignal abort_signal;
};

// Tool execution result
struct ToolResult {
  std::string output;
  std::optional<std::string> title;
  json metadata;
  bool is_error = false;

  // Factory methods
  static ToolResult success(const std::string& output) {
    return ToolResult{output, std::nullopt, json::object(), false};
  }

  static ToolResult error(const std::string& message) {
    return ToolResult{message, std::nullopt, json::object(), true};
  }

  static ToolResult with_title(const std::string& output, const std::string& title) {
    return ToolResult{output, title, json::object(), false};
  }
};

// Parameter schema (simplified JSON Schema)
struct ParameterSchema {
  std::string name;
  std::string type;  // "string", "number", "integer", "boolean", "object", "array"
  std::string description;
  bool required = true;
  std::optional<json> default_value;
  std::optional<std::vector<std::string>> enum_values;

  json to_json_schema() const;
};

// Tool definition
class Tool {
 public:
  virtual ~Tool() = default;

  // Tool identification
  virtual std::string id() const = 0;

  virtual std::string description() const = 0;

  // Parameter schema
  virtual std::vector<ParameterSchema> parameters() const = 0;

  // Execution
  virtual std::future<ToolResult> execute(const json& args, const ToolContext& ctx) = 0;

  // Generate JSON Schema for tool
  json to_json_schema() const;

  // Arguments must be an object carrying every required parameter with the declared type
  Result<json> validate_args(const json& args) const;
};

// Base class for simpler tool implementation
class SimpleTool : public Tool {
 public:
  SimpleTool(std::string id, std::string description);

  std::string id() const override {
    return id_;
  }

  std::string description() const override {
    return description_;
  }

 protected:
  std::string id_;
  std::string description_;
};

// Tool backed by a callable, run synchronously on the caller's thread
class FunctionTool : public SimpleTool {
 public:
  using Handler = std::function<ToolResult(const json& args, const ToolContext& ctx)>;

  FunctionTool(std::string id, std::string description, std::vector<ParameterSchema> parameters, Handler handler);

  std::vector<ParameterSchema> parameters() const override {
    return parameters_;
  }

  std::future<ToolResult> execute(const json& args, const ToolContext& ctx) override;

 private:
  std::vector<ParameterSchema> parameters_;
  Handler handler_;
};

// Maps tool names to tools. Names are unique.
class ToolRegistry {
 public:
  ToolRegistry() = default;

  // Fails when a tool with the same name is already registered
  Result<ToolId> register_tool(std::shared_ptr<Tool> tool);

  bool unregister_tool(const std::string& id);

  // Get a tool by ID
  std::shared_ptr<Tool> get(const std::string& id) const;

  bool contains(const std::string& id) const;

  // Get all tools, ordered by name
  std::vector<std::shared_ptr<Tool>> all() const;

  // Tools whose names are listed; all tools when the list is empty
  std::vector<std::shared_ptr<Tool>> filtered(const std::vector<std::string>& allowed) const;

  std::vector<std::string> names() const;

  size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<Tool>> tools_;
};

}  // namespace harness
