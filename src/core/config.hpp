#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace harness {

// Agent configuration
struct AgentConfig {
  std::string model = "gpt-4o";
  std::string system_prompt = "You are a helpful assistant. Use the available tools when they help answer the user.";
};

// A stdio server the agent launches as a child process
struct ServerConfig {
  std::string name;
  std::string command;
  std::vector<std::string> args;
  std::map<std::string, std::string> env;
  std::optional<std::filesystem::path> working_dir;
  bool enabled = true;
};

// Child process supervision settings
struct ProcessSettings {
  // Grace period between SIGTERM and SIGKILL
  std::chrono::milliseconds kill_timeout{2000};
  // How long kill/dispose waits for the stderr drain to reach end of stream
  std::chrono::milliseconds drain_timeout{500};
};

// Application configuration
struct Config {
  AgentConfig agent;

  std::vector<ServerConfig> servers;

  ProcessSettings process;

  // Worker threads for the asynchronous runtime
  size_t worker_threads = 2;

  // Logging
  std::string log_level = "info";
  std::optional<std::filesystem::path> log_file;

  // Load from file. A missing file yields the defaults; a malformed one throws HarnessError(ConfigError).
  static Config load(const std::filesystem::path& path);

  static Config load_default();

  void save(const std::filesystem::path& path) const;

  std::optional<ServerConfig> get_server(const std::string& name) const;
};

// Configuration paths
namespace config_paths {
std::filesystem::path home_dir();

std::filesystem::path config_dir();

std::filesystem::path default_config_file();

std::filesystem::path project_config_file();
}  // namespace config_paths

}  // namespace harness
