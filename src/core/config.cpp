#include "core/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

#include "core/error.hpp"

namespace harness {

namespace fs = std::filesystem;

Config Config::load(const fs::path& path) {
  Config config;

  if (!fs::exists(path)) {
    return config;
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    throw HarnessError(ErrorKind::ConfigError, "Cannot open config file: " + path.string());
  }

  try {
    json j = json::parse(file);

    if (j.contains("agent")) {
      const auto& agent_json = j["agent"];
      config.agent.model = agent_json.value("model", config.agent.model);
      config.agent.system_prompt = agent_json.value("system_prompt", config.agent.system_prompt);
    }

    if (j.contains("servers")) {
      for (const auto& server_json : j["servers"]) {
        ServerConfig server;
        server.name = server_json.value("name", "");
        server.command = server_json.value("command", "");
        server.enabled = server_json.value("enabled", true);

        if (server_json.contains("args")) {
          for (const auto& arg : server_json["args"]) {
            server.args.push_back(arg.get<std::string>());
          }
        }
        if (server_json.contains("env")) {
          for (auto& [k, v] : server_json["env"].items()) {
            server.env[k] = v.get<std::string>();
          }
        }
        if (server_json.contains("working_dir")) {
          server.working_dir = server_json["working_dir"].get<std::string>();
        }

        if (server.command.empty()) {
          throw HarnessError(ErrorKind::ConfigError, "Server '" + server.name + "' has no command");
        }

        config.servers.push_back(server);
      }
    }

    if (j.contains("process")) {
      const auto& proc = j["process"];
      config.process.kill_timeout = std::chrono::milliseconds(proc.value("kill_timeout_ms", 2000));
      config.process.drain_timeout = std::chrono::milliseconds(proc.value("drain_timeout_ms", 500));
    }

    config.worker_threads = j.value("worker_threads", static_cast<size_t>(2));

    config.log_level = j.value("log_level", "info");
    if (j.contains("log_file")) {
      config.log_file = j["log_file"].get<std::string>();
    }

  } catch (const json::exception& e) {
    spdlog::error("Failed to parse config {}: {}", path.string(), e.what());
    throw HarnessError(ErrorKind::ConfigError, "Invalid config file " + path.string() + ": " + e.what());
  }

  return config;
}

Config Config::load_default() {
  // Project config first, then global
  auto project_config = config_paths::project_config_file();
  if (fs::exists(project_config)) {
    return load(project_config);
  }

  auto global_config = config_paths::default_config_file();
  if (fs::exists(global_config)) {
    return load(global_config);
  }

  return Config{};
}

void Config::save(const fs::path& path) const {
  json j;

  j["agent"] = {{"model", agent.model}, {"system_prompt", agent.system_prompt}};

  json servers_json = json::array();
  for (const auto& server : servers) {
    json s;
    s["name"] = server.name;
    s["command"] = server.command;
    s["args"] = server.args;
    s["env"] = server.env;
    s["enabled"] = server.enabled;
    if (server.working_dir) {
      s["working_dir"] = server.working_dir->string();
    }
    servers_json.push_back(s);
  }
  j["servers"] = servers_json;

  j["process"] = {{"kill_timeout_ms", process.kill_timeout.count()}, {"drain_timeout_ms", process.drain_timeout.count()}};

  j["worker_threads"] = worker_threads;

  j["log_level"] = log_level;
  if (log_file) {
    j["log_file"] = log_file->string();
  }

  if (path.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
  }

  std::ofstream file(path);
  if (!file.is_open()) {
    throw HarnessError(ErrorKind::ConfigError, "Cannot write config file: " + path.string());
  }
  file << j.dump(2);
}

std::optional<ServerConfig> Config::get_server(const std::string& name) const {
  for (const auto& server : servers) {
    if (server.name == name) {
      return server;
    }
  }
  return std::nullopt;
}

namespace config_paths {

fs::path home_dir() {
  const char* home = std::getenv("HOME");
  if (home) {
    return fs::path(home);
  }
  return fs::current_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "agent-harness";
}

fs::path default_config_file() {
  return config_dir() / "config.json";
}

fs::path project_config_file() {
  return fs::current_path() / ".agent-harness" / "config.json";
}

}  // namespace config_paths

}  // namespace harness
