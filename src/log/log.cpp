#include "log/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

#include "core/config.hpp"

namespace harness {

namespace {

// Rotate on start-up: agent_harness.log -> agent_harness.0.log -> ... (oldest removed)
void rotate_logs_on_startup(const std::filesystem::path& log_dir, size_t max_files) {
  namespace fs = std::filesystem;

  std::error_code ec;
  fs::create_directories(log_dir, ec);
  if (ec) {
    std::cerr << "Failed to create log directory: " << ec.message() << "\n";
    return;
  }

  fs::path current_log = log_dir / "agent_harness.log";
  if (!fs::exists(current_log) || max_files == 0) {
    return;
  }

  fs::path oldest = log_dir / ("agent_harness." + std::to_string(max_files - 1) + ".log");
  if (fs::exists(oldest)) {
    fs::remove(oldest, ec);
  }

  for (int i = static_cast<int>(max_files) - 2; i >= 0; --i) {
    fs::path old_name = log_dir / ("agent_harness." + std::to_string(i) + ".log");
    fs::path new_name = log_dir / ("agent_harness." + std::to_string(i + 1) + ".log");
    if (fs::exists(old_name)) {
      fs::rename(old_name, new_name, ec);
    }
  }

  fs::rename(current_log, log_dir / "agent_harness.0.log", ec);
}

}  // namespace

void init_log(const std::string& log_path, size_t max_files, const std::string& level) {
  try {
    namespace fs = std::filesystem;

    fs::path log_dir;
    fs::path actual_path;

    if (log_path.empty()) {
      log_dir = config_paths::config_dir() / "log";
      actual_path = log_dir / "agent_harness.log";
    } else {
      actual_path = log_path;
      log_dir = actual_path.parent_path();
    }

    std::error_code ec;
    fs::create_directories(log_dir, ec);

    rotate_logs_on_startup(log_dir, max_files);

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(actual_path.string(), true);
    auto logger = std::make_shared<spdlog::logger>("agent_harness", file_sink);

    logger->set_level(spdlog::level::from_str(level));

    // [time] [level] [thread] message
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");

    // Flush every record; child process diagnostics must not sit in a buffer
    logger->flush_on(spdlog::level::trace);

    spdlog::drop("agent_harness");
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    spdlog::info("=== agent_harness started (log: {}) ===", actual_path.string());
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
  }
}

std::shared_ptr<spdlog::logger> get_logger() {
  return spdlog::default_logger();
}

std::shared_ptr<spdlog::logger> null_logger() {
  static auto logger = std::make_shared<spdlog::logger>("null");
  return logger;
}

}  // namespace harness
