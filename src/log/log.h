#ifndef HARNESS_LOG_H
#define HARNESS_LOG_H

#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace harness {

/**
 * Initialize the logging system.
 *
 * Logs rotate per start-up:
 * - the current agent_harness.log is truncated on every start
 * - the previous log is renamed to agent_harness.0.log
 * - older logs shift agent_harness.0.log -> agent_harness.1.log -> ... up to max_files
 * - the oldest one is removed
 *
 * @param log_path  log file path (default ~/.config/agent-harness/log/agent_harness.log)
 * @param max_files number of rotated logs to keep
 * @param level     trace | debug | info | warn | err | critical | off
 */
void init_log(const std::string& log_path = "", size_t max_files = 10, const std::string& level = "info");

/**
 * Default logger.
 */
std::shared_ptr<spdlog::logger> get_logger();

/**
 * Logger without sinks. Used where no diagnostic sink was injected.
 */
std::shared_ptr<spdlog::logger> null_logger();

}  // namespace harness

#endif  // HARNESS_LOG_H
