#ifndef AGENTFLOW_LOG_H
#define AGENTFLOW_LOG_H

#include <memory>
#include <string>

#include <spdlog/common.h>

namespace spdlog {
class logger;
}

namespace agentflow {

struct Config;

/**
 * Initialise logging
 *
 * Rotation happens once per startup:
 * - the previous agentflow.log becomes agentflow.0.log
 * - agentflow.0.log -> agentflow.1.log -> ... -> agentflow.{max_files-1}.log
 * - the oldest file is deleted
 *
 * @param log_path  log file path (default ~/.config/agentflow/log/agentflow.log)
 * @param max_files number of rotated files to keep
 * @param level     trace/debug/info/warn/err/critical/off
 */
void init_log(const std::string& log_path = "", size_t max_files = 10, const std::string& level = "info");

// Initialise from Config::log_file / Config::log_level
void init_log(const Config& config);

// Unknown names map to info
spdlog::level::level_enum parse_level(const std::string& level);

/**
 * Default logger
 */
std::shared_ptr<spdlog::logger> get_logger();

}  // namespace agentflow

#endif  // AGENTFLOW_LOG_H
