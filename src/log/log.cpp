#include "log/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

#include "agentflow/core/config.hpp"

namespace agentflow {

namespace {

// Rotate log files once per startup
// agentflow.log -> agentflow.0.log -> ... -> agentflow.{max_files-1}.log
void rotate_logs_on_startup(const std::filesystem::path& log_dir, const std::string& stem, size_t max_files) {
  namespace fs = std::filesystem;

  if (max_files == 0) {
    return;
  }

  fs::path current_log = log_dir / (stem + ".log");
  if (!fs::exists(current_log)) {
    return;
  }

  std::error_code ec;

  // Drop the oldest
  fs::path oldest = log_dir / (stem + "." + std::to_string(max_files - 1) + ".log");
  if (fs::exists(oldest)) {
    fs::remove(oldest, ec);
  }

  for (int i = static_cast<int>(max_files) - 2; i >= 0; --i) {
    fs::path old_name = log_dir / (stem + "." + std::to_string(i) + ".log");
    fs::path new_name = log_dir / (stem + "." + std::to_string(i + 1) + ".log");
    if (fs::exists(old_name)) {
      fs::rename(old_name, new_name, ec);
    }
  }

  fs::rename(current_log, log_dir / (stem + ".0.log"), ec);
  if (ec) {
    std::cerr << "Failed to rotate " << current_log << ": " << ec.message() << "\n";
  }
}

}  // namespace

spdlog::level::level_enum parse_level(const std::string& level) {
  if (level == "trace") return spdlog::level::trace;
  if (level == "debug") return spdlog::level::debug;
  if (level == "info") return spdlog::level::info;
  if (level == "warn" || level == "warning") return spdlog::level::warn;
  if (level == "err" || level == "error") return spdlog::level::err;
  if (level == "critical") return spdlog::level::critical;
  if (level == "off") return spdlog::level::off;
  return spdlog::level::info;
}

void init_log(const std::string& log_path, size_t max_files, const std::string& level) {
  try {
    namespace fs = std::filesystem;

    fs::path log_dir;
    fs::path actual_path;

    if (log_path.empty()) {
      log_dir = config_paths::config_dir() / "log";
      actual_path = log_dir / "agentflow.log";
    } else {
      actual_path = log_path;
      log_dir = actual_path.parent_path();
    }

    std::error_code ec;
    if (!log_dir.empty()) {
      fs::create_directories(log_dir, ec);
      if (ec) {
        std::cerr << "Failed to create log directory: " << ec.message() << "\n";
      }
    }

    rotate_logs_on_startup(log_dir, actual_path.stem().string(), max_files);

    // truncate = true: every startup gets a clean file
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(actual_path.string(), true);
    auto logger = std::make_shared<spdlog::logger>("agentflow", file_sink);

    logger->set_level(parse_level(level));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");

    // Flush every record
    logger->flush_on(spdlog::level::trace);

    spdlog::drop("agentflow");
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    spdlog::info("=== agentflow started (log: {}) ===", actual_path.string());
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
  }
}

void init_log(const Config& config) {
  init_log(config.log_file ? config.log_file->string() : "", 10, config.log_level);
}

std::shared_ptr<spdlog::logger> get_logger() {
  return spdlog::default_logger();
}

}  // namespace agentflow
