#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "agentflow/core/types.hpp"

namespace agentflow {

// One contribution to a step's input. Merge rules: see make_input_mapping() in workflow.hpp.
struct InputSource {
  enum class From { Original, Step };

  From from = From::Original;
  std::string step;                 // For From::Step: the producing step
  std::optional<std::string> field; // Pick a single key of the source object
  std::optional<std::string> as;    // Place the value under this key instead of merging

  json to_json() const;
  static InputSource from_json(const json& j);
};

// Workflow step configuration
struct WorkflowStepConfig {
  std::string name;
  AgentId agent_id;
  std::string message_type;  // Empty = same as name

  // Empty = the original workflow data
  std::vector<InputSource> inputs;
};

// Workflow configuration
struct WorkflowConfig {
  std::string type;
  std::vector<WorkflowStepConfig> steps;
};

// Message broker configuration
struct BrokerConfig {
  size_t queue_capacity = 1000;
};

// Application configuration
struct Config {
  // Default bound for process_async when the caller passes none
  double default_timeout_seconds = 30.0;

  // Worker pool for deadline-bound workflow runs
  size_t worker_threads = 4;

  BrokerConfig broker;

  // Message type -> agent id
  std::map<std::string, AgentId> routing;

  // Workflow type -> definition
  std::map<std::string, WorkflowConfig> workflows;

  // Logging
  std::string log_level = "info";
  std::optional<std::filesystem::path> log_file;

  Config();

  // Load from file
  static Config load(const std::filesystem::path& path);

  // Load default config from project/global config files
  static Config load_default();

  // Load config from environment variables, with file config as base
  // Reads: AGENTFLOW_DEFAULT_TIMEOUT, AGENTFLOW_WORKER_THREADS, AGENTFLOW_QUEUE_CAPACITY,
  //        AGENTFLOW_LOG_LEVEL, AGENTFLOW_LOG_FILE
  static Config from_env();

  // Save to file
  void save(const std::filesystem::path& path) const;

  std::optional<WorkflowConfig> get_workflow(const std::string& type) const;

  std::optional<AgentId> route(const std::string& message_type) const;
};

// Built-in routing table and the project_initialization workflow
std::map<std::string, AgentId> default_routing();

WorkflowConfig project_initialization_workflow();

// Configuration paths
namespace config_paths {
std::filesystem::path home_dir();

std::filesystem::path config_dir();

std::filesystem::path default_config_file();

std::filesystem::path project_config_file();
}  // namespace config_paths

}  // namespace agentflow
