#include "agentflow/core/config.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace agentflow {

namespace fs = std::filesystem;

json InputSource::to_json() const {
  json j;
  j["from"] = from == From::Original ? "original" : "step";
  if (from == From::Step) {
    j["step"] = step;
  }
  if (field) {
    j["field"] = *field;
  }
  if (as) {
    j["as"] = *as;
  }
  return j;
}

InputSource InputSource::from_json(const json& j) {
  InputSource source;
  std::string from = j.value("from", "original");
  source.from = from == "step" ? From::Step : From::Original;
  source.step = j.value("step", "");
  if (j.contains("field") && j["field"].is_string()) {
    source.field = j["field"].get<std::string>();
  }
  if (j.contains("as") && j["as"].is_string()) {
    source.as = j["as"].get<std::string>();
  }
  return source;
}

std::map<std::string, AgentId> default_routing() {
  return {
      {"generate_plan", "project_plan_agent"},       {"update_plan", "project_plan_agent"},
      {"assess_risks", "risk_assessment_agent"},     {"update_risk", "risk_assessment_agent"},
      {"generate_report", "status_reporter_agent"},  {"schedule_report", "status_reporter_agent"},
  };
}

WorkflowConfig project_initialization_workflow() {
  WorkflowConfig wf;
  wf.type = "project_initialization";

  // Plan from the original request
  wf.steps.push_back({"generate_plan", "project_plan_agent", "generate_plan", {}});

  // Risks from the plan
  InputSource plan;
  plan.from = InputSource::From::Step;
  plan.step = "generate_plan";
  wf.steps.push_back({"assess_risks", "risk_assessment_agent", "assess_risks", {plan}});

  // Report from the plan plus the identified risks
  InputSource risks;
  risks.from = InputSource::From::Step;
  risks.step = "assess_risks";
  risks.field = "risks";
  risks.as = "risks";
  wf.steps.push_back({"generate_report", "status_reporter_agent", "generate_report", {plan, risks}});

  return wf;
}

Config::Config() : routing(default_routing()) {
  auto wf = project_initialization_workflow();
  workflows[wf.type] = wf;
}

namespace {

WorkflowConfig workflow_from_json(const std::string& type, const json& wf_json) {
  WorkflowConfig wf;
  wf.type = type;

  if (wf_json.contains("steps")) {
    for (const auto& step_json : wf_json["steps"]) {
      WorkflowStepConfig step;
      step.name = step_json.value("name", "");
      step.agent_id = step_json.value("agent_id", "");
      step.message_type = step_json.value("message_type", "");

      if (step_json.contains("inputs")) {
        for (const auto& input_json : step_json["inputs"]) {
          step.inputs.push_back(InputSource::from_json(input_json));
        }
      }

      wf.steps.push_back(step);
    }
  }

  return wf;
}

json workflow_to_json(const WorkflowConfig& wf) {
  json steps = json::array();
  for (const auto& step : wf.steps) {
    json s;
    s["name"] = step.name;
    s["agent_id"] = step.agent_id;
    if (!step.message_type.empty()) {
      s["message_type"] = step.message_type;
    }

    json inputs = json::array();
    for (const auto& input : step.inputs) {
      inputs.push_back(input.to_json());
    }
    s["inputs"] = inputs;

    steps.push_back(s);
  }
  return {{"steps", steps}};
}

// Finite, non-negative and representable as T
template <typename T>
bool in_range(double value) {
  if (!std::isfinite(value) || value < 0) {
    return false;
  }
  if constexpr (std::is_integral_v<T>) {
    return value < static_cast<double>(std::numeric_limits<T>::max());
  } else {
    return value <= static_cast<double>(std::numeric_limits<T>::max());
  }
}

// Parse a non-negative number from an environment variable
template <typename T>
std::optional<T> env_number(const char* name) {
  const char* raw = std::getenv(name);
  if (!raw) {
    return std::nullopt;
  }

  try {
    size_t pos = 0;
    double value = std::stod(raw, &pos);
    if (pos != std::string(raw).size() || !in_range<T>(value)) {
      throw std::invalid_argument("not a non-negative number in range");
    }
    return static_cast<T>(value);
  } catch (const std::exception& e) {
    spdlog::warn("[Config] Ignoring {}={}: {}", name, raw, e.what());
    return std::nullopt;
  }
}

}  // namespace

Config Config::load(const fs::path& path) {
  Config config;

  if (!fs::exists(path)) {
    return config;
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::warn("[Config] Cannot open {}", path.string());
    return config;
  }

  try {
    json j = json::parse(file);

    double timeout = j.value("default_timeout_seconds", config.default_timeout_seconds);
    if (in_range<double>(timeout)) {
      config.default_timeout_seconds = timeout;
    } else {
      spdlog::warn("[Config] Ignoring default_timeout_seconds={} in {}", timeout, path.string());
    }

    if (j.contains("worker_threads")) {
      if (j["worker_threads"].is_number_unsigned()) {
        config.worker_threads = j["worker_threads"].get<size_t>();
      } else {
        spdlog::warn("[Config] Ignoring worker_threads={} in {}", j["worker_threads"].dump(), path.string());
      }
    }

    // Load broker settings
    if (j.contains("broker") && j["broker"].contains("queue_capacity")) {
      const auto& capacity = j["broker"]["queue_capacity"];
      if (capacity.is_number_unsigned()) {
        config.broker.queue_capacity = capacity.get<size_t>();
      } else {
        spdlog::warn("[Config] Ignoring broker.queue_capacity={} in {}", capacity.dump(), path.string());
      }
    }

    // Load routing rules (merged over the built-in table)
    if (j.contains("routing")) {
      for (auto& [type, agent_id] : j["routing"].items()) {
        config.routing[type] = agent_id.get<std::string>();
      }
    }

    // Load workflows (a same-named workflow replaces the built-in one)
    if (j.contains("workflows")) {
      for (auto& [type, wf_json] : j["workflows"].items()) {
        config.workflows[type] = workflow_from_json(type, wf_json);
      }
    }

    config.log_level = j.value("log_level", "info");
    if (j.contains("log_file")) {
      config.log_file = j["log_file"].get<std::string>();
    }

  } catch (const std::exception& e) {
    spdlog::error("[Config] Failed to load {}: {}", path.string(), e.what());
    return Config{};
  }

  spdlog::debug("[Config] Loaded {}", path.string());
  return config;
}

Config Config::load_default() {
  // Try to load from project config first, then global
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

Config Config::from_env() {
  Config config = load_default();

  if (auto timeout = env_number<double>("AGENTFLOW_DEFAULT_TIMEOUT")) {
    config.default_timeout_seconds = *timeout;
  }
  if (auto threads = env_number<size_t>("AGENTFLOW_WORKER_THREADS")) {
    config.worker_threads = *threads;
  }
  if (auto capacity = env_number<size_t>("AGENTFLOW_QUEUE_CAPACITY")) {
    config.broker.queue_capacity = *capacity;
  }

  if (const char* level = std::getenv("AGENTFLOW_LOG_LEVEL")) {
    config.log_level = level;
  }
  if (const char* log_file = std::getenv("AGENTFLOW_LOG_FILE")) {
    config.log_file = fs::path(log_file);
  }

  return config;
}

void Config::save(const fs::path& path) const {
  json j;

  j["default_timeout_seconds"] = default_timeout_seconds;
  j["worker_threads"] = worker_threads;
  j["broker"] = {{"queue_capacity", broker.queue_capacity}};
  j["routing"] = routing;

  json workflows_json = json::object();
  for (const auto& [type, wf] : workflows) {
    workflows_json[type] = workflow_to_json(wf);
  }
  j["workflows"] = workflows_json;

  j["log_level"] = log_level;
  if (log_file) {
    j["log_file"] = log_file->string();
  }

  // Write to file
  std::ofstream file(path);
  if (!file.is_open()) {
    spdlog::error("[Config] Cannot write {}", path.string());
    return;
  }
  file << j.dump(2);
}

std::optional<WorkflowConfig> Config::get_workflow(const std::string& type) const {
  auto it = workflows.find(type);
  if (it != workflows.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::optional<AgentId> Config::route(const std::string& message_type) const {
  auto it = routing.find(message_type);
  if (it != routing.end()) {
    return it->second;
  }
  return std::nullopt;
}

namespace config_paths {

fs::path home_dir() {
  const char* home = std::getenv("HOME");
  if (home) {
    return fs::path(home);
  }
#ifdef _WIN32
  const char* userprofile = std::getenv("USERPROFILE");
  if (userprofile) {
    return fs::path(userprofile);
  }
#endif
  return fs::current_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "agentflow";
}

fs::path default_config_file() {
  return config_dir() / "config.json";
}

fs::path project_config_file() {
  return fs::current_path() / ".agentflow" / "config.json";
}

}  // namespace config_paths

}  // namespace agentflow
