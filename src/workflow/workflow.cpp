#include "agentflow/workflow/workflow.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "agentflow/core/uuid.hpp"

namespace agentflow {

std::string to_string(RunState state) {
  switch (state) {
    case RunState::Pending:
      return "pending";
    case RunState::Running:
      return "running";
    case RunState::Completed:
      return "completed";
    case RunState::Failed:
      return "failed";
    case RunState::TimedOut:
      return "timed_out";
  }
  return "unknown";
}

bool is_terminal(RunState state) {
  return state == RunState::Completed || state == RunState::Failed || state == RunState::TimedOut;
}

// ============================================================================
// Input mappings
// ============================================================================

InputMapping make_input_mapping(const std::vector<InputSource>& sources) {
  if (sources.empty()) {
    return mapping::original();
  }

  return [sources](const json& results, const json& original) -> json {
    json input = json::object();

    for (const auto& source : sources) {
      json value;
      if (source.from == InputSource::From::Original) {
        value = original;
      } else if (results.is_object() && results.contains(source.step)) {
        value = results[source.step];
      }

      if (value.is_null()) {
        continue;
      }

      if (source.field) {
        if (!value.is_object() || !value.contains(*source.field)) {
          continue;
        }
        value = value[*source.field];
      }

      if (source.as) {
        if (!input.is_object()) {
          input = json::object();
        }
        input[*source.as] = value;
      } else if (value.is_object() && input.is_object()) {
        input.update(value);
      } else {
        input = value;
      }
    }

    return input;
  };
}

namespace mapping {

InputMapping original() {
  return [](const json&, const json& original) { return original; };
}

InputMapping step_result(const std::string& step) {
  return [step](const json& results, const json&) -> json {
    if (results.is_object() && results.contains(step)) {
      return results[step];
    }
    return json::object();
  };
}

}  // namespace mapping

// ============================================================================
// WorkflowDefinition
// ============================================================================

WorkflowDefinition WorkflowDefinition::from_config(const WorkflowConfig& config) {
  WorkflowDefinition def;
  def.type = config.type;
  for (const auto& step_config : config.steps) {
    WorkflowStep step;
    step.name = step_config.name;
    step.agent_id = step_config.agent_id;
    step.message_type = step_config.message_type;
    step.input_mapping = make_input_mapping(step_config.inputs);
    def.steps.push_back(std::move(step));
  }
  return def;
}

std::vector<AgentId> WorkflowDefinition::agent_ids() const {
  std::vector<AgentId> ids;
  for (const auto& step : steps) {
    if (std::find(ids.begin(), ids.end(), step.agent_id) == ids.end()) {
      ids.push_back(step.agent_id);
    }
  }
  return ids;
}

json StepRecord::to_json() const {
  return {{"step", step}, {"status", to_string(status)}, {"result", result}};
}

// ============================================================================
// WorkflowRun
// ============================================================================

WorkflowRun::WorkflowRun(std::string workflow_type, std::string message_type)
    : id_(UUID::run_id()),
      workflow_type_(std::move(workflow_type)),
      message_type_(std::move(message_type)),
      started_(std::chrono::steady_clock::now()) {}

RunState WorkflowRun::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

bool WorkflowRun::begin() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != RunState::Pending) {
    return false;
  }
  state_ = RunState::Running;
  return true;
}

bool WorkflowRun::commit(StepRecord record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != RunState::Running) {
    return false;
  }
  ledger_.push_back(std::move(record));
  return true;
}

bool WorkflowRun::finish(RunState terminal) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != RunState::Running) {
    return false;
  }
  state_ = terminal;
  return true;
}

std::optional<Expiry> WorkflowRun::expire() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (is_terminal(state_)) {
    return std::nullopt;
  }

  Expiry expiry;
  expiry.started = state_ == RunState::Running;
  expiry.steps = json::array();
  for (const auto& record : ledger_) {
    expiry.steps.push_back(record.to_json());
  }
  state_ = RunState::TimedOut;
  return expiry;
}

std::vector<StepRecord> WorkflowRun::ledger() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ledger_;
}

json WorkflowRun::ledger_json() const {
  std::lock_guard<std::mutex> lock(mutex_);
  json steps = json::array();
  for (const auto& record : ledger_) {
    steps.push_back(record.to_json());
  }
  return steps;
}

std::chrono::milliseconds WorkflowRun::elapsed() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_);
}

// ============================================================================
// Partial progress
// ============================================================================

namespace {

PartialProgress empty_progress(double timeout_seconds, const std::string& reason, const std::string& detail) {
  json event = {{"event", "partial_progress_anomaly"}, {"reason", reason}, {"detail", detail}};
  spdlog::warn("[Workflow] {}", event.dump());

  PartialProgress progress;
  progress.timeout_seconds = timeout_seconds;
  return progress;
}

}  // namespace

PartialProgress extract_partial_progress(const json& steps, double timeout_seconds) {
  if (!steps.is_array()) {
    return empty_progress(timeout_seconds, "ledger_not_array", std::string("ledger is ") + steps.type_name());
  }

  PartialProgress progress;
  progress.timeout_seconds = timeout_seconds;

  for (size_t i = 0; i < steps.size(); ++i) {
    const auto& entry = steps[i];
    if (!entry.is_object()) {
      return empty_progress(timeout_seconds, "step_entry_not_object", "entry " + std::to_string(i));
    }
    if (!entry.contains("step")) {
      return empty_progress(timeout_seconds, "step_name_missing", "entry " + std::to_string(i));
    }
    if (!entry["step"].is_string()) {
      return empty_progress(timeout_seconds, "step_name_not_string", "entry " + std::to_string(i));
    }
    progress.completed_steps.push_back(entry["step"].get<std::string>());
  }

  progress.total_steps_completed = static_cast<int64_t>(progress.completed_steps.size());
  return progress;
}

}  // namespace agentflow
