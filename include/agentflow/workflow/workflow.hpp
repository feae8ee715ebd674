#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "agentflow/core/cancellation.hpp"
#include "agentflow/core/config.hpp"
#include "agentflow/core/message.hpp"
#include "agentflow/core/types.hpp"

namespace agentflow {

// Run state machine: Pending -> Running -> {Completed | Failed | TimedOut}.
// A run whose deadline fires while still queued goes Pending -> TimedOut.
enum class RunState { Pending, Running, Completed, Failed, TimedOut };

std::string to_string(RunState state);

bool is_terminal(RunState state);

// Computes a step's input from the results committed so far
// (step name -> result data) and the workflow's original data.
using InputMapping = std::function<json(const json& accumulated_results, const json& original_data)>;

// Build a mapping from declarative sources. Sources are applied in order:
// - from=original takes the original data, from=step the named step's result
// - `field` picks one key of that object
// - `as` puts the value under that key; otherwise an object is merged at top
//   level (later keys win) and any other value replaces the whole input
// Missing steps or fields contribute nothing. No sources = original data.
InputMapping make_input_mapping(const std::vector<InputSource>& sources);

namespace mapping {
// Pass the original workflow data through
InputMapping original();

// Pass the named step's result through
InputMapping step_result(const std::string& step);
}  // namespace mapping

struct WorkflowStep {
  std::string name;
  AgentId agent_id;
  std::string message_type;    // Empty = name
  InputMapping input_mapping;  // Empty = original data

  const std::string& effective_message_type() const {
    return message_type.empty() ? name : message_type;
  }
};

struct WorkflowDefinition {
  std::string type;
  std::vector<WorkflowStep> steps;

  static WorkflowDefinition from_config(const WorkflowConfig& config);

  // Distinct agent ids in step order
  std::vector<AgentId> agent_ids() const;
};

// What expire() saw: the ledger at the deadline and whether a step could be in flight
struct Expiry {
  json steps;
  bool started = false;  // Running rather than still queued
};

// One ledger entry
struct StepRecord {
  std::string step;
  ResponseStatus status = ResponseStatus::Success;
  json result;

  json to_json() const;
};

// State and ledger of a single workflow invocation. Never shared between
// invocations; the deadline and the run body meet here under one mutex.
class WorkflowRun {
 public:
  WorkflowRun(std::string workflow_type, std::string message_type);

  const RunId& id() const {
    return id_;
  }

  const std::string& workflow_type() const {
    return workflow_type_;
  }

  const std::string& message_type() const {
    return message_type_;
  }

  const CancellationToken& token() const {
    return token_;
  }

  RunState state() const;

  // Pending -> Running. False if the run already expired.
  bool begin();

  // Append a committed step. False (and dropped) unless Running.
  bool commit(StepRecord record);

  // Running -> Completed or Failed. False if the deadline got there first.
  bool finish(RunState terminal);

  // Pending|Running -> TimedOut, returning the ledger as of this instant.
  // nullopt if the run had already settled.
  std::optional<Expiry> expire();

  std::vector<StepRecord> ledger() const;

  json ledger_json() const;

  std::chrono::milliseconds elapsed() const;

 private:
  RunId id_;
  std::string workflow_type_;
  std::string message_type_;
  CancellationToken token_;
  std::chrono::steady_clock::time_point started_;

  mutable std::mutex mutex_;
  RunState state_ = RunState::Pending;
  std::vector<StepRecord> ledger_;
};

// Step names from a ledger in its JSON form ([{step, status, result}, ...]).
// Any malformation is logged with a reason code and yields an empty list.
PartialProgress extract_partial_progress(const json& steps, double timeout_seconds);

}  // namespace agentflow
