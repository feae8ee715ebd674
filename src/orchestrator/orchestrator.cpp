#include "agentflow/orchestrator/orchestrator.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cmath>
#include <future>
#include <sstream>

namespace agentflow {

namespace {

// Legacy envelope: {"type": "workflow", "data": {"workflow_type": ..., "data": {...}}}
constexpr const char* kLegacyWorkflowType = "workflow";

std::string format_seconds(double seconds) {
  std::ostringstream ss;
  ss << seconds;
  return ss.str();
}

std::vector<std::string> step_names(const json& steps) {
  std::vector<std::string> names;
  if (!steps.is_array()) {
    return names;
  }
  for (const auto& entry : steps) {
    if (entry.is_object() && entry.contains("step") && entry["step"].is_string()) {
      names.push_back(entry["step"].get<std::string>());
    }
  }
  return names;
}

// Direct call handshake: the worker claims Queued -> Running, the deadline
// claims Queued -> Abandoned. Whoever gets there first decides.
constexpr int kCallQueued = 0;
constexpr int kCallRunning = 1;
constexpr int kCallAbandoned = 2;

// Keeps a call counted as in flight until the caller returns
class InFlight {
 public:
  explicit InFlight(std::atomic<uint64_t>& counter) : counter_(counter) {
    ++counter_;
  }

  ~InFlight() {
    --counter_;
  }

  InFlight(const InFlight&) = delete;
  InFlight& operator=(const InFlight&) = delete;

 private:
  std::atomic<uint64_t>& counter_;
};

}  // namespace

Orchestrator::Orchestrator(const Config& config, std::shared_ptr<MessageBroker> broker)
    : routing_(config.routing),
      broker_(std::move(broker)),
      default_timeout_seconds_(config.default_timeout_seconds),
      pool_(config.worker_threads == 0 ? 1 : config.worker_threads) {
  for (const auto& [type, wf] : config.workflows) {
    auto def = WorkflowDefinition::from_config(wf);
    def.type = type;
    workflows_[type] = std::make_shared<const WorkflowDefinition>(std::move(def));
  }
  spdlog::info("[Orchestrator] Initialized: {} workflow(s), {} routing rule(s), {} worker thread(s)", workflows_.size(),
               routing_.size(), config.worker_threads == 0 ? 1 : config.worker_threads);
}

Orchestrator::~Orchestrator() {
  // Drop runs that never started; wait for the ones in flight
  pool_.stop();
  pool_.join();
}

// ============================================================================
// Catalogue
// ============================================================================

void Orchestrator::register_agent(AgentPtr agent) {
  agents_.register_agent(std::move(agent));
}

bool Orchestrator::unregister_agent(const AgentId& id) {
  bool removed = agents_.unregister_agent(id);
  if (removed) {
    spdlog::info("[Orchestrator] Unregistered agent: {}", id);
  }
  return removed;
}

AgentPtr Orchestrator::get_agent(const AgentId& id) const {
  return agents_.get(id);
}

std::vector<AgentId> Orchestrator::agent_ids() const {
  return agents_.ids();
}

void Orchestrator::add_routing_rule(const std::string& message_type, const AgentId& agent_id) {
  std::unique_lock<std::shared_mutex> lock(catalog_mutex_);
  routing_[message_type] = agent_id;
  spdlog::debug("[Orchestrator] Route {} -> {}", message_type, agent_id);
}

std::map<std::string, AgentId> Orchestrator::routing_rules() const {
  std::shared_lock<std::shared_mutex> lock(catalog_mutex_);
  return routing_;
}

void Orchestrator::define_workflow(WorkflowDefinition definition) {
  auto type = definition.type;
  auto steps = definition.steps.size();
  {
    std::unique_lock<std::shared_mutex> lock(catalog_mutex_);
    workflows_[type] = std::make_shared<const WorkflowDefinition>(std::move(definition));
  }
  spdlog::info("[Orchestrator] Defined workflow: {} ({} steps)", type, steps);
}

bool Orchestrator::has_workflow(const std::string& type) const {
  std::shared_lock<std::shared_mutex> lock(catalog_mutex_);
  return workflows_.count(type) > 0;
}

std::vector<std::string> Orchestrator::workflow_types() const {
  std::shared_lock<std::shared_mutex> lock(catalog_mutex_);
  std::vector<std::string> types;
  types.reserve(workflows_.size());
  for (const auto& [type, def] : workflows_) {
    types.push_back(type);
  }
  return types;
}

// ============================================================================
// Resolution
// ============================================================================

Result<Orchestrator::Target> Orchestrator::resolve(const Message& message) const {
  if (!message.valid()) {
    return Result<Target>::failure(ErrorCode::InvalidMessage, "Invalid message format");
  }

  const auto& type = message.type();
  const auto& data = message.data();

  if (type == kLegacyWorkflowType) {
    if (!data.contains("workflow_type") || !data["workflow_type"].is_string()) {
      return Result<Target>::failure(ErrorCode::InvalidMessage, "Workflow message is missing workflow_type");
    }
    json workflow_data = data.value("data", json::object());
    if (!workflow_data.is_object()) {
      return Result<Target>::failure(ErrorCode::InvalidMessage, "Workflow data must be an object");
    }
    return resolve_workflow(data["workflow_type"].get<std::string>(), std::move(workflow_data));
  }

  std::optional<AgentId> routed;
  {
    std::shared_lock<std::shared_mutex> lock(catalog_mutex_);
    if (workflows_.count(type) > 0) {
      lock.unlock();
      return resolve_workflow(type, data);
    }
    auto it = routing_.find(type);
    if (it != routing_.end()) {
      routed = it->second;
    }
  }

  auto agent = agents_.get(routed.value_or(type));
  if (!agent) {
    return Result<Target>::failure(ErrorCode::NoSuchAgent, "No agent for message type: " + type);
  }

  Target target;
  target.agent = std::move(agent);
  return Result<Target>::success(std::move(target));
}

Result<Orchestrator::Target> Orchestrator::resolve_workflow(const std::string& type, json data) const {
  std::shared_ptr<const WorkflowDefinition> def;
  {
    std::shared_lock<std::shared_mutex> lock(catalog_mutex_);
    auto it = workflows_.find(type);
    if (it != workflows_.end()) {
      def = it->second;
    }
  }
  if (!def) {
    return Result<Target>::failure(ErrorCode::NoSuchWorkflow, "Unknown workflow type: " + type);
  }

  // Bind every step up front so a missing agent is rejected before any work
  Target target;
  for (const auto& step : def->steps) {
    auto agent = agents_.get(step.agent_id);
    if (!agent) {
      return Result<Target>::failure(ErrorCode::NoSuchAgent,
                                     "Workflow '" + type + "' step '" + step.name + "' has no agent: " + step.agent_id);
    }
    target.step_agents.push_back(std::move(agent));
  }
  target.workflow = std::move(def);
  target.workflow_data = std::move(data);
  return Result<Target>::success(std::move(target));
}

// ============================================================================
// Execution
// ============================================================================

OrchestratorStats Orchestrator::stats() const {
  OrchestratorStats s;
  s.runs_completed = runs_completed_.load();
  s.runs_failed = runs_failed_.load();
  s.runs_timed_out = runs_timed_out_.load();
  s.direct_timeouts = direct_timeouts_.load();
  s.rejected = rejected_.load();
  s.in_flight = in_flight_.load();
  return s;
}

Response Orchestrator::reject(const Message& message, const Error& error) {
  ++rejected_;
  spdlog::warn("[Orchestrator] Rejected {}: {}", message.type(), error.message);
  return Response::failure(kAgentId, error.message, error.code);
}

Response Orchestrator::process(const Message& message) {
  auto target = resolve(message);
  if (!target.ok()) {
    return reject(message, *target.error);
  }

  InFlight in_flight(in_flight_);
  if (target.value->agent) {
    return call_agent(target.value->agent, message, CancellationToken{});
  }

  WorkflowRun run(target.value->workflow->type, message.type());
  auto response = execute(run, *target.value);
  report(run, response, 0.0);
  return response;
}

Response Orchestrator::process_async(const Message& message) {
  return process_async(message, default_timeout_seconds_);
}

Response Orchestrator::process_async(const Message& message, double timeout_seconds) {
  if (std::isnan(timeout_seconds) || timeout_seconds < 0) {
    return reject(message, Error{ErrorCode::InvalidTimeout, "Timeout must be non-negative"});
  }
  if (timeout_seconds > kMaxTimeoutSeconds) {
    spdlog::warn("[Orchestrator] Timeout {}s clamped to {}s", timeout_seconds, kMaxTimeoutSeconds);
    timeout_seconds = kMaxTimeoutSeconds;
  }
  if (timeout_seconds < kShortTimeoutSeconds) {
    warn_short_timeout(message, timeout_seconds);
  }

  auto resolved = resolve(message);
  if (!resolved.ok()) {
    return reject(message, *resolved.error);
  }
  InFlight in_flight(in_flight_);
  auto target = std::make_shared<const Target>(std::move(*resolved.value));
  auto deadline = std::chrono::duration<double>(timeout_seconds);

  // Direct agent call under the deadline
  if (target->agent) {
    CancellationToken token;
    auto call_state = std::make_shared<std::atomic<int>>(kCallQueued);
    auto task = std::make_shared<std::packaged_task<Response()>>([this, target, message, token, call_state] {
      int expected = kCallQueued;
      if (!call_state->compare_exchange_strong(expected, kCallRunning)) {
        return Response::failure(kAgentId, "Call expired", ErrorCode::WorkflowTimeout);
      }
      return call_agent(target->agent, message, token);
    });
    auto future = task->get_future();
    asio::post(pool_, [task] { (*task)(); });

    if (future.wait_for(deadline) == std::future_status::ready) {
      return future.get();
    }

    int expected = kCallQueued;
    bool never_started = call_state->compare_exchange_strong(expected, kCallAbandoned);
    token.cancel();
    if (!never_started) {
      future.wait();
    }

    ++direct_timeouts_;
    auto agent_id = target->agent->id();
    spdlog::warn("[Orchestrator] Agent {} timed out after {}s", agent_id, timeout_seconds);
    auto response = Response::failure(kAgentId, "Agent '" + agent_id + "' timed out after " + format_seconds(timeout_seconds) + " seconds",
                                      ErrorCode::WorkflowTimeout);
    response.status = ResponseStatus::Timeout;
    PartialProgress progress;
    progress.timeout_seconds = timeout_seconds;
    response.partial_progress = progress;
    return response;
  }

  auto run = std::make_shared<WorkflowRun>(target->workflow->type, message.type());
  auto task = std::make_shared<std::packaged_task<Response()>>([this, run, target] { return execute(*run, *target); });
  auto future = task->get_future();
  asio::post(pool_, [task] { (*task)(); });

  if (future.wait_for(deadline) != std::future_status::ready) {
    auto expiry = run->expire();
    if (expiry) {
      run->token().cancel();
      // Let the in-flight step unwind; its result is discarded. A run still
      // queued behind others returns at begin() whenever a worker reaches it.
      if (expiry->started) {
        future.wait();
      }

      auto response = timeout_response(*run, expiry->steps, timeout_seconds);
      report(*run, response, timeout_seconds);
      return response;
    }
    // Settled right at the deadline; the settled outcome stands
  }

  Response response;
  try {
    response = future.get();
  } catch (const std::exception& e) {
    spdlog::error("[Orchestrator] Run {} lost its result: {}", run->id(), e.what());
    response = Response::failure(kAgentId, std::string("Workflow run aborted: ") + e.what(), ErrorCode::AgentFailure);
  }
  report(*run, response, timeout_seconds);
  return response;
}

Response Orchestrator::call_agent(const AgentPtr& agent, const Message& message, const CancellationToken& token) {
  try {
    return agent->process_with_cancel(message, token);
  } catch (const std::exception& e) {
    spdlog::error("[Agent {}] Threw on {}: {}", agent->id(), message.type(), e.what());
    return Response::failure(kAgentId, "Agent '" + agent->id() + "' failed: " + e.what(), ErrorCode::AgentFailure);
  } catch (...) {
    spdlog::error("[Agent {}] Threw on {}: unknown exception", agent->id(), message.type());
    return Response::failure(kAgentId, "Agent '" + agent->id() + "' failed: unknown exception", ErrorCode::AgentFailure);
  }
}

Response Orchestrator::execute(WorkflowRun& run, const Target& target) {
  if (!run.begin()) {
    spdlog::debug("[Orchestrator] Run {} expired before it started", run.id());
    return Response::failure(kAgentId, "Run expired", ErrorCode::WorkflowTimeout);
  }

  spdlog::info("[Orchestrator] Run {} started: workflow={}", run.id(), run.workflow_type());

  try {
    return execute_steps(run, target);
  } catch (const std::exception& e) {
    // Only response building is left unguarded by execute_steps
    spdlog::error("[Orchestrator] Run {} aborted: {}", run.id(), e.what());
    if (!run.finish(RunState::Failed)) {
      return Response::failure(kAgentId, "Run cancelled", ErrorCode::WorkflowTimeout);
    }
    return Response::failure(kAgentId, std::string("Workflow run aborted: ") + e.what(), ErrorCode::AgentFailure);
  }
}

Response Orchestrator::execute_steps(WorkflowRun& run, const Target& target) {
  const auto& def = *target.workflow;
  const auto& token = run.token();
  json results = json::object();

  for (size_t i = 0; i < def.steps.size(); ++i) {
    const auto& step = def.steps[i];
    const auto& agent = target.step_agents[i];

    if (token.cancelled()) {
      return Response::failure(kAgentId, "Run cancelled", ErrorCode::WorkflowTimeout);
    }

    json input;
    try {
      input = step.input_mapping ? step.input_mapping(results, target.workflow_data) : target.workflow_data;
    } catch (const std::exception& e) {
      return fail_step(run, step.name, std::string("input mapping failed: ") + e.what());
    }

    spdlog::debug("[Orchestrator] Run {} step {} -> {}", run.id(), step.name, step.agent_id);
    auto response = call_agent(agent, Message::create(step.effective_message_type(), std::move(input)), token);

    // A result that lands after the deadline is not part of the ledger
    if (token.cancelled()) {
      spdlog::debug("[Orchestrator] Run {} discarded late result of {}", run.id(), step.name);
      return Response::failure(kAgentId, "Run cancelled", ErrorCode::WorkflowTimeout);
    }

    if (response.status != ResponseStatus::Success && response.status != ResponseStatus::Pending) {
      return fail_step(run, step.name, response.error.value_or(to_string(response.status)));
    }

    if (!run.commit({step.name, response.status, response.data})) {
      return Response::failure(kAgentId, "Run cancelled", ErrorCode::WorkflowTimeout);
    }
    results[step.name] = response.data;
  }

  if (!run.finish(RunState::Completed)) {
    return Response::failure(kAgentId, "Run cancelled", ErrorCode::WorkflowTimeout);
  }

  spdlog::info("[Orchestrator] Run {} completed in {}ms", run.id(), run.elapsed().count());
  return Response::success(kAgentId, {{"workflow_type", def.type},
                                      {"run_id", run.id()},
                                      {"state", to_string(RunState::Completed)},
                                      {"steps", run.ledger_json()}});
}

Response Orchestrator::fail_step(WorkflowRun& run, const std::string& step, const std::string& reason) {
  if (!run.finish(RunState::Failed)) {
    return Response::failure(kAgentId, "Run cancelled", ErrorCode::WorkflowTimeout);
  }

  json data = {{"workflow_type", run.workflow_type()},
               {"run_id", run.id()},
               {"state", to_string(RunState::Failed)},
               {"failed_step", step},
               {"steps", run.ledger_json()}};
  return Response::failure(kAgentId, "Step '" + step + "' failed: " + reason, ErrorCode::AgentFailure, std::move(data));
}

Response Orchestrator::timeout_response(const WorkflowRun& run, const json& snapshot, double timeout_seconds) {
  json data = {{"workflow_type", run.workflow_type()},
               {"run_id", run.id()},
               {"state", to_string(RunState::TimedOut)},
               {"steps", snapshot}};
  auto response = Response::failure(
      kAgentId, "Workflow '" + run.workflow_type() + "' timed out after " + format_seconds(timeout_seconds) + " seconds",
      ErrorCode::WorkflowTimeout, std::move(data));
  response.status = ResponseStatus::Timeout;
  response.partial_progress = extract_partial_progress(snapshot, timeout_seconds);
  return response;
}

// ============================================================================
// Reporting
// ============================================================================

void Orchestrator::report(const WorkflowRun& run, const Response& response, double timeout_seconds) {
  auto state = run.state();
  const char* topic = nullptr;

  json steps = response.data.is_object() && response.data.contains("steps") ? response.data["steps"] : run.ledger_json();
  auto completed = step_names(steps);

  switch (state) {
    case RunState::Completed:
      topic = topics::kWorkflowCompleted;
      ++runs_completed_;
      break;
    case RunState::Failed:
      topic = topics::kWorkflowFailed;
      ++runs_failed_;
      break;
    case RunState::TimedOut:
      topic = topics::kWorkflowTimedOut;
      ++runs_timed_out_;
      break;
    default:
      spdlog::error("[Orchestrator] Run {} reported in state {}", run.id(), to_string(state));
      return;
  }

  if (state != RunState::Completed) {
    json event = {{"event", state == RunState::TimedOut ? "workflow_timeout" : "workflow_error"},
                  {"workflow_type", run.workflow_type()},
                  {"message_type", run.message_type()},
                  {"run_id", run.id()},
                  {"completed_step_count", completed.size()},
                  {"completed_steps", completed}};
    if (state == RunState::TimedOut) {
      event["timeout_seconds"] = timeout_seconds;
      spdlog::warn("[Orchestrator] {}", event.dump());
    } else {
      if (response.error) {
        event["error"] = *response.error;
      }
      spdlog::error("[Orchestrator] {}", event.dump());
    }
  }

  json summary = {{"workflow_type", run.workflow_type()},
                  {"message_type", run.message_type()},
                  {"run_id", run.id()},
                  {"state", to_string(state)},
                  {"completed_steps", completed},
                  {"total_steps_completed", completed.size()},
                  {"duration_ms", run.elapsed().count()}};
  if (response.error) {
    summary["error"] = *response.error;
  }
  if (state == RunState::TimedOut) {
    summary["timeout_seconds"] = timeout_seconds;
  }
  publish(topic, summary);
}

void Orchestrator::warn_short_timeout(const Message& message, double timeout_seconds) {
  json event = {{"event", "short_timeout"}, {"message_type", message.type()}, {"timeout_seconds", timeout_seconds}};
  spdlog::warn("[Orchestrator] {}", event.dump());
  publish(topics::kWorkflowWarning, event);
}

void Orchestrator::publish(const Topic& topic, const json& payload) {
  if (!broker_) {
    return;
  }
  auto result = broker_->publish(topic, payload);
  if (!result.ok()) {
    spdlog::warn("[Orchestrator] Publish on {} failed ({}): {}", topic, to_string(result.error->code), result.error->message);
  }
}

}  // namespace agentflow
