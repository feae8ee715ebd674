#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include "agentflow/agent/agent.hpp"
#include "agentflow/bus/broker.hpp"
#include "agentflow/core/config.hpp"
#include "agentflow/core/message.hpp"
#include "agentflow/core/types.hpp"
#include "agentflow/workflow/workflow.hpp"

namespace agentflow {

// Broker topics the orchestrator publishes on
namespace topics {
inline constexpr const char* kWorkflowCompleted = "workflow.completed";
inline constexpr const char* kWorkflowFailed = "workflow.failed";
inline constexpr const char* kWorkflowTimedOut = "workflow.timed_out";
inline constexpr const char* kWorkflowWarning = "workflow.warning";
}  // namespace topics

// Counters exposed by Orchestrator::stats()
struct OrchestratorStats {
  uint64_t runs_completed = 0;
  uint64_t runs_failed = 0;
  uint64_t runs_timed_out = 0;
  uint64_t direct_timeouts = 0;  // Direct agent calls past their deadline
  uint64_t rejected = 0;         // Bad timeout or unresolvable message
  uint64_t in_flight = 0;        // Accepted calls that have not returned yet
};

// Routes inbound messages to a single agent or runs them as a multi-step
// workflow, either on the caller's thread or bound by a deadline on a pool.
//
// Every public operation reports failure through the returned Response;
// nothing thrown by an agent escapes.
class Orchestrator {
 public:
  static constexpr const char* kAgentId = "orchestrator";

  // Longer timeouts are clamped to this (30 days)
  static constexpr double kMaxTimeoutSeconds = 30.0 * 24 * 3600;

  // Timeouts below this are accepted with a warning
  static constexpr double kShortTimeoutSeconds = 1.0;

  explicit Orchestrator(const Config& config, std::shared_ptr<MessageBroker> broker = nullptr);

  ~Orchestrator();

  Orchestrator(const Orchestrator&) = delete;
  Orchestrator& operator=(const Orchestrator&) = delete;

  // Agents
  void register_agent(AgentPtr agent);
  bool unregister_agent(const AgentId& id);
  AgentPtr get_agent(const AgentId& id) const;
  std::vector<AgentId> agent_ids() const;

  // Routing: message type -> agent id
  void add_routing_rule(const std::string& message_type, const AgentId& agent_id);
  std::map<std::string, AgentId> routing_rules() const;

  // Workflows. Defining an existing type replaces it; runs already in
  // flight keep the definition they started with.
  void define_workflow(WorkflowDefinition definition);
  bool has_workflow(const std::string& type) const;
  std::vector<std::string> workflow_types() const;

  // Run on the caller's thread with no deadline
  Response process(const Message& message);

  // Run on the worker pool, giving up after `timeout_seconds`
  Response process_async(const Message& message, double timeout_seconds);

  // Same, with the configured default timeout
  Response process_async(const Message& message);

  const std::shared_ptr<MessageBroker>& broker() const {
    return broker_;
  }

  double default_timeout_seconds() const {
    return default_timeout_seconds_;
  }

  OrchestratorStats stats() const;

 private:
  // What a message resolved to. Exactly one of workflow / agent is set.
  struct Target {
    std::shared_ptr<const WorkflowDefinition> workflow;
    std::vector<AgentPtr> step_agents;  // Parallel to workflow->steps
    json workflow_data;

    AgentPtr agent;
  };

  Result<Target> resolve(const Message& message) const;

  Result<Target> resolve_workflow(const std::string& type, json data) const;

  // Run body shared by both paths. Returns a placeholder once the run has
  // been expired by the deadline; the caller discards it.
  Response execute(WorkflowRun& run, const Target& target);

  Response execute_steps(WorkflowRun& run, const Target& target);

  Response fail_step(WorkflowRun& run, const std::string& step, const std::string& reason);

  Response call_agent(const AgentPtr& agent, const Message& message, const CancellationToken& token);

  Response timeout_response(const WorkflowRun& run, const json& snapshot, double timeout_seconds);

  Response reject(const Message& message, const Error& error);

  // Structured log event and broker summary for a settled run
  void report(const WorkflowRun& run, const Response& response, double timeout_seconds);

  void warn_short_timeout(const Message& message, double timeout_seconds);

  void publish(const Topic& topic, const json& payload);

  AgentRegistry agents_;

  mutable std::shared_mutex catalog_mutex_;
  std::map<std::string, AgentId> routing_;
  std::map<std::string, std::shared_ptr<const WorkflowDefinition>> workflows_;

  std::shared_ptr<MessageBroker> broker_;
  double default_timeout_seconds_;

  std::atomic<uint64_t> runs_completed_{0};
  std::atomic<uint64_t> runs_failed_{0};
  std::atomic<uint64_t> runs_timed_out_{0};
  std::atomic<uint64_t> direct_timeouts_{0};
  std::atomic<uint64_t> rejected_{0};
  std::atomic<uint64_t> in_flight_{0};

  asio::thread_pool pool_;
};

}  // namespace agentflow
