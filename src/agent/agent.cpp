#include "agentflow/agent/agent.hpp"

#include <spdlog/spdlog.h>

#include <mutex>

namespace agentflow {

// ============================================================================
// BaseAgent
// ============================================================================

BaseAgent::BaseAgent(AgentId id, json config) : id_(std::move(id)), config_(std::move(config)) {}

bool BaseAgent::validate_message(const Message& message) const {
  return message.valid();
}

Response BaseAgent::create_response(ResponseStatus status, json data, std::optional<std::string> error) const {
  Response r;
  r.agent_id = id_;
  r.timestamp = now_iso8601();
  r.status = status;
  r.data = std::move(data);
  r.error = std::move(error);
  return r;
}

// ============================================================================
// FunctionAgent
// ============================================================================

FunctionAgent::FunctionAgent(AgentId id, Fn fn) : id_(std::move(id)), fn_(std::move(fn)) {}

std::shared_ptr<FunctionAgent> FunctionAgent::from(AgentId id, std::function<Response(const Message&)> fn) {
  return std::make_shared<FunctionAgent>(std::move(id), [fn = std::move(fn)](const Message& message, const CancellationToken&) {
    return fn(message);
  });
}

Response FunctionAgent::process(const Message& message) {
  return fn_(message, CancellationToken{});
}

Response FunctionAgent::process_with_cancel(const Message& message, const CancellationToken& token) {
  return fn_(message, token);
}

// ============================================================================
// AgentRegistry
// ============================================================================

void AgentRegistry::register_agent(AgentPtr agent) {
  if (!agent) {
    spdlog::warn("[AgentRegistry] Ignoring null agent");
    return;
  }

  auto id = agent->id();
  bool replaced = false;
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    replaced = agents_.count(id) > 0;
    agents_[id] = std::move(agent);
  }

  if (replaced) {
    spdlog::info("[AgentRegistry] Replaced agent: {}", id);
  } else {
    spdlog::info("[AgentRegistry] Registered agent: {}", id);
  }
}

bool AgentRegistry::unregister_agent(const AgentId& id) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  return agents_.erase(id) > 0;
}

AgentPtr AgentRegistry::get(const AgentId& id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = agents_.find(id);
  return it == agents_.end() ? nullptr : it->second;
}

bool AgentRegistry::contains(const AgentId& id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return agents_.count(id) > 0;
}

std::vector<AgentId> AgentRegistry::ids() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<AgentId> result;
  result.reserve(agents_.size());
  for (const auto& [id, agent] : agents_) {
    result.push_back(id);
  }
  return result;
}

size_t AgentRegistry::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return agents_.size();
}

}  // namespace agentflow
