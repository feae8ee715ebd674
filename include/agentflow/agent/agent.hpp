#pragma once

#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "agentflow/core/cancellation.hpp"
#include "agentflow/core/message.hpp"
#include "agentflow/core/types.hpp"

namespace agentflow {

// Unit of work driven by the orchestrator
class Agent {
 public:
  virtual ~Agent() = default;

  virtual AgentId id() const = 0;

  // Handle one message synchronously
  virtual Response process(const Message& message) = 0;

  // Deadline-bound entry point. Agents that can stop early should override
  // this and poll (or wait on) the token; the default ignores it.
  virtual Response process_with_cancel(const Message& message, const CancellationToken& token) {
    (void)token;
    return process(message);
  }
};

using AgentPtr = std::shared_ptr<Agent>;

// Base class for simpler agent implementation
class BaseAgent : public Agent {
 public:
  explicit BaseAgent(AgentId id, json config = json::object());

  AgentId id() const override {
    return id_;
  }

  const json& config() const {
    return config_;
  }

 protected:
  // Message has a type and object data
  bool validate_message(const Message& message) const;

  Response create_response(ResponseStatus status, json data, std::optional<std::string> error = std::nullopt) const;

  Response success(json data) const {
    return create_response(ResponseStatus::Success, std::move(data));
  }

  Response failure(const std::string& error) const {
    return create_response(ResponseStatus::Error, nullptr, error);
  }

  AgentId id_;
  json config_;
};

// Agent backed by a callable; handy for wiring and tests
class FunctionAgent : public Agent {
 public:
  using Fn = std::function<Response(const Message&, const CancellationToken&)>;

  FunctionAgent(AgentId id, Fn fn);

  // Convenience for callables that ignore cancellation
  static std::shared_ptr<FunctionAgent> from(AgentId id, std::function<Response(const Message&)> fn);

  AgentId id() const override {
    return id_;
  }

  Response process(const Message& message) override;

  Response process_with_cancel(const Message& message, const CancellationToken& token) override;

 private:
  AgentId id_;
  Fn fn_;
};

// Agent registry. Reads take a shared lock so lookups from concurrent runs
// don't serialise; registration takes an exclusive lock.
class AgentRegistry {
 public:
  // Last write wins for a repeated id
  void register_agent(AgentPtr agent);

  bool unregister_agent(const AgentId& id);

  AgentPtr get(const AgentId& id) const;

  bool contains(const AgentId& id) const;

  std::vector<AgentId> ids() const;

  size_t size() const;

 private:
  mutable std::shared_mutex mutex_;
  std::map<AgentId, AgentPtr> agents_;
};

}  // namespace agentflow
