#include <spdlog/spdlog.h>

#include "builtin_agents.hpp"

namespace agentflow::agents {

ProjectPlanAgent::ProjectPlanAgent(AgentId id, json config) : BaseAgent(std::move(id), std::move(config)) {}

Response ProjectPlanAgent::process(const Message& message) {
  if (!validate_message(message)) {
    return failure("Invalid message format");
  }

  try {
    if (message.type() == "generate_plan") {
      return success(generate_plan(message.data()));
    }
    if (message.type() == "update_plan") {
      return success(update_plan(message.data()));
    }
    return failure("Unknown message type: " + message.type());
  } catch (const std::exception& e) {
    spdlog::error("[Agent {}] Error processing {}: {}", id_, message.type(), e.what());
    return failure(e.what());
  }
}

json ProjectPlanAgent::generate_plan(const json& data) const {
  auto name = data.value("name", "Unnamed Project");
  auto description = data.value("description", "");
  auto goals = data.value("goals", json::array());
  int64_t duration_weeks = data.value("duration_weeks", 12);

  json milestones = json::array();
  const auto goal_count = static_cast<int64_t>(goals.size());
  for (int64_t i = 1; i <= goal_count; ++i) {
    const auto& goal = goals.at(static_cast<size_t>(i - 1));
    auto goal_name = goal.is_string() ? goal.get<std::string>() : goal.dump();
    milestones.push_back({{"id", "M" + std::to_string(i)},
                          {"name", goal_name},
                          {"week", (i * duration_weeks) / goal_count},
                          {"deliverables", json::array({"Deliverable for " + goal_name})},
                          {"status", "not_started"}});
  }

  // Three tasks per milestone
  json tasks = json::array();
  for (const auto& milestone : milestones) {
    auto milestone_id = milestone["id"].get<std::string>();
    auto milestone_name = milestone["name"].get<std::string>();
    for (int j = 1; j <= 3; ++j) {
      tasks.push_back({{"id", milestone_id + "-T" + std::to_string(j)},
                       {"milestone_id", milestone_id},
                       {"name", "Task " + std::to_string(j) + " for " + milestone_name},
                       {"status", "not_started"},
                       {"priority", "medium"},
                       {"estimated_hours", 8}});
    }
  }

  spdlog::info("[Agent {}] Generated plan for project: {}", id_, name);
  return {{"name", name},
          {"description", description},
          {"duration_weeks", duration_weeks},
          {"milestones", milestones},
          {"tasks", tasks},
          {"created_by", id_}};
}

json ProjectPlanAgent::update_plan(const json& data) const {
  auto plan = data.value("plan", json::object());
  auto updates = data.value("updates", json::object());
  if (plan.is_object() && updates.is_object()) {
    plan.update(updates);
  }

  spdlog::info("[Agent {}] Updated plan: {}", id_, plan.is_object() ? plan.value("name", "Unknown") : "Unknown");
  return plan;
}

}  // namespace agentflow::agents
