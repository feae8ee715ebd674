#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <map>
#include <sstream>

#include "builtin_agents.hpp"

namespace agentflow::agents {

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

json make_risk(size_t index, const std::string& category, const std::string& pattern, const std::string& severity,
               const std::string& description, const std::string& mitigation) {
  return {{"id", "R" + std::to_string(index)},
          {"category", category},
          {"pattern", pattern},
          {"severity", severity},
          {"description", description},
          {"mitigation", mitigation},
          {"status", "identified"}};
}

}  // namespace

RiskAssessmentAgent::RiskAssessmentAgent(AgentId id, json config) : BaseAgent(std::move(id), std::move(config)) {
  patterns_ = {
      {"schedule", "tight_deadline", {"urgent", "asap", "short timeline"}, "high",
       "Add buffer time, reduce scope, or increase resources"},
      {"technical", "new_technology", {"new", "unfamiliar", "learning"}, "medium",
       "Allocate time for training and proof-of-concept"},
      {"resource", "limited_resources", {"limited", "insufficient", "lack of"}, "high",
       "Secure additional resources or adjust project scope"},
      {"dependency", "external_dependency", {"depends on", "waiting for", "third party"}, "medium",
       "Establish clear SLAs and backup plans"},
  };
}

Response RiskAssessmentAgent::process(const Message& message) {
  if (!validate_message(message)) {
    return failure("Invalid message format");
  }

  try {
    if (message.type() == "assess_risks") {
      return success(assess_risks(message.data()));
    }
    if (message.type() == "update_risk") {
      return success(update_risk(message.data()));
    }
    return failure("Unknown message type: " + message.type());
  } catch (const std::exception& e) {
    spdlog::error("[Agent {}] Error processing {}: {}", id_, message.type(), e.what());
    return failure(e.what());
  }
}

json RiskAssessmentAgent::assess_risks(const json& data) const {
  auto project_name = data.value("name", "Unknown Project");
  auto description = to_lower(data.value("description", ""));
  auto tasks = data.value("tasks", json::array());
  double duration = data.value("duration_weeks", 0.0);

  json risks = json::array();

  // At most one risk per pattern
  for (const auto& p : patterns_) {
    bool hit = std::any_of(p.keywords.begin(), p.keywords.end(),
                           [&](const std::string& keyword) { return description.find(keyword) != std::string::npos; });
    if (hit) {
      risks.push_back(make_risk(risks.size() + 1, p.category, p.pattern, p.severity,
                                "Potential " + p.category + " risk detected", p.mitigation));
    }
  }

  if (tasks.is_array() && !tasks.empty() && duration > 0) {
    double tasks_per_week = static_cast<double>(tasks.size()) / duration;
    if (tasks_per_week > kMaxTasksPerWeek) {
      std::ostringstream desc;
      desc << "High task density: " << std::fixed << std::setprecision(1) << tasks_per_week << " tasks per week";
      risks.push_back(make_risk(risks.size() + 1, "schedule", "high_task_density", "high", desc.str(),
                                "Consider extending timeline or adding resources"));
    }
  }

  static const std::map<std::string, int> severity_scores = {{"low", 1}, {"medium", 2}, {"high", 3}};
  int total = 0;
  for (const auto& risk : risks) {
    auto it = severity_scores.find(risk["severity"].get<std::string>());
    total += it == severity_scores.end() ? 0 : it->second;
  }
  const auto max_score = static_cast<double>(risks.size() * 3);
  double score = max_score > 0 ? total / max_score * 100.0 : 0.0;
  score = std::round(score * 100.0) / 100.0;

  spdlog::info("[Agent {}] Assessed risks for project: {} (score {})", id_, project_name, score);
  return {{"project_name", project_name},
          {"risk_score", score},
          {"total_risks", risks.size()},
          {"risks", risks},
          {"assessed_by", id_}};
}

json RiskAssessmentAgent::update_risk(const json& data) const {
  auto risk = data.value("risk", json::object());
  auto updates = data.value("updates", json::object());
  if (risk.is_object() && updates.is_object()) {
    risk.update(updates);
  }

  spdlog::info("[Agent {}] Updated risk: {}", id_, risk.is_object() ? risk.value("id", "Unknown") : "Unknown");
  return risk;
}

}  // namespace agentflow::agents
