#pragma once

#include <string>
#include <vector>

#include "agentflow/agent/agent.hpp"

namespace agentflow {
class Orchestrator;
}

namespace agentflow::agents {

// generate_plan: milestones and tasks from {name, description, goals, duration_weeks}
// update_plan:   {plan, updates} -> plan with updates merged in
class ProjectPlanAgent : public BaseAgent {
 public:
  explicit ProjectPlanAgent(AgentId id = "project_plan_agent", json config = json::object());

  Response process(const Message& message) override;

 private:
  json generate_plan(const json& data) const;
  json update_plan(const json& data) const;
};

// assess_risks: keyword and task-density risks with a 0-100 score
// update_risk:  {risk, updates} -> risk with updates merged in
class RiskAssessmentAgent : public BaseAgent {
 public:
  struct RiskPattern {
    std::string category;
    std::string pattern;
    std::vector<std::string> keywords;
    std::string severity;
    std::string mitigation;
  };

  // Above this many tasks per week a schedule risk is raised
  static constexpr double kMaxTasksPerWeek = 5.0;

  explicit RiskAssessmentAgent(AgentId id = "risk_assessment_agent", json config = json::object());

  Response process(const Message& message) override;

  const std::vector<RiskPattern>& patterns() const {
    return patterns_;
  }

 private:
  json assess_risks(const json& data) const;
  json update_risk(const json& data) const;

  std::vector<RiskPattern> patterns_;
};

// generate_report: weekly status summary of tasks, milestones and high risks
// schedule_report: recurring report schedule with the next run date
class StatusReporterAgent : public BaseAgent {
 public:
  explicit StatusReporterAgent(AgentId id = "status_reporter_agent", json config = json::object());

  Response process(const Message& message) override;

 private:
  json generate_report(const json& data) const;
  json schedule_report(const json& data) const;
};

// Register the three agents above under their default ids
void register_builtin_agents(Orchestrator& orchestrator);

}  // namespace agentflow::agents
