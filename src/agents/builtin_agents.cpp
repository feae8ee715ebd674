#include "builtin_agents.hpp"

#include <spdlog/spdlog.h>

#include "agentflow/orchestrator/orchestrator.hpp"

namespace agentflow::agents {

void register_builtin_agents(Orchestrator& orchestrator) {
  spdlog::debug("[Agents] Registering built-in agents");
  orchestrator.register_agent(std::make_shared<ProjectPlanAgent>());
  orchestrator.register_agent(std::make_shared<RiskAssessmentAgent>());
  orchestrator.register_agent(std::make_shared<StatusReporterAgent>());
}

}  // namespace agentflow::agents
