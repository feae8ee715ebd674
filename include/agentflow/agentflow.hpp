#pragma once

// Core types
#include "agentflow/core/cancellation.hpp"
#include "agentflow/core/config.hpp"
#include "agentflow/core/message.hpp"
#include "agentflow/core/types.hpp"
#include "agentflow/core/uuid.hpp"

// Message broker
#include "agentflow/bus/broker.hpp"

// Agents and workflows
#include "agentflow/agent/agent.hpp"
#include "agentflow/orchestrator/orchestrator.hpp"
#include "agentflow/workflow/workflow.hpp"

namespace agentflow {

// Initialize logging from the config (file sink, level)
void init(const Config& config);

// Get version string
std::string version();

}  // namespace agentflow
