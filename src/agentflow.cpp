// Library initialization
#include "agentflow/agentflow.hpp"

#include <spdlog/spdlog.h>

#include "core/version.hpp"
#include "log/log.h"

namespace agentflow {

void init(const Config& config) {
  // Logging first
  init_log(config);
  spdlog::info("agentflow {} initialized", version());
}

std::string version() {
  return AGENTFLOW_VERSION_STRING;
}

}  // namespace agentflow
