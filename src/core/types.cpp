#include "agentflow/core/types.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace agentflow {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::InvalidMessage:
      return "invalid_message";
    case ErrorCode::NoSuchAgent:
      return "no_such_agent";
    case ErrorCode::NoSuchWorkflow:
      return "no_such_workflow";
    case ErrorCode::InvalidTimeout:
      return "invalid_timeout";
    case ErrorCode::AgentFailure:
      return "agent_failure";
    case ErrorCode::WorkflowTimeout:
      return "workflow_timeout";
    case ErrorCode::BrokerSaturated:
      return "broker_saturated";
    case ErrorCode::BrokerStopped:
      return "broker_stopped";
    case ErrorCode::SubscriberFailure:
      return "subscriber_failure";
  }
  return "unknown";
}

std::optional<ErrorCode> error_code_from_string(const std::string &str) {
  if (str == "invalid_message") return ErrorCode::InvalidMessage;
  if (str == "no_such_agent") return ErrorCode::NoSuchAgent;
  if (str == "no_such_workflow") return ErrorCode::NoSuchWorkflow;
  if (str == "invalid_timeout") return ErrorCode::InvalidTimeout;
  if (str == "agent_failure") return ErrorCode::AgentFailure;
  if (str == "workflow_timeout") return ErrorCode::WorkflowTimeout;
  if (str == "broker_saturated") return ErrorCode::BrokerSaturated;
  if (str == "broker_stopped") return ErrorCode::BrokerStopped;
  if (str == "subscriber_failure") return ErrorCode::SubscriberFailure;
  return std::nullopt;
}

std::string format_timestamp(Timestamp tp) {
  auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
  if (millis < 0) {
    secs -= std::chrono::seconds(1);
    millis += 1000;
  }

  std::time_t t = std::chrono::system_clock::to_time_t(secs);
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif

  std::ostringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
  return ss.str();
}

std::string now_iso8601() {
  return format_timestamp(std::chrono::system_clock::now());
}

}  // namespace agentflow
