#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace agentflow {

using json = nlohmann::json;

// Type aliases
using AgentId = std::string;
using RunId = std::string;
using Topic = std::string;

using Timestamp = std::chrono::system_clock::time_point;

// Error taxonomy shared by the broker and the orchestrator
enum class ErrorCode {
  InvalidMessage,     // Message is missing its type or data is not an object
  NoSuchAgent,        // Message type or workflow step resolves to no registered agent
  NoSuchWorkflow,     // Workflow type unresolved
  InvalidTimeout,     // Negative (or NaN) timeout
  AgentFailure,       // A step's agent failed or threw
  WorkflowTimeout,    // Deadline exceeded
  BrokerSaturated,    // Publish queue full
  BrokerStopped,      // Publish while the broker is not running
  SubscriberFailure   // Subscriber threw; contained in the broker
};

std::string to_string(ErrorCode code);

std::optional<ErrorCode> error_code_from_string(const std::string &str);

struct Error {
  ErrorCode code;
  std::string message;
};

// Result type for operations that can fail
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<Error> error;

  bool ok() const {
    return value.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  static Result success(T val) {
    return Result{std::move(val), std::nullopt};
  }

  static Result failure(ErrorCode code, std::string message) {
    return Result{std::nullopt, Error{code, std::move(message)}};
  }
};

// ISO-8601 UTC timestamp with millisecond precision, e.g. 2024-05-01T12:00:00.123Z
std::string format_timestamp(Timestamp tp);

std::string now_iso8601();

}  // namespace agentflow
