#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "agentflow/core/types.hpp"

namespace agentflow {

// Inbound event handed to an agent or to the orchestrator.
// Immutable once created; equality is structural.
class Message {
 public:
  Message() = default;
  Message(std::string type, json data, std::string timestamp);

  // Factory: stamps the current UTC time
  static Message create(const std::string& type, json data = json::object());

  // Parse the wire shape {type, data, timestamp?}
  static Result<Message> from_json(const json& j);

  const std::string& type() const { return type_; }
  const json& data() const { return data_; }
  const std::string& timestamp() const { return timestamp_; }

  // type is non-empty and data is an object
  bool valid() const;

  json to_json() const;

  bool operator==(const Message& other) const;
  bool operator!=(const Message& other) const { return !(*this == other); }

 private:
  std::string type_;
  json data_ = json::object();
  std::string timestamp_;
};

// Response status
enum class ResponseStatus {
  Success,
  Error,
  Pending,
  Timeout  // Only produced by the orchestrator's deadline-bound path
};

std::string to_string(ResponseStatus status);

ResponseStatus response_status_from_string(const std::string& str);

// How far a timed-out workflow got. Step names only, never payloads.
struct PartialProgress {
  std::vector<std::string> completed_steps;
  int64_t total_steps_completed = 0;
  double timeout_seconds = 0.0;

  json to_json() const;
};

// Uniform response envelope
struct Response {
  AgentId agent_id;
  std::string timestamp;
  ResponseStatus status = ResponseStatus::Success;
  json data;  // null when absent
  std::optional<std::string> error;

  std::optional<ErrorCode> code;
  std::optional<PartialProgress> partial_progress;

  bool ok() const {
    return status == ResponseStatus::Success;
  }

  // Factory methods
  static Response success(const AgentId& agent_id, json data);
  static Response pending(const AgentId& agent_id, json data);
  static Response failure(const AgentId& agent_id, const std::string& error, std::optional<ErrorCode> code = std::nullopt,
                          json data = nullptr);

  json to_json() const;
  static Response from_json(const json& j);
};

}  // namespace agentflow
