#include "agentflow/core/message.hpp"

namespace agentflow {

Message::Message(std::string type, json data, std::string timestamp)
    : type_(std::move(type)), data_(std::move(data)), timestamp_(std::move(timestamp)) {}

Message Message::create(const std::string &type, json data) {
  return Message(type, std::move(data), now_iso8601());
}

Result<Message> Message::from_json(const json &j) {
  if (!j.is_object()) {
    return Result<Message>::failure(ErrorCode::InvalidMessage, "Invalid message format: expected an object");
  }
  if (!j.contains("type") || !j["type"].is_string() || j["type"].get<std::string>().empty()) {
    return Result<Message>::failure(ErrorCode::InvalidMessage, "Invalid message format: missing type");
  }
  if (!j.contains("data") || !j["data"].is_object()) {
    return Result<Message>::failure(ErrorCode::InvalidMessage, "Invalid message format: data must be an object");
  }

  std::string timestamp;
  if (j.contains("timestamp") && j["timestamp"].is_string()) {
    timestamp = j["timestamp"].get<std::string>();
  } else {
    timestamp = now_iso8601();
  }

  return Result<Message>::success(Message(j["type"].get<std::string>(), j["data"], timestamp));
}

bool Message::valid() const {
  return !type_.empty() && data_.is_object();
}

json Message::to_json() const {
  return {{"type", type_}, {"data", data_}, {"timestamp", timestamp_}};
}

bool Message::operator==(const Message &other) const {
  return type_ == other.type_ && data_ == other.data_ && timestamp_ == other.timestamp_;
}

std::string to_string(ResponseStatus status) {
  switch (status) {
    case ResponseStatus::Success:
      return "success";
    case ResponseStatus::Error:
      return "error";
    case ResponseStatus::Pending:
      return "pending";
    case ResponseStatus::Timeout:
      return "timeout";
  }
  return "error";
}

ResponseStatus response_status_from_string(const std::string &str) {
  if (str == "success") return ResponseStatus::Success;
  if (str == "pending") return ResponseStatus::Pending;
  if (str == "timeout") return ResponseStatus::Timeout;
  return ResponseStatus::Error;
}

json PartialProgress::to_json() const {
  return {{"completed_steps", completed_steps}, {"total_steps_completed", total_steps_completed}, {"timeout_seconds", timeout_seconds}};
}

Response Response::success(const AgentId &agent_id, json data) {
  Response r;
  r.agent_id = agent_id;
  r.timestamp = now_iso8601();
  r.status = ResponseStatus::Success;
  r.data = std::move(data);
  return r;
}

Response Response::pending(const AgentId &agent_id, json data) {
  Response r = success(agent_id, std::move(data));
  r.status = ResponseStatus::Pending;
  return r;
}

Response Response::failure(const AgentId &agent_id, const std::string &error, std::optional<ErrorCode> code, json data) {
  Response r;
  r.agent_id = agent_id;
  r.timestamp = now_iso8601();
  r.status = ResponseStatus::Error;
  r.data = std::move(data);
  r.error = error;
  r.code = code;
  return r;
}

json Response::to_json() const {
  json j;
  j["agent_id"] = agent_id;
  j["timestamp"] = timestamp;
  j["status"] = to_string(status);
  j["data"] = data;
  j["error"] = error ? json(*error) : json(nullptr);

  if (code) {
    j["code"] = to_string(*code);
  }
  if (partial_progress) {
    j["partial_progress"] = partial_progress->to_json();
  }
  return j;
}

Response Response::from_json(const json &j) {
  Response r;
  r.agent_id = j.value("agent_id", "");
  r.timestamp = j.value("timestamp", "");
  r.status = response_status_from_string(j.value("status", "error"));
  r.data = j.contains("data") ? j["data"] : json(nullptr);

  if (j.contains("error") && j["error"].is_string()) {
    r.error = j["error"].get<std::string>();
  }
  if (j.contains("code") && j["code"].is_string()) {
    r.code = error_code_from_string(j["code"].get<std::string>());
  }
  if (j.contains("partial_progress") && j["partial_progress"].is_object()) {
    const auto &pp = j["partial_progress"];
    PartialProgress progress;
    if (pp.contains("completed_steps") && pp["completed_steps"].is_array()) {
      for (const auto &step : pp["completed_steps"]) {
        if (step.is_string()) progress.completed_steps.push_back(step.get<std::string>());
      }
    }
    progress.total_steps_completed = static_cast<int64_t>(progress.completed_steps.size());
    progress.timeout_seconds = pp.value("timeout_seconds", 0.0);
    r.partial_progress = progress;
  }
  return r;
}

}  // namespace agentflow
