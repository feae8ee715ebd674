#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <ctime>
#include <map>

#include "builtin_agents.hpp"

namespace agentflow::agents {

namespace {

size_t count_status(const json& tasks, const std::string& status) {
  return static_cast<size_t>(std::count_if(tasks.begin(), tasks.end(), [&](const json& t) {
    return t.is_object() && t.value("status", "") == status;
  }));
}

// Next occurrence of `day_of_week` strictly after today (a week out if today matches)
std::string next_run(const std::string& day_of_week) {
  static const std::map<std::string, int> days = {{"Monday", 0}, {"Tuesday", 1},  {"Wednesday", 2}, {"Thursday", 3},
                                                  {"Friday", 4}, {"Saturday", 5}, {"Sunday", 6}};

  auto now = std::chrono::system_clock::now();
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&t, &tm);
  int today = (tm.tm_wday + 6) % 7;  // Monday = 0

  auto it = days.find(day_of_week);
  int target = it == days.end() ? 4 : it->second;
  int ahead = (target - today + 7) % 7;
  if (ahead == 0) {
    ahead = 7;
  }
  return format_timestamp(now + std::chrono::hours(24 * ahead));
}

}  // namespace

StatusReporterAgent::StatusReporterAgent(AgentId id, json config) : BaseAgent(std::move(id), std::move(config)) {}

Response StatusReporterAgent::process(const Message& message) {
  if (!validate_message(message)) {
    return failure("Invalid message format");
  }

  try {
    if (message.type() == "generate_report") {
      return success(generate_report(message.data()));
    }
    if (message.type() == "schedule_report") {
      return success(schedule_report(message.data()));
    }
    return failure("Unknown message type: " + message.type());
  } catch (const std::exception& e) {
    spdlog::error("[Agent {}] Error processing {}: {}", id_, message.type(), e.what());
    return failure(e.what());
  }
}

json StatusReporterAgent::generate_report(const json& data) const {
  auto project_name = data.value("name", "Unknown Project");
  auto tasks = data.value("tasks", json::array());
  auto milestones = data.value("milestones", json::array());
  auto risks = data.value("risks", json::array());
  int64_t week = data.value("week_number", 1);

  const size_t total = tasks.size();
  const size_t completed = count_status(tasks, "completed");
  const size_t in_progress = count_status(tasks, "in_progress");
  const size_t not_started = count_status(tasks, "not_started");

  double completion = total > 0 ? static_cast<double>(completed) / static_cast<double>(total) * 100.0 : 0.0;
  completion = std::round(completion * 100.0) / 100.0;

  json accomplishments = json::array({"Completed " + std::to_string(completed) + " tasks this week"});
  for (const auto& t : tasks) {
    if (accomplishments.size() > 3) {
      break;
    }
    if (t.is_object() && t.value("status", "") == "completed") {
      accomplishments.push_back(t.value("name", "Unknown"));
    }
  }

  // Milestones due within the next two weeks
  json upcoming = json::array();
  for (const auto& m : milestones) {
    if (!m.is_object()) {
      continue;
    }
    int64_t due = m.value("week", 0);
    if (due >= week && due <= week + 2) {
      upcoming.push_back({{"name", m.value("name", json())}, {"week", due}});
    }
  }

  json blockers = json::array();
  for (const auto& r : risks) {
    if (r.is_object() && r.value("severity", "") == "high") {
      blockers.push_back(
          {{"id", r.value("id", json())}, {"description", r.value("description", json())}, {"severity", "high"}});
    }
  }

  json next_week = json::array({"Continue work on " + std::to_string(in_progress) + " in-progress tasks"});
  if (not_started > 0) {
    next_week.push_back("Start " + std::to_string(std::min<size_t>(not_started, 5)) + " new tasks");
  }

  spdlog::info("[Agent {}] Generated status report for {} - week {}", id_, project_name, week);
  return {{"project_name", project_name},
          {"report_date", now_iso8601()},
          {"week_number", week},
          {"summary",
           {{"completion_percentage", completion},
            {"total_tasks", total},
            {"completed_tasks", completed},
            {"in_progress_tasks", in_progress},
            {"not_started_tasks", not_started}}},
          {"accomplishments", accomplishments},
          {"upcoming_milestones", upcoming},
          {"risks_and_blockers", blockers},
          {"next_week_plan", next_week},
          {"generated_by", id_}};
}

json StatusReporterAgent::schedule_report(const json& data) const {
  auto frequency = data.value("frequency", "weekly");
  auto recipients = data.value("recipients", json::array());
  auto day = data.value("day_of_week", "Friday");

  spdlog::info("[Agent {}] Scheduled {} reports for {} recipient(s)", id_, frequency, recipients.size());
  return {{"frequency", frequency},
          {"recipients", recipients},
          {"day_of_week", day},
          {"next_run", next_run(day)},
          {"created_by", id_}};
}

}  // namespace agentflow::agents
