#include <gtest/gtest.h>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

#include <set>
#include <string>

#include "agentflow/workflow/workflow.hpp"

using namespace agentflow;

namespace {

InputSource from_original() {
  return InputSource{};
}

InputSource from_step(const std::string& step, std::optional<std::string> field = std::nullopt,
                      std::optional<std::string> as = std::nullopt) {
  InputSource s;
  s.from = InputSource::From::Step;
  s.step = step;
  s.field = std::move(field);
  s.as = std::move(as);
  return s;
}

}  // namespace

// --- InputMappingTest ---

TEST(InputMappingTest, NoSourcesMeansOriginalData) {
  auto mapping = make_input_mapping({});
  json original = {{"name", "Apollo"}};

  EXPECT_EQ(mapping(json::object(), original), original);
}

TEST(InputMappingTest, StepResultMergedAtTopLevel) {
  auto mapping = make_input_mapping({from_step("generate_plan")});
  json results = {{"generate_plan", {{"tasks", json::array({1, 2})}, {"name", "Apollo"}}}};

  auto input = mapping(results, json::object());
  EXPECT_EQ(input["name"], "Apollo");
  EXPECT_EQ(input["tasks"].size(), 2u);
}

TEST(InputMappingTest, FieldAndAsNestValue) {
  auto mapping = make_input_mapping({from_step("generate_plan"), from_step("assess_risks", "risks", "risks")});
  json results = {{"generate_plan", {{"name", "Apollo"}}},
                  {"assess_risks", {{"risks", json::array({{{"id", "R1"}}})}, {"risk_score", 100}}}};

  auto input = mapping(results, json::object());
  EXPECT_EQ(input["name"], "Apollo");
  ASSERT_TRUE(input.contains("risks"));
  EXPECT_EQ(input["risks"][0]["id"], "R1");
  EXPECT_FALSE(input.contains("risk_score"));
}

TEST(InputMappingTest, LaterSourcesOverwriteEarlierKeys) {
  auto mapping = make_input_mapping({from_original(), from_step("a")});
  json original = {{"name", "original"}, {"keep", true}};
  json results = {{"a", {{"name", "from_a"}}}};

  auto input = mapping(results, original);
  EXPECT_EQ(input["name"], "from_a");
  EXPECT_EQ(input["keep"], true);
}

TEST(InputMappingTest, MissingStepOrFieldContributesNothing) {
  auto mapping = make_input_mapping({from_original(), from_step("never_ran"), from_step("a", "absent", "x")});
  json original = {{"name", "Apollo"}};
  json results = {{"a", {{"present", 1}}}};

  EXPECT_EQ(mapping(results, original), original);
}

TEST(InputMappingTest, NonObjectWithoutAsReplacesInput) {
  auto mapping = make_input_mapping({from_original(), from_step("a", "count")});
  json results = {{"a", {{"count", 3}}}};

  EXPECT_EQ(mapping(results, {{"name", "Apollo"}}), json(3));
}

TEST(InputMappingTest, StepResultHelper) {
  auto mapping = mapping::step_result("a");

  EXPECT_EQ(mapping({{"a", {{"x", 1}}}}, json::object()), json({{"x", 1}}));
  EXPECT_EQ(mapping(json::object(), json::object()), json::object());
}

// --- WorkflowDefinitionTest ---

TEST(WorkflowDefinitionTest, FromProjectInitializationConfig) {
  auto def = WorkflowDefinition::from_config(project_initialization_workflow());

  EXPECT_EQ(def.type, "project_initialization");
  ASSERT_EQ(def.steps.size(), 3u);
  EXPECT_EQ(def.steps[0].name, "generate_plan");
  EXPECT_EQ(def.steps[1].agent_id, "risk_assessment_agent");
  EXPECT_EQ(def.steps[2].effective_message_type(), "generate_report");
  EXPECT_EQ(def.agent_ids(),
            (std::vector<AgentId>{"project_plan_agent", "risk_assessment_agent", "status_reporter_agent"}));

  // Report input: plan merged with the risk list
  json results = {{"generate_plan", {{"name", "Apollo"}, {"tasks", json::array()}}},
                  {"assess_risks", {{"risks", json::array({{{"id", "R1"}}})}, {"risk_score", 50}}}};
  auto input = def.steps[2].input_mapping(results, json::object());
  EXPECT_EQ(input["name"], "Apollo");
  EXPECT_EQ(input["risks"].size(), 1u);
}

TEST(WorkflowDefinitionTest, MessageTypeDefaultsToName) {
  WorkflowStep step;
  step.name = "assess_risks";
  EXPECT_EQ(step.effective_message_type(), "assess_risks");

  step.message_type = "update_risk";
  EXPECT_EQ(step.effective_message_type(), "update_risk");
}

// --- WorkflowRunTest ---

TEST(WorkflowRunTest, HappyPathTransitions) {
  WorkflowRun run("project_initialization", "project_initialization");
  EXPECT_EQ(run.state(), RunState::Pending);

  // Nothing is committed before the run starts
  EXPECT_FALSE(run.commit({"early", ResponseStatus::Success, json::object()}));

  ASSERT_TRUE(run.begin());
  EXPECT_FALSE(run.begin());
  EXPECT_TRUE(run.commit({"generate_plan", ResponseStatus::Success, {{"k", 1}}}));
  ASSERT_TRUE(run.finish(RunState::Completed));
  EXPECT_EQ(run.state(), RunState::Completed);

  // Settled runs ignore the deadline
  EXPECT_FALSE(run.expire().has_value());
  EXPECT_EQ(run.state(), RunState::Completed);

  auto ledger = run.ledger_json();
  ASSERT_EQ(ledger.size(), 1u);
  EXPECT_EQ(ledger[0], json({{"step", "generate_plan"}, {"status", "success"}, {"result", {{"k", 1}}}}));
}

TEST(WorkflowRunTest, ExpireSnapshotsLedger) {
  WorkflowRun run("wf", "wf");
  ASSERT_TRUE(run.begin());
  ASSERT_TRUE(run.commit({"a", ResponseStatus::Success, json::object()}));

  auto expiry = run.expire();
  ASSERT_TRUE(expiry.has_value());
  EXPECT_EQ(expiry->steps.size(), 1u);
  EXPECT_TRUE(expiry->started);
  EXPECT_EQ(run.state(), RunState::TimedOut);

  // Late work is dropped
  EXPECT_FALSE(run.commit({"b", ResponseStatus::Success, json::object()}));
  EXPECT_FALSE(run.finish(RunState::Completed));
  EXPECT_EQ(run.ledger().size(), 1u);
}

TEST(WorkflowRunTest, ExpireBeforeStart) {
  WorkflowRun run("wf", "wf");

  // Still queued: nothing to wait for
  auto expiry = run.expire();
  ASSERT_TRUE(expiry.has_value());
  EXPECT_TRUE(expiry->steps.empty());
  EXPECT_FALSE(expiry->started);
  EXPECT_FALSE(run.begin());
  EXPECT_EQ(run.state(), RunState::TimedOut);
}

TEST(WorkflowRunTest, RunIdsAreUnique) {
  std::set<RunId> ids;
  for (int i = 0; i < 100; ++i) {
    WorkflowRun run("wf", "wf");
    EXPECT_EQ(run.id().rfind("run-", 0), 0u);
    ids.insert(run.id());
  }
  EXPECT_EQ(ids.size(), 100u);
}

TEST(WorkflowRunTest, StateNames) {
  EXPECT_EQ(to_string(RunState::TimedOut), "timed_out");
  EXPECT_EQ(to_string(RunState::Failed), "failed");
  EXPECT_TRUE(is_terminal(RunState::Completed));
  EXPECT_FALSE(is_terminal(RunState::Running));
}

// --- PartialProgressTest ---

class PartialProgressTest : public ::testing::Test {
 protected:
  void SetUp() override {
    sink_ = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(64);
    sink_->set_pattern("%v");
    previous_ = spdlog::default_logger();
    auto logger = std::make_shared<spdlog::logger>("partial_progress_test", sink_);
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);
  }

  void TearDown() override {
    spdlog::set_default_logger(previous_);
  }

  bool logged(const std::string& needle) const {
    for (const auto& line : sink_->last_formatted()) {
      if (line.find(needle) != std::string::npos) {
        return true;
      }
    }
    return false;
  }

  static void expect_empty(const PartialProgress& p, double timeout) {
    EXPECT_TRUE(p.completed_steps.empty());
    EXPECT_EQ(p.total_steps_completed, 0);
    EXPECT_DOUBLE_EQ(p.timeout_seconds, timeout);
  }

  std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink_;
  std::shared_ptr<spdlog::logger> previous_;
};

TEST_F(PartialProgressTest, ExtractsStepNamesInOrder) {
  json steps = json::array({{{"step", "generate_plan"}, {"status", "success"}, {"result", json::object()}},
                            {{"step", "assess_risks"}, {"status", "pending"}, {"result", json::object()}}});

  auto p = extract_partial_progress(steps, 2.5);
  EXPECT_EQ(p.completed_steps, (std::vector<std::string>{"generate_plan", "assess_risks"}));
  EXPECT_EQ(p.total_steps_completed, 2);
  EXPECT_DOUBLE_EQ(p.timeout_seconds, 2.5);
}

TEST_F(PartialProgressTest, EmptyLedger) {
  expect_empty(extract_partial_progress(json::array(), 0.2), 0.2);
  EXPECT_FALSE(logged("partial_progress_anomaly"));
}

TEST_F(PartialProgressTest, LedgerNotArray) {
  expect_empty(extract_partial_progress(json::object(), 1.0), 1.0);
  EXPECT_TRUE(logged("ledger_not_array"));
}

TEST_F(PartialProgressTest, EntryNotObject) {
  expect_empty(extract_partial_progress(json::array({"generate_plan"}), 1.0), 1.0);
  EXPECT_TRUE(logged("step_entry_not_object"));
}

TEST_F(PartialProgressTest, StepNameMissing) {
  json steps = json::array({{{"step", "a"}}, {{"status", "success"}}});
  expect_empty(extract_partial_progress(steps, 1.0), 1.0);
  EXPECT_TRUE(logged("step_name_missing"));
}

TEST_F(PartialProgressTest, StepNameNotString) {
  expect_empty(extract_partial_progress(json::array({{{"step", 7}}}), 1.0), 1.0);
  EXPECT_TRUE(logged("step_name_not_string"));
}
