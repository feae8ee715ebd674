#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "agentflow/core/config.hpp"

using namespace agentflow;

namespace fs = std::filesystem;

// --- ConfigTest ---

TEST(ConfigTest, Defaults) {
  Config config;

  EXPECT_DOUBLE_EQ(config.default_timeout_seconds, 30.0);
  EXPECT_EQ(config.worker_threads, 4u);
  EXPECT_EQ(config.broker.queue_capacity, 1000u);
  EXPECT_EQ(config.log_level, "info");
  EXPECT_FALSE(config.log_file.has_value());
}

TEST(ConfigTest, DefaultRouting) {
  Config config;

  EXPECT_EQ(config.route("generate_plan"), "project_plan_agent");
  EXPECT_EQ(config.route("update_risk"), "risk_assessment_agent");
  EXPECT_EQ(config.route("schedule_report"), "status_reporter_agent");
  EXPECT_FALSE(config.route("nonexistent").has_value());
}

TEST(ConfigTest, DefaultWorkflow) {
  Config config;

  auto wf = config.get_workflow("project_initialization");
  ASSERT_TRUE(wf.has_value());
  ASSERT_EQ(wf->steps.size(), 3u);
  EXPECT_EQ(wf->steps[0].name, "generate_plan");
  EXPECT_TRUE(wf->steps[0].inputs.empty());

  // Report step: plan plus the risk list
  const auto& report = wf->steps[2];
  ASSERT_EQ(report.inputs.size(), 2u);
  EXPECT_EQ(report.inputs[1].step, "assess_risks");
  EXPECT_EQ(report.inputs[1].field, "risks");
  EXPECT_EQ(report.inputs[1].as, "risks");

  EXPECT_FALSE(config.get_workflow("nonexistent").has_value());
}

TEST(ConfigTest, SaveAndLoad) {
  auto path = fs::temp_directory_path() / "agentflow_test_config.json";

  Config config;
  config.default_timeout_seconds = 2.5;
  config.worker_threads = 8;
  config.broker.queue_capacity = 16;
  config.routing["ping"] = "echo_agent";
  config.log_level = "debug";
  config.log_file = "/tmp/agentflow_test.log";

  WorkflowConfig wf;
  wf.type = "triage";
  InputSource source;
  source.from = InputSource::From::Step;
  source.step = "classify";
  source.field = "label";
  source.as = "label";
  wf.steps.push_back({"classify", "classifier", "", {}});
  wf.steps.push_back({"route", "router", "route_ticket", {source}});
  config.workflows["triage"] = wf;

  config.save(path);
  auto loaded = Config::load(path);
  fs::remove(path);

  EXPECT_DOUBLE_EQ(loaded.default_timeout_seconds, 2.5);
  EXPECT_EQ(loaded.worker_threads, 8u);
  EXPECT_EQ(loaded.broker.queue_capacity, 16u);
  EXPECT_EQ(loaded.route("ping"), "echo_agent");
  EXPECT_EQ(loaded.log_level, "debug");
  ASSERT_TRUE(loaded.log_file.has_value());
  EXPECT_EQ(loaded.log_file->string(), "/tmp/agentflow_test.log");

  auto triage = loaded.get_workflow("triage");
  ASSERT_TRUE(triage.has_value());
  ASSERT_EQ(triage->steps.size(), 2u);
  EXPECT_TRUE(triage->steps[0].message_type.empty());
  EXPECT_EQ(triage->steps[1].message_type, "route_ticket");
  ASSERT_EQ(triage->steps[1].inputs.size(), 1u);
  EXPECT_EQ(triage->steps[1].inputs[0].from, InputSource::From::Step);
  EXPECT_EQ(triage->steps[1].inputs[0].field, "label");

  // The built-in workflow survives a round trip
  EXPECT_TRUE(loaded.get_workflow("project_initialization").has_value());
}

TEST(ConfigTest, LoadMissingFileGivesDefaults) {
  auto config = Config::load(fs::temp_directory_path() / "agentflow_does_not_exist.json");
  EXPECT_DOUBLE_EQ(config.default_timeout_seconds, 30.0);
}

TEST(ConfigTest, LoadMalformedFileGivesDefaults) {
  auto path = fs::temp_directory_path() / "agentflow_malformed_config.json";
  {
    std::ofstream file(path);
    file << "{ \"default_timeout_seconds\": ";
  }

  auto config = Config::load(path);
  fs::remove(path);

  EXPECT_DOUBLE_EQ(config.default_timeout_seconds, 30.0);
  EXPECT_EQ(config.worker_threads, 4u);
}

TEST(ConfigTest, AbsentKeysKeepDefaults) {
  auto path = fs::temp_directory_path() / "agentflow_partial_config.json";
  {
    std::ofstream file(path);
    file << R"({"worker_threads": 2})";
  }

  auto config = Config::load(path);
  fs::remove(path);

  EXPECT_EQ(config.worker_threads, 2u);
  EXPECT_DOUBLE_EQ(config.default_timeout_seconds, 30.0);
  EXPECT_EQ(config.route("generate_plan"), "project_plan_agent");
}

TEST(ConfigTest, InvalidFileValuesKeepDefaults) {
  auto path = fs::temp_directory_path() / "agentflow_invalid_values_config.json";
  {
    std::ofstream file(path);
    file << R"({"default_timeout_seconds": -5, "worker_threads": -3, "broker": {"queue_capacity": "many"}})";
  }

  auto config = Config::load(path);
  fs::remove(path);

  EXPECT_DOUBLE_EQ(config.default_timeout_seconds, 30.0);
  EXPECT_EQ(config.worker_threads, 4u);
  EXPECT_EQ(config.broker.queue_capacity, 1000u);
}

// --- ConfigEnvTest ---

class ConfigEnvTest : public ::testing::Test {
 protected:
  void SetUp() override {
    // Isolate from the user's real config
    home_ = fs::temp_directory_path() / "agentflow_env_home";
    fs::create_directories(home_);
    const char* old_home = std::getenv("HOME");
    if (old_home) {
      saved_home_ = old_home;
    }
    setenv("HOME", home_.c_str(), 1);
  }

  void TearDown() override {
    for (const char* name : {"AGENTFLOW_DEFAULT_TIMEOUT", "AGENTFLOW_WORKER_THREADS", "AGENTFLOW_QUEUE_CAPACITY",
                             "AGENTFLOW_LOG_LEVEL", "AGENTFLOW_LOG_FILE"}) {
      unsetenv(name);
    }
    if (saved_home_) {
      setenv("HOME", saved_home_->c_str(), 1);
    } else {
      unsetenv("HOME");
    }
    fs::remove_all(home_);
  }

  fs::path home_;
  std::optional<std::string> saved_home_;
};

TEST_F(ConfigEnvTest, Overrides) {
  setenv("AGENTFLOW_DEFAULT_TIMEOUT", "0.75", 1);
  setenv("AGENTFLOW_WORKER_THREADS", "6", 1);
  setenv("AGENTFLOW_QUEUE_CAPACITY", "50", 1);
  setenv("AGENTFLOW_LOG_LEVEL", "warn", 1);
  setenv("AGENTFLOW_LOG_FILE", "/tmp/agentflow_env.log", 1);

  auto config = Config::from_env();

  EXPECT_DOUBLE_EQ(config.default_timeout_seconds, 0.75);
  EXPECT_EQ(config.worker_threads, 6u);
  EXPECT_EQ(config.broker.queue_capacity, 50u);
  EXPECT_EQ(config.log_level, "warn");
  ASSERT_TRUE(config.log_file.has_value());
  EXPECT_EQ(config.log_file->string(), "/tmp/agentflow_env.log");
}

TEST_F(ConfigEnvTest, BadValuesAreIgnored) {
  setenv("AGENTFLOW_DEFAULT_TIMEOUT", "soon", 1);
  setenv("AGENTFLOW_WORKER_THREADS", "-3", 1);

  auto config = Config::from_env();

  EXPECT_DOUBLE_EQ(config.default_timeout_seconds, 30.0);
  EXPECT_EQ(config.worker_threads, 4u);
}

TEST_F(ConfigEnvTest, NonFiniteAndOutOfRangeValuesAreIgnored) {
  setenv("AGENTFLOW_DEFAULT_TIMEOUT", "nan", 1);
  setenv("AGENTFLOW_WORKER_THREADS", "1e30", 1);
  setenv("AGENTFLOW_QUEUE_CAPACITY", "inf", 1);

  auto config = Config::from_env();

  EXPECT_DOUBLE_EQ(config.default_timeout_seconds, 30.0);
  EXPECT_EQ(config.worker_threads, 4u);
  EXPECT_EQ(config.broker.queue_capacity, 1000u);

  setenv("AGENTFLOW_DEFAULT_TIMEOUT", "inf", 1);
  EXPECT_DOUBLE_EQ(Config::from_env().default_timeout_seconds, 30.0);
}

TEST_F(ConfigEnvTest, GlobalConfigFileIsUsed) {
  fs::create_directories(config_paths::config_dir());
  {
    std::ofstream file(config_paths::default_config_file());
    file << R"({"default_timeout_seconds": 12.0})";
  }

  // Skip when the working directory carries its own project config
  if (fs::exists(config_paths::project_config_file())) {
    GTEST_SKIP();
  }

  EXPECT_DOUBLE_EQ(Config::load_default().default_timeout_seconds, 12.0);
}

// --- ConfigPathsTest ---

TEST(ConfigPathsTest, Layout) {
  EXPECT_EQ(config_paths::config_dir(), config_paths::home_dir() / ".config" / "agentflow");
  EXPECT_EQ(config_paths::default_config_file().filename(), "config.json");
  EXPECT_EQ(config_paths::project_config_file().parent_path().filename(), ".agentflow");
}
