#include "taskweave/config/config.hpp"
#include "taskweave/scheduler/scheduler.hpp"
#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

using namespace taskweave;
using namespace std::chrono_literals;

namespace {

// Sets an environment variable for the lifetime of the guard.
class ScopedEnv {
public:
  ScopedEnv(const char *name, const char *value) : name_(name) {
    ::setenv(name_, value, 1);
  }
  ~ScopedEnv() { ::unsetenv(name_); }

  ScopedEnv(const ScopedEnv &) = delete;
  ScopedEnv &operator=(const ScopedEnv &) = delete;

private:
  const char *name_;
};

constexpr const char *kFullConfig = R"(
[engine]
max_concurrent_tasks = 8
task_timeout_sec = 120
workflow_timeout_sec = 1800
retry_on_failure = false
max_retries = 1
continue_on_failure = true
enable_checkpoints = false
poll_interval_ms = 50

[runtime]
threads = 4

[log]
level = "debug"
file = "/tmp/taskweave.log"

[[schedules]]
name = "nightly_etl"
workflow = "etl"
cron = "0 2 * * *"

[[schedules]]
name = "probe"
workflow = "health"
cron = "*/5 * * * *"
enabled = false
max_runs = 3
)";

} // namespace

TEST(ConfigTest, Defaults) {
  EngineConfig cfg;
  EXPECT_EQ(cfg.engine.max_concurrent_tasks, 5U);
  EXPECT_EQ(cfg.engine.task_timeout, 300s);
  EXPECT_EQ(cfg.engine.workflow_timeout, 3600s);
  EXPECT_TRUE(cfg.engine.retry_on_failure);
  EXPECT_EQ(cfg.engine.max_retries, 3);
  EXPECT_FALSE(cfg.engine.continue_on_failure);
  EXPECT_TRUE(cfg.engine.enable_checkpoints);
  EXPECT_EQ(cfg.engine.poll_interval, 100ms);
  EXPECT_EQ(cfg.runtime.threads, 0U);
  EXPECT_EQ(cfg.log.level, "info");
  EXPECT_TRUE(cfg.log.file.empty());
  EXPECT_TRUE(cfg.schedules.empty());
}

TEST(ConfigTest, MissingSectionsYieldDefaults) {
  auto result = ConfigLoader::load_from_string("[log]\nlevel = \"info\"\n");
  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ(result->engine.max_concurrent_tasks, 5U);
  EXPECT_EQ(result->log.level, "info");
}

TEST(ConfigTest, LoadFromTomlString) {
  auto result = ConfigLoader::load_from_string(kFullConfig);
  ASSERT_TRUE(result.has_value()) << result.error().message();

  const auto &e = result->engine;
  EXPECT_EQ(e.max_concurrent_tasks, 8U);
  EXPECT_EQ(e.task_timeout, 120s);
  EXPECT_EQ(e.workflow_timeout, 1800s);
  EXPECT_FALSE(e.retry_on_failure);
  EXPECT_EQ(e.max_retries, 1);
  EXPECT_TRUE(e.continue_on_failure);
  EXPECT_FALSE(e.enable_checkpoints);
  EXPECT_EQ(e.poll_interval, 50ms);
  EXPECT_EQ(result->runtime.threads, 4U);
  EXPECT_EQ(result->log.level, "debug");
  EXPECT_EQ(result->log.file, "/tmp/taskweave.log");

  ASSERT_EQ(result->schedules.size(), 2U);
  EXPECT_EQ(result->schedules[0].name, "nightly_etl");
  EXPECT_EQ(result->schedules[0].workflow, "etl");
  EXPECT_EQ(result->schedules[0].cron, "0 2 * * *");
  EXPECT_TRUE(result->schedules[0].enabled);
  EXPECT_FALSE(result->schedules[0].max_runs.has_value());
  EXPECT_FALSE(result->schedules[1].enabled);
  EXPECT_EQ(result->schedules[1].max_runs, 3U);
}

TEST(ConfigTest, UnknownKeysIgnored) {
  auto result = ConfigLoader::load_from_string(R"(
[engine]
max_concurrent_tasks = 2
future_knob = "x"

[metrics]
enabled = true
)");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->engine.max_concurrent_tasks, 2U);
}

TEST(ConfigTest, EnvOverridesWin) {
  ScopedEnv level("TASKWEAVE_LOG_LEVEL", "warn");
  ScopedEnv concurrency("TASKWEAVE_MAX_CONCURRENT_TASKS", "12");
  ScopedEnv threads("TASKWEAVE_RUNTIME_THREADS", "3");

  auto result = ConfigLoader::load_from_string(kFullConfig);
  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ(result->log.level, "warn");
  EXPECT_EQ(result->engine.max_concurrent_tasks, 12U);
  EXPECT_EQ(result->runtime.threads, 3U);
}

TEST(ConfigTest, MalformedEnvOverrideRejected) {
  ScopedEnv concurrency("TASKWEAVE_MAX_CONCURRENT_TASKS", "lots");
  std::string diagnostic;
  auto result =
      ConfigLoader::load_from_string("[log]\nlevel = \"info\"\n", &diagnostic);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
  EXPECT_FALSE(diagnostic.empty());
}

TEST(ConfigTest, InvalidValuesRejected) {
  for (const char *toml : {
           "[engine]\nmax_concurrent_tasks = 0\n",
           "[engine]\nmax_concurrent_tasks = -3\n",
           "[engine]\ntask_timeout_sec = 0\n",
           "[engine]\nmax_retries = -1\n",
           "[engine]\npoll_interval_ms = 0\n",
           "[runtime]\nthreads = -1\n",
           "[log]\nlevel = \"loud\"\n",
       }) {
    auto result = ConfigLoader::load_from_string(toml);
    ASSERT_FALSE(result.has_value()) << toml;
    EXPECT_EQ(result.error(), make_error_code(Error::ParseError)) << toml;
  }
}

TEST(ConfigTest, InvalidSchedulesRejected) {
  auto bad_cron = ConfigLoader::load_from_string(R"(
[[schedules]]
name = "broken"
workflow = "etl"
cron = "61 * * * *"
)");
  ASSERT_FALSE(bad_cron.has_value());
  EXPECT_EQ(bad_cron.error(), make_error_code(Error::ParseError));

  auto no_workflow = ConfigLoader::load_from_string(R"(
[[schedules]]
name = "orphan"
)");
  ASSERT_FALSE(no_workflow.has_value());
  EXPECT_EQ(no_workflow.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, SyntaxErrorHasDiagnostic) {
  std::string diagnostic;
  auto result =
      ConfigLoader::load_from_string("[engine\nmax_concurrent_tasks = ", &diagnostic);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
  EXPECT_FALSE(diagnostic.empty());
}

TEST(ConfigTest, LoadFromFile) {
  const auto path = test::make_temp_path("taskweave_config_");
  ASSERT_FALSE(path.empty());
  {
    std::ofstream out(path);
    out << kFullConfig;
  }

  auto result = ConfigLoader::load_from_file(path);
  std::remove(path.c_str());
  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ(result->engine.max_concurrent_tasks, 8U);
  EXPECT_EQ(result->schedules.size(), 2U);
}

TEST(ConfigTest, MissingFile) {
  auto result = ConfigLoader::load_from_file("/nonexistent/taskweave.toml");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::FileNotFound));
}

TEST(ConfigTest, RenderedTomlLoadsBack) {
  auto original = ConfigLoader::load_from_string(kFullConfig);
  ASSERT_TRUE(original.has_value());

  const auto text = to_toml(*original);
  EXPECT_NE(text.find("[engine]"), std::string::npos);
  EXPECT_NE(text.find("max_concurrent_tasks = 8"), std::string::npos);
  EXPECT_NE(text.find("[[schedules]]"), std::string::npos);
  EXPECT_NE(text.find("max_runs = 3"), std::string::npos);

  auto reloaded = ConfigLoader::load_from_string(text);
  ASSERT_TRUE(reloaded.has_value()) << text;
  EXPECT_EQ(reloaded->engine.task_timeout, original->engine.task_timeout);
  EXPECT_EQ(reloaded->runtime, original->runtime);
  EXPECT_EQ(reloaded->log, original->log);
  EXPECT_EQ(reloaded->schedules, original->schedules);
}

TEST(ConfigTest, SchedulesRegisterWithScheduler) {
  auto cfg = ConfigLoader::load_from_string(kFullConfig);
  ASSERT_TRUE(cfg.has_value());

  Scheduler scheduler;
  auto ids = register_schedules(scheduler, *cfg);
  ASSERT_TRUE(ids.has_value()) << ids.error().message();
  ASSERT_EQ(ids->size(), 2U);
  EXPECT_EQ(scheduler.size(), 2U);

  auto nightly = scheduler.get_job((*ids)[0]);
  ASSERT_TRUE(nightly.has_value());
  EXPECT_EQ(nightly->name, "nightly_etl");
  EXPECT_EQ(nightly->workflow_id, WorkflowId{"etl"});
  EXPECT_EQ(nightly->cron.expression(), "0 2 * * *");
  EXPECT_TRUE(nightly->next_run.has_value());

  auto health = scheduler.get_job((*ids)[1]);
  ASSERT_TRUE(health.has_value());
  EXPECT_FALSE(health->config.enabled);
  EXPECT_EQ(health->config.max_runs, 3U);
}

TEST(ConfigTest, RejectedScheduleRegistersNothing) {
  EngineConfig cfg;
  cfg.schedules = {
      ScheduleEntry{.name = "hourly", .workflow = "a", .cron = "0 * * * *"},
      ScheduleEntry{.name = "hourly", .workflow = "b", .cron = "30 * * * *"},
  };

  Scheduler scheduler;
  auto ids = register_schedules(scheduler, cfg);
  ASSERT_FALSE(ids.has_value());
  EXPECT_EQ(ids.error(), make_error_code(SchedulerError::Conflict));
  EXPECT_EQ(scheduler.size(), 0U);
}
