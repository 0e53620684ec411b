#include "taskweave/workflow/workflow.hpp"
#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

namespace taskweave {
namespace {

using namespace std::chrono_literals;

auto position(const std::vector<std::string> &order, std::string_view name)
    -> std::ptrdiff_t {
  return std::ranges::find(order, name) - order.begin();
}

auto completed(const Task &t) -> TaskResult {
  return TaskResult{.task_id = t.id(),
                    .task_name = t.name(),
                    .status = TaskStatus::Completed,
                    .output = JsonValue{{"task", t.name()}}};
}

auto failed(const Task &t) -> TaskResult {
  return TaskResult{.task_id = t.id(),
                    .task_name = t.name(),
                    .status = TaskStatus::Failed,
                    .error = "Task execution failed: boom"};
}

class WorkflowTest : public ::testing::Test {
protected:
  auto add(std::string name, std::vector<std::string> deps = {},
           int priority = 0) -> void {
    auto r = wf_.add_task(test::make_task(Task::builder(std::move(name))
                                              .depends_on_all(std::move(deps))
                                              .priority(priority)));
    ASSERT_TRUE(r.has_value()) << r.error().message();
  }

  auto complete(std::string_view name) -> void {
    wf_.store_result(completed(*wf_.get_task(name)));
  }

  Workflow wf_{"test_wf"};
};

TEST_F(WorkflowTest, ConfigDefaults) {
  const auto &cfg = wf_.config();
  EXPECT_EQ(cfg.name, "test_wf");
  EXPECT_EQ(cfg.version, "1.0.0");
  EXPECT_EQ(cfg.timeout, 3600s);
  EXPECT_TRUE(cfg.parallel_execution);
  EXPECT_EQ(cfg.max_concurrent_tasks, 5U);
  EXPECT_TRUE(cfg.enable_checkpoints);
  EXPECT_FALSE(cfg.continue_on_failure);
  EXPECT_EQ(wf_.status(), WorkflowStatus::Created);
  EXPECT_TRUE(wf_.empty());
}

TEST_F(WorkflowTest, OrderPlacesDependenciesFirst) {
  // Added out of order on purpose.
  add("report", {"join"});
  add("join", {"left", "right"});
  add("left", {"extract"});
  add("right", {"extract"});
  add("extract");

  const auto &order = wf_.task_order();
  ASSERT_EQ(order.size(), 5U);
  for (const auto &t : wf_.tasks()) {
    for (const auto &dep : t.dependencies()) {
      EXPECT_LT(position(order, dep), position(order, t.name()))
          << dep << " must come before " << t.name();
    }
  }

  auto in_order = wf_.tasks_in_order();
  ASSERT_EQ(in_order.size(), 5U);
  EXPECT_EQ(in_order.front()->name(), "extract");
  EXPECT_EQ(in_order.back()->name(), "report");
}

TEST_F(WorkflowTest, DuplicateNameRejected) {
  add("a");
  auto r = wf_.add_task(test::make_task(Task::builder("a")));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(WorkflowError::DuplicateTask));
  EXPECT_EQ(wf_.size(), 1U);
}

TEST_F(WorkflowTest, RunnableRequiresCompletedDependencies) {
  add("a");
  add("b", {"a"});
  add("c", {"b"});

  EXPECT_EQ(wf_.get_runnable_task_names(), std::vector<std::string>{"a"});
  EXPECT_FALSE(wf_.dependencies_met("b"));

  complete("a");
  EXPECT_EQ(wf_.get_runnable_task_names(), std::vector<std::string>{"b"});
  EXPECT_TRUE(wf_.dependencies_met("b"));
  EXPECT_FALSE(wf_.dependencies_met("c"));

  complete("b");
  EXPECT_EQ(wf_.get_runnable_task_names(), std::vector<std::string>{"c"});
}

TEST_F(WorkflowTest, FailedDependencyNeverMet) {
  add("a");
  add("b", {"a"});
  wf_.store_result(failed(*wf_.get_task("a")));

  EXPECT_TRUE(wf_.get_runnable_task_names().empty());
  EXPECT_EQ(wf_.blocked_task_names(), std::vector<std::string>{"b"});
  EXPECT_TRUE(wf_.has_failed());
}

TEST_F(WorkflowTest, MissingDependencyNeverMet) {
  add("orphan", {"ghost"});
  EXPECT_TRUE(wf_.get_runnable_task_names().empty());
  EXPECT_FALSE(wf_.dependencies_met("orphan"));
  EXPECT_EQ(wf_.blocked_task_names(), std::vector<std::string>{"orphan"});
  // Missing references are not a structural error.
  EXPECT_TRUE(wf_.validate().has_value());
}

TEST_F(WorkflowTest, RunnableSortedByPriority) {
  add("low", {}, 1);
  add("high", {}, 10);
  add("mid", {}, 5);
  add("also_low", {}, 1);

  auto names = wf_.get_runnable_task_names();
  ASSERT_EQ(names.size(), 4U);
  EXPECT_EQ(names[0], "high");
  EXPECT_EQ(names[1], "mid");
  // Ties keep execution order.
  EXPECT_LT(position(names, "low"), position(names, "also_low"));
}

TEST_F(WorkflowTest, CycleToleratedByAddTaskRejectedByValidate) {
  add("a", {"c"});
  add("b", {"a"});
  add("c", {"b"});

  EXPECT_EQ(wf_.task_order().size(), 3U);
  auto cycle = wf_.find_cycle();
  ASSERT_GE(cycle.size(), 4U);
  EXPECT_EQ(cycle.front(), cycle.back());

  auto r = wf_.validate();
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(WorkflowError::CircularDependency));
}

TEST_F(WorkflowTest, SelfDependencyIsACycle) {
  add("self", {"self"});
  EXPECT_FALSE(wf_.find_cycle().empty());
  EXPECT_FALSE(wf_.validate().has_value());
}

TEST_F(WorkflowTest, EmptyWorkflowInvalid) {
  auto r = wf_.validate();
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(WorkflowError::EmptyWorkflow));
}

TEST_F(WorkflowTest, CompletionAndProgress) {
  add("a");
  add("b");
  EXPECT_FALSE(wf_.is_complete());
  EXPECT_DOUBLE_EQ(wf_.progress(), 0.0);

  complete("a");
  EXPECT_FALSE(wf_.is_complete());
  EXPECT_DOUBLE_EQ(wf_.progress(), 0.5);
  EXPECT_EQ(wf_.get_task("a")->status(), TaskStatus::Completed);

  complete("b");
  EXPECT_TRUE(wf_.is_complete());
  EXPECT_DOUBLE_EQ(wf_.progress(), 1.0);
  EXPECT_EQ(wf_.results().size(), 2U);
  ASSERT_NE(wf_.get_result("b"), nullptr);
  EXPECT_EQ(wf_.get_result("b")->status, TaskStatus::Completed);
  EXPECT_EQ(wf_.get_result("zzz"), nullptr);
}

TEST_F(WorkflowTest, SkipTaskIsTerminalButDoesNotSatisfyDependents) {
  add("optional");
  add("after", {"optional"});

  ASSERT_TRUE(wf_.skip_task("optional").has_value());
  EXPECT_EQ(wf_.get_task("optional")->status(), TaskStatus::Skipped);
  EXPECT_FALSE(wf_.dependencies_met("after"));
  EXPECT_EQ(wf_.blocked_task_names(), std::vector<std::string>{"after"});

  auto again = wf_.skip_task("optional");
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error(), make_error_code(Error::InvalidState));

  auto missing = wf_.skip_task("nope");
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), make_error_code(WorkflowError::TaskNotFound));
}

TEST_F(WorkflowTest, ContinueOnFailureMasksFailure) {
  Workflow lenient(WorkflowConfig{.name = "lenient",
                                  .continue_on_failure = true});
  ASSERT_TRUE(
      lenient.add_task(test::make_task(Task::builder("a"))).has_value());
  lenient.store_result(failed(*lenient.get_task("a")));
  EXPECT_FALSE(lenient.has_failed());
}

TEST_F(WorkflowTest, StatusTimestamps) {
  EXPECT_FALSE(wf_.started_at().has_value());
  wf_.set_status(WorkflowStatus::Running);
  ASSERT_TRUE(wf_.started_at().has_value());
  EXPECT_FALSE(wf_.completed_at().has_value());
  wf_.set_status(WorkflowStatus::Completed);
  ASSERT_TRUE(wf_.completed_at().has_value());
  EXPECT_GE(*wf_.completed_at(), *wf_.started_at());
}

TEST(WorkflowBuilderTest, BuildsConfiguredWorkflow) {
  auto wf = WorkflowBuilder("etl")
                .description("nightly load")
                .version("2.0.0")
                .timeout(60s)
                .parallel(3)
                .continue_on_failure()
                .tag("nightly")
                .add_task(test::make_task(Task::builder("extract")))
                .add_task(test::make_task(
                    Task::builder("load").depends_on("extract")))
                .build();
  ASSERT_TRUE(wf.has_value()) << wf.error().message();
  EXPECT_EQ(wf->name(), "etl");
  EXPECT_EQ(wf->config().description, "nightly load");
  EXPECT_EQ(wf->config().version, "2.0.0");
  EXPECT_EQ(wf->config().timeout, 60s);
  EXPECT_TRUE(wf->config().parallel_execution);
  EXPECT_EQ(wf->config().max_concurrent_tasks, 3U);
  EXPECT_TRUE(wf->config().continue_on_failure);
  EXPECT_EQ(wf->config().tags, std::vector<std::string>{"nightly"});
  EXPECT_EQ(wf->task_order(),
            (std::vector<std::string>{"extract", "load"}));
}

TEST(WorkflowBuilderTest, SequentialForcesSingleSlot) {
  auto wf = WorkflowBuilder("seq")
                .sequential()
                .add_task(test::make_task(Task::builder("a")))
                .build();
  ASSERT_TRUE(wf.has_value());
  EXPECT_FALSE(wf->config().parallel_execution);
  EXPECT_EQ(wf->config().max_concurrent_tasks, 1U);
}

TEST(WorkflowBuilderTest, RejectsEmpty) {
  auto wf = WorkflowBuilder("empty").build();
  ASSERT_FALSE(wf.has_value());
  EXPECT_EQ(wf.error(), make_error_code(WorkflowError::EmptyWorkflow));
}

TEST(WorkflowBuilderTest, RejectsCycle) {
  auto wf = WorkflowBuilder("loop")
                .add_task(test::make_task(Task::builder("a").depends_on("b")))
                .add_task(test::make_task(Task::builder("b").depends_on("a")))
                .build();
  ASSERT_FALSE(wf.has_value());
  EXPECT_EQ(wf.error(), make_error_code(WorkflowError::CircularDependency));
}

TEST(WorkflowBuilderTest, RejectsDuplicate) {
  auto wf = WorkflowBuilder("dup")
                .add_task(test::make_task(Task::builder("a")))
                .add_task(test::make_task(Task::builder("a")))
                .build();
  ASSERT_FALSE(wf.has_value());
  EXPECT_EQ(wf.error(), make_error_code(WorkflowError::DuplicateTask));
}

TEST(WorkflowErrorTest, Messages) {
  EXPECT_EQ(make_error_code(WorkflowError::EmptyWorkflow).message(),
            "Workflow is empty");
  EXPECT_EQ(make_error_code(WorkflowError::CircularDependency).message(),
            "Circular dependency detected");
  EXPECT_EQ(make_error_code(WorkflowError::Timeout).message(),
            "Workflow timed out");
  EXPECT_EQ(std::error_code(WorkflowError::Timeout),
            std::errc::timed_out);
}

} // namespace
} // namespace taskweave
