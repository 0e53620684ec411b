#pragma once

#include "taskweave/core/error.hpp"
#include "taskweave/task/task.hpp"
#include "taskweave/util/enum.hpp"
#include "taskweave/util/id.hpp"
#include "taskweave/util/json.hpp"
#include "taskweave/util/string_hash.hpp"
#include "taskweave/util/time.hpp"
#include "taskweave/workflow/workflow_error.hpp"

#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace taskweave {

namespace workflow_defaults {
inline constexpr std::chrono::seconds kTimeout{3600};
inline constexpr std::size_t kMaxConcurrentTasks{5};
inline constexpr std::string_view kVersion{"1.0.0"};
} // namespace workflow_defaults

enum class WorkflowStatus : std::uint8_t {
  Created,
  Queued,
  Running,
  Paused,
  Completed,
  Failed,
  Cancelled,
};
BOOST_DESCRIBE_ENUM(WorkflowStatus, Created, Queued, Running, Paused,
                    Completed, Failed, Cancelled)
TASKWEAVE_DEFINE_ENUM_SERDE(WorkflowStatus, WorkflowStatus::Created)

[[nodiscard]] constexpr auto is_terminal(WorkflowStatus s) noexcept -> bool {
  return s == WorkflowStatus::Completed || s == WorkflowStatus::Failed ||
         s == WorkflowStatus::Cancelled;
}

struct WorkflowConfig {
  std::string name;
  std::string description;
  std::string version{workflow_defaults::kVersion};
  // Zero means "use the engine default".
  std::chrono::seconds timeout{workflow_defaults::kTimeout};
  bool parallel_execution{true};
  std::size_t max_concurrent_tasks{workflow_defaults::kMaxConcurrentTasks};
  // Advisory: nothing is persisted.
  bool enable_checkpoints{true};
  bool continue_on_failure{false};
  std::vector<std::string> tags;
  JsonValue metadata{};
};

/// A set of named tasks and the dependency edges between them. Owned by the
/// caller; one engine run mutates task statuses and results in place.
class Workflow {
public:
  explicit Workflow(std::string name);
  explicit Workflow(WorkflowConfig config);

  [[nodiscard]] auto id() const noexcept -> const WorkflowId & { return id_; }
  [[nodiscard]] auto name() const noexcept -> const std::string & {
    return config_.name;
  }
  [[nodiscard]] auto config() const noexcept -> const WorkflowConfig & {
    return config_;
  }

  /// Appends a task and recomputes the execution order. Names must be
  /// unique.
  [[nodiscard]] auto add_task(Task task) -> Result<void>;

  [[nodiscard]] auto get_task(std::string_view name) -> Task *;
  [[nodiscard]] auto get_task(std::string_view name) const -> const Task *;
  [[nodiscard]] auto tasks() noexcept -> std::span<Task> { return tasks_; }
  [[nodiscard]] auto tasks() const noexcept -> std::span<const Task> {
    return tasks_;
  }
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return tasks_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return tasks_.empty(); }

  /// Task names with every task after all of its dependencies. Back edges
  /// of a cycle are ignored.
  [[nodiscard]] auto task_order() const noexcept
      -> const std::vector<std::string> & {
    return task_order_;
  }
  [[nodiscard]] auto tasks_in_order() const -> std::vector<const Task *>;

  /// Pending tasks whose dependencies all have a Completed result, highest
  /// priority first, then in execution order.
  [[nodiscard]] auto get_runnable_task_names() const
      -> std::vector<std::string>;
  [[nodiscard]] auto dependencies_met(std::string_view name) const -> bool;

  /// Pending tasks that can never become runnable: a dependency is missing,
  /// ended without completing, or is itself blocked.
  [[nodiscard]] auto blocked_task_names() const -> std::vector<std::string>;

  auto store_result(TaskResult result) -> void;
  [[nodiscard]] auto get_result(std::string_view name) const
      -> const TaskResult *;
  [[nodiscard]] auto results() const noexcept
      -> const StringMap<TaskResult> & {
    return results_;
  }

  /// Marks a Pending task Skipped. A skipped task is terminal but does not
  /// satisfy its dependents, which stay blocked.
  [[nodiscard]] auto skip_task(std::string_view name) -> Result<void>;

  [[nodiscard]] auto is_complete() const -> bool;
  [[nodiscard]] auto has_failed() const -> bool;
  [[nodiscard]] auto progress() const -> double;

  [[nodiscard]] auto status() const noexcept -> WorkflowStatus {
    return status_;
  }
  auto set_status(WorkflowStatus status) -> void;

  [[nodiscard]] auto created_at() const noexcept -> util::TimePoint {
    return created_at_;
  }
  [[nodiscard]] auto started_at() const noexcept
      -> std::optional<util::TimePoint> {
    return started_at_;
  }
  [[nodiscard]] auto completed_at() const noexcept
      -> std::optional<util::TimePoint> {
    return completed_at_;
  }

  /// Task names along the first dependency cycle found, first name
  /// repeated at the end. Empty when acyclic.
  [[nodiscard]] auto find_cycle() const -> std::vector<std::string>;

  /// Rejects empty and cyclic workflows.
  [[nodiscard]] auto validate() const -> Result<void>;

private:
  auto recompute_order() -> void;
  [[nodiscard]] auto index_of(std::string_view name) const
      -> std::optional<std::size_t>;

  WorkflowId id_;
  WorkflowConfig config_;
  std::vector<Task> tasks_;
  StringMap<std::size_t> index_;
  std::vector<std::string> task_order_;
  StringMap<TaskResult> results_;
  WorkflowStatus status_{WorkflowStatus::Created};
  util::TimePoint created_at_;
  std::optional<util::TimePoint> started_at_;
  std::optional<util::TimePoint> completed_at_;
};

class WorkflowBuilder {
public:
  explicit WorkflowBuilder(std::string name);

  auto description(std::string text) -> WorkflowBuilder &&;
  auto version(std::string v) -> WorkflowBuilder &&;
  auto timeout(std::chrono::seconds t) -> WorkflowBuilder &&;
  auto parallel(std::size_t max_concurrent) -> WorkflowBuilder &&;
  auto sequential() -> WorkflowBuilder &&;
  auto max_concurrent(std::size_t n) -> WorkflowBuilder &&;
  auto continue_on_failure(bool enabled = true) -> WorkflowBuilder &&;
  auto checkpoints(bool enabled) -> WorkflowBuilder &&;
  auto tag(std::string t) -> WorkflowBuilder &&;
  auto metadata(JsonValue m) -> WorkflowBuilder &&;
  auto add_task(Task task) -> WorkflowBuilder &&;

  /// Fails on an empty workflow, a duplicate task name or a dependency
  /// cycle.
  [[nodiscard]] auto build() && -> Result<Workflow>;

private:
  WorkflowConfig config_;
  std::vector<Task> tasks_;
};

} // namespace taskweave
