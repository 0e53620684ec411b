#pragma once

#include "taskweave/core/constants.hpp"
#include "taskweave/task/task.hpp"
#include "taskweave/util/id.hpp"
#include "taskweave/util/time.hpp"
#include "taskweave/workflow/workflow.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace taskweave {

/// Engine-wide defaults. Per-task and per-workflow settings take precedence
/// except where noted.
struct ExecutionConfig {
  // Upper bound on a run's concurrency, combined with the workflow's own.
  std::size_t max_concurrent_tasks{5};
  // Used for tasks configured with a zero timeout.
  std::chrono::seconds task_timeout{task_defaults::kTimeout};
  // Used for workflows configured with a zero timeout.
  std::chrono::seconds workflow_timeout{workflow_defaults::kTimeout};
  // false disables the retry loop entirely.
  bool retry_on_failure{true};
  // Ceiling on retries for any task.
  int max_retries{task_defaults::kMaxRetries};
  // Keep dispatching after a failure even if the workflow would stop.
  bool continue_on_failure{false};
  // Advisory: nothing is persisted.
  bool enable_checkpoints{true};
  std::chrono::milliseconds poll_interval{timing::kDefaultPollInterval};
};

struct ExecutionResult {
  WorkflowId workflow_id;
  std::string workflow_name;
  WorkflowStatus status{WorkflowStatus::Created};
  // In execution order.
  std::vector<TaskResult> task_results;
  util::TimePoint started_at{};
  std::optional<util::TimePoint> completed_at;
  std::chrono::milliseconds duration{0};
  std::optional<std::string> error;

  [[nodiscard]] auto succeeded() const noexcept -> bool {
    return status == WorkflowStatus::Completed;
  }
};

} // namespace taskweave
