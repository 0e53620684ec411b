#pragma once

#include "taskweave/core/coroutine.hpp"
#include "taskweave/core/error.hpp"
#include "taskweave/executor/execution.hpp"
#include "taskweave/executor/semaphore.hpp"
#include "taskweave/task/context.hpp"
#include "taskweave/task/task.hpp"
#include "taskweave/util/id.hpp"
#include "taskweave/util/string_hash.hpp"
#include "taskweave/workflow/workflow.hpp"

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace taskweave {

/// Drives workflows to completion. One engine can run many workflows at
/// once; each run gets its own concurrency limit. The engine must outlive
/// every run it started.
class WorkflowEngine {
public:
  explicit WorkflowEngine(ExecutionConfig config = {});

  WorkflowEngine(const WorkflowEngine &) = delete;
  WorkflowEngine &operator=(const WorkflowEngine &) = delete;

  [[nodiscard]] auto config() const noexcept -> const ExecutionConfig & {
    return config_;
  }

  /// Runs `workflow` to completion. `workflow` must stay alive and must not
  /// be touched by the caller until the returned task finishes. Only
  /// invalid workflows produce an error; task failures, timeouts and
  /// cancellation are reported through ExecutionResult::status.
  [[nodiscard]] auto execute(Workflow &workflow,
                             StringMap<JsonValue> parameters = {})
      -> task<Result<ExecutionResult>>;

  /// Registry controls. They take effect between dispatch rounds; running
  /// handlers observe cancellation through TaskContext::is_cancelled().
  auto cancel(const WorkflowId &id) -> bool;
  auto pause(const WorkflowId &id) -> bool;
  auto resume(const WorkflowId &id) -> bool;

  [[nodiscard]] auto get_status(const WorkflowId &id) const
      -> std::optional<WorkflowStatus>;
  [[nodiscard]] auto running_workflows() const -> std::vector<WorkflowId>;
  [[nodiscard]] auto running_count() const -> std::size_t;

private:
  enum class LoopExit : std::uint8_t { Finished, Halted, Stalled, Cancelled };

  struct RunEntry {
    WorkflowStatus status{WorkflowStatus::Running};
    std::shared_ptr<WorkflowContext> context;
  };

  [[nodiscard]] auto run_loop(Workflow &workflow, WorkflowContext &context)
      -> task<LoopExit>;
  [[nodiscard]] auto dispatch_sequential(Workflow &workflow,
                                         WorkflowContext &context,
                                         const std::vector<std::string> &names)
      -> task<void>;
  [[nodiscard]] auto dispatch_parallel(Workflow &workflow,
                                       WorkflowContext &context,
                                       const std::vector<std::string> &names,
                                       AsyncSemaphore &semaphore)
      -> task<void>;
  [[nodiscard]] auto run_unit(WorkflowContext &context, Task &t,
                              AsyncSemaphore &semaphore) -> task<TaskResult>;
  [[nodiscard]] auto execute_with_retry(WorkflowContext &context, Task &t)
      -> task<TaskResult>;

  [[nodiscard]] auto effective_concurrency(const Workflow &workflow) const
      -> std::size_t;

  auto register_run(const WorkflowId &id,
                    std::shared_ptr<WorkflowContext> context) -> void;
  auto unregister_run(const WorkflowId &id) -> void;

  ExecutionConfig config_;

  mutable std::shared_mutex registry_mu_;
  ankerl::unordered_dense::map<WorkflowId, RunEntry> registry_;
};

} // namespace taskweave
