#pragma once

#include "taskweave/core/coroutine.hpp"
#include "taskweave/core/error.hpp"
#include "taskweave/task/context.hpp"
#include "taskweave/task/task_error.hpp"
#include "taskweave/util/enum.hpp"
#include "taskweave/util/id.hpp"
#include "taskweave/util/json.hpp"
#include "taskweave/util/time.hpp"

#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace taskweave {

namespace task_defaults {
inline constexpr std::chrono::seconds kTimeout{300};
inline constexpr std::chrono::seconds kRetryDelay{5};
inline constexpr int kMaxRetries{3};
} // namespace task_defaults

enum class TaskStatus : std::uint8_t {
  Pending,
  Queued,
  Running,
  Completed,
  Failed,
  Cancelled,
  Retrying,
  TimedOut,
  Skipped,
};
BOOST_DESCRIBE_ENUM(TaskStatus, Pending, Queued, Running, Completed, Failed,
                    Cancelled, Retrying, TimedOut, Skipped)
TASKWEAVE_DEFINE_ENUM_SERDE(TaskStatus, TaskStatus::Pending)

[[nodiscard]] constexpr auto is_terminal(TaskStatus s) noexcept -> bool {
  switch (s) {
  case TaskStatus::Completed:
  case TaskStatus::Failed:
  case TaskStatus::Cancelled:
  case TaskStatus::TimedOut:
  case TaskStatus::Skipped:
    return true;
  default:
    return false;
  }
}

/// Failed and TimedOut are both failures for retry and run-outcome purposes.
[[nodiscard]] constexpr auto is_failure(TaskStatus s) noexcept -> bool {
  return s == TaskStatus::Failed || s == TaskStatus::TimedOut;
}

struct TaskConfig {
  std::string name;
  std::string description;
  // Zero means "use the engine default".
  std::chrono::seconds timeout{task_defaults::kTimeout};
  bool retry_enabled{true};
  int max_retries{task_defaults::kMaxRetries};
  std::chrono::seconds retry_delay{task_defaults::kRetryDelay};
  std::vector<std::string> dependencies;
  // Stored for the host; the engine never evaluates it.
  std::optional<std::string> condition;
  std::vector<std::string> tags;
  int priority{0};
  JsonValue metadata{};
};

struct TaskResult {
  TaskId task_id;
  std::string task_name;
  TaskStatus status{TaskStatus::Pending};
  std::optional<JsonValue> output;
  std::optional<std::string> error;
  util::TimePoint started_at{};
  std::optional<util::TimePoint> completed_at;
  std::chrono::milliseconds duration{0};
  int retry_count{0};
};

using TaskHandler = std::function<task<TaskOutcome>(TaskContext)>;
using SyncTaskHandler = std::function<TaskOutcome(const TaskContext &)>;

class Task {
public:
  struct Builder;
  [[nodiscard]] static auto builder(std::string name) -> Builder;

  [[nodiscard]] auto id() const noexcept -> const TaskId & { return id_; }
  [[nodiscard]] auto name() const noexcept -> const std::string & {
    return config_.name;
  }
  [[nodiscard]] auto config() const noexcept -> const TaskConfig & {
    return config_;
  }
  [[nodiscard]] auto dependencies() const noexcept
      -> const std::vector<std::string> & {
    return config_.dependencies;
  }
  [[nodiscard]] auto has_handler() const noexcept -> bool {
    return static_cast<bool>(handler_);
  }

  [[nodiscard]] auto status() const noexcept -> TaskStatus { return status_; }
  auto set_status(TaskStatus status) noexcept -> void { status_ = status; }

  [[nodiscard]] auto retry_count() const noexcept -> int {
    return retry_count_;
  }
  auto increment_retry() noexcept -> void { ++retry_count_; }
  [[nodiscard]] auto can_retry() const noexcept -> bool {
    return config_.retry_enabled && retry_count_ < config_.max_retries;
  }

  /// Fills in an engine-wide timeout for tasks configured with zero.
  auto apply_default_timeout(std::chrono::seconds timeout) noexcept -> void {
    if (config_.timeout.count() == 0) {
      config_.timeout = timeout;
    }
  }

  /// Back to Pending with no retries spent.
  auto reset() noexcept -> void {
    status_ = TaskStatus::Pending;
    retry_count_ = 0;
  }

  /// Runs the handler once, racing it against the task timeout. Never
  /// retries. A handler that throws a std::exception yields a Failed
  /// result; any other exception propagates. Throws operation_aborted,
  /// leaving the task Running, when the caller cancels the attempt.
  [[nodiscard]] auto execute(TaskContext ctx) -> task<TaskResult>;

private:
  Task(TaskConfig config, TaskHandler handler);

  TaskId id_;
  TaskConfig config_;
  TaskHandler handler_;
  TaskStatus status_{TaskStatus::Pending};
  int retry_count_{0};
};

struct Task::Builder {
  TaskConfig config_;
  TaskHandler handler_;

  auto handler(TaskHandler fn) -> Builder && {
    handler_ = std::move(fn);
    return std::move(*this);
  }

  /// Wraps a blocking function. It runs on a runtime thread, so keep it
  /// short.
  auto sync_handler(SyncTaskHandler fn) -> Builder && {
    handler_ = [fn = std::move(fn)](TaskContext ctx) -> task<TaskOutcome> {
      co_return fn(ctx);
    };
    return std::move(*this);
  }

  auto description(std::string text) -> Builder && {
    config_.description = std::move(text);
    return std::move(*this);
  }

  auto depends_on(std::string task_name) -> Builder && {
    config_.dependencies.push_back(std::move(task_name));
    return std::move(*this);
  }

  auto depends_on_all(std::vector<std::string> task_names) -> Builder && {
    for (auto &name : task_names) {
      config_.dependencies.push_back(std::move(name));
    }
    return std::move(*this);
  }

  auto timeout(std::chrono::seconds t) -> Builder && {
    config_.timeout = t;
    return std::move(*this);
  }

  auto retry(int max, std::chrono::seconds delay) -> Builder && {
    config_.retry_enabled = true;
    config_.max_retries = max;
    config_.retry_delay = delay;
    return std::move(*this);
  }

  auto no_retry() -> Builder && {
    config_.retry_enabled = false;
    config_.max_retries = 0;
    return std::move(*this);
  }

  auto when(std::string condition) -> Builder && {
    config_.condition = std::move(condition);
    return std::move(*this);
  }

  auto priority(int p) -> Builder && {
    config_.priority = p;
    return std::move(*this);
  }

  auto tag(std::string t) -> Builder && {
    config_.tags.push_back(std::move(t));
    return std::move(*this);
  }

  auto metadata(JsonValue m) -> Builder && {
    config_.metadata = std::move(m);
    return std::move(*this);
  }

  [[nodiscard]] auto build() && -> Result<Task>;
};

} // namespace taskweave
