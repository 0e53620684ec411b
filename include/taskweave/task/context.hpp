#pragma once

#include "taskweave/util/id.hpp"
#include "taskweave/util/json.hpp"
#include "taskweave/util/string_hash.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace taskweave {

/// Key/value store shared by every task of one workflow run.
class SharedContext {
public:
  auto set(std::string key, JsonValue value) -> void;
  [[nodiscard]] auto get(std::string_view key) const
      -> std::optional<JsonValue>;
  [[nodiscard]] auto contains(std::string_view key) const -> bool;
  auto remove(std::string_view key) -> bool;
  [[nodiscard]] auto keys() const -> std::vector<std::string>;

  /// Named artifacts are opaque locations (paths, URLs) produced by tasks.
  auto set_artifact(std::string name, std::string location) -> void;
  [[nodiscard]] auto get_artifact(std::string_view name) const
      -> std::optional<std::string>;

private:
  mutable std::shared_mutex mu_;
  StringMap<JsonValue> values_;
  StringMap<std::string> artifacts_;
};

/// State one task attempt sees: the outputs of its dependencies, a scratch
/// area of local variables, the run's shared context and parameters, and
/// the run's cancellation flag.
class TaskContext {
public:
  TaskContext(std::string task_name, WorkflowId workflow_id,
              std::shared_ptr<SharedContext> shared,
              std::shared_ptr<const StringMap<JsonValue>> parameters,
              std::shared_ptr<const std::atomic<bool>> cancelled);

  [[nodiscard]] auto task_name() const noexcept -> const std::string & {
    return task_name_;
  }
  [[nodiscard]] auto workflow_id() const noexcept -> const WorkflowId & {
    return workflow_id_;
  }

  auto set_input(std::string name, JsonValue value) -> void;
  [[nodiscard]] auto get_input(std::string_view name) const
      -> const JsonValue *;
  [[nodiscard]] auto inputs() const noexcept -> const StringMap<JsonValue> & {
    return inputs_;
  }

  auto set_variable(std::string name, JsonValue value) -> void;
  [[nodiscard]] auto get_variable(std::string_view name) const
      -> const JsonValue *;

  [[nodiscard]] auto parameter(std::string_view key) const -> const JsonValue *;

  [[nodiscard]] auto shared() const noexcept -> SharedContext & {
    return *shared_;
  }

  /// True once the run has been cancelled. Long running handlers should
  /// check this between steps.
  [[nodiscard]] auto is_cancelled() const noexcept -> bool;

private:
  std::string task_name_;
  WorkflowId workflow_id_;
  StringMap<JsonValue> inputs_;
  StringMap<JsonValue> variables_;
  std::shared_ptr<SharedContext> shared_;
  std::shared_ptr<const StringMap<JsonValue>> parameters_;
  std::shared_ptr<const std::atomic<bool>> cancelled_;
};

/// Per-run context. The output store takes one writer per in-flight task.
class WorkflowContext {
public:
  WorkflowContext(WorkflowId workflow_id, std::string workflow_name);

  [[nodiscard]] auto workflow_id() const noexcept -> const WorkflowId & {
    return workflow_id_;
  }
  [[nodiscard]] auto workflow_name() const noexcept -> const std::string & {
    return workflow_name_;
  }

  [[nodiscard]] auto create_task_context(std::string task_name) const
      -> TaskContext;

  auto store_task_output(std::string task_name, JsonValue output) -> void;
  [[nodiscard]] auto get_task_output(std::string_view task_name) const
      -> std::optional<JsonValue>;
  [[nodiscard]] auto task_outputs() const -> StringMap<JsonValue>;

  /// Parameters are fixed before the first task context is created.
  auto set_parameter(std::string key, JsonValue value) -> void;
  [[nodiscard]] auto get_parameter(std::string_view key) const
      -> const JsonValue *;

  [[nodiscard]] auto shared() const noexcept -> SharedContext & {
    return *shared_;
  }

  auto cancel() noexcept -> void;
  [[nodiscard]] auto is_cancelled() const noexcept -> bool;

private:
  WorkflowId workflow_id_;
  std::string workflow_name_;
  std::shared_ptr<SharedContext> shared_;
  std::shared_ptr<StringMap<JsonValue>> parameters_;
  std::shared_ptr<std::atomic<bool>> cancelled_;

  mutable std::shared_mutex outputs_mu_;
  StringMap<JsonValue> task_outputs_;
};

} // namespace taskweave
