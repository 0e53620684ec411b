#pragma once

#include "taskweave/util/enum.hpp"
#include "taskweave/util/json.hpp"

#include <cstdint>
#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace taskweave {

enum class TaskErrorKind : std::uint8_t {
  ExecutionFailed,
  Timeout,
  Cancelled,
  InvalidInput,
  DependencyFailed,
  ConditionNotMet,
};
BOOST_DESCRIBE_ENUM(TaskErrorKind, ExecutionFailed, Timeout, Cancelled,
                    InvalidInput, DependencyFailed, ConditionNotMet)
TASKWEAVE_DEFINE_ENUM_SERDE(TaskErrorKind, TaskErrorKind::ExecutionFailed)

/// Error returned by a task handler, or synthesized by the engine.
struct TaskError {
  TaskErrorKind kind{TaskErrorKind::ExecutionFailed};
  std::string message;

  [[nodiscard]] static auto execution_failed(std::string msg) -> TaskError {
    return {TaskErrorKind::ExecutionFailed, std::move(msg)};
  }
  [[nodiscard]] static auto timeout() -> TaskError {
    return {TaskErrorKind::Timeout, {}};
  }
  [[nodiscard]] static auto cancelled() -> TaskError {
    return {TaskErrorKind::Cancelled, {}};
  }
  [[nodiscard]] static auto invalid_input(std::string msg) -> TaskError {
    return {TaskErrorKind::InvalidInput, std::move(msg)};
  }
  [[nodiscard]] static auto dependency_failed(std::string msg) -> TaskError {
    return {TaskErrorKind::DependencyFailed, std::move(msg)};
  }
  [[nodiscard]] static auto condition_not_met(std::string msg) -> TaskError {
    return {TaskErrorKind::ConditionNotMet, std::move(msg)};
  }

  [[nodiscard]] auto to_string() const -> std::string {
    switch (kind) {
    case TaskErrorKind::ExecutionFailed:
      return std::format("Task execution failed: {}", message);
    case TaskErrorKind::Timeout:
      return "Task timed out";
    case TaskErrorKind::Cancelled:
      return "Task cancelled";
    case TaskErrorKind::InvalidInput:
      return std::format("Invalid input: {}", message);
    case TaskErrorKind::DependencyFailed:
      return std::format("Dependency failed: {}", message);
    case TaskErrorKind::ConditionNotMet:
      return std::format("Condition not met: {}", message);
    }
    return message;
  }
};

/// What a handler returns: an output document or an error.
using TaskOutcome = std::expected<JsonValue, TaskError>;

} // namespace taskweave
