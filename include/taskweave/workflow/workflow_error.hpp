#pragma once

#include <cstdint>
#include <string>
#include <system_error>
#include <utility>

namespace taskweave {

enum class WorkflowError : std::uint8_t {
  Success = 0,
  EmptyWorkflow,
  CircularDependency,
  TaskNotFound,
  ExecutionFailed,
  Timeout,
  DuplicateTask,
  AlreadyStarted,
  InvalidTaskName,
  LimitExceeded,
};

class WorkflowErrorCategory : public std::error_category {
public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "taskweave.workflow";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    switch (static_cast<WorkflowError>(ev)) {
    case WorkflowError::Success:
      return "success";
    case WorkflowError::EmptyWorkflow:
      return "Workflow is empty";
    case WorkflowError::CircularDependency:
      return "Circular dependency detected";
    case WorkflowError::TaskNotFound:
      return "Task not found";
    case WorkflowError::ExecutionFailed:
      return "Workflow execution failed";
    case WorkflowError::Timeout:
      return "Workflow timed out";
    case WorkflowError::DuplicateTask:
      return "Duplicate task name";
    case WorkflowError::AlreadyStarted:
      return "Workflow has already been executed";
    case WorkflowError::InvalidTaskName:
      return "Invalid task name";
    case WorkflowError::LimitExceeded:
      return "Workflow limit exceeded";
    }
    return "unknown workflow error";
  }

  using std::error_category::equivalent;

  [[nodiscard]] auto equivalent(int code,
                                const std::error_condition &cond) const noexcept
      -> bool override {
    if (cond.category() == std::generic_category()) {
      switch (static_cast<WorkflowError>(code)) {
      case WorkflowError::Timeout:
        return cond.value() == static_cast<int>(std::errc::timed_out);
      case WorkflowError::TaskNotFound:
        return cond.value() ==
               static_cast<int>(std::errc::no_such_file_or_directory);
      default:
        break;
      }
    }
    return false;
  }
};

[[nodiscard]] inline auto workflow_error_category() noexcept
    -> const WorkflowErrorCategory & {
  static const WorkflowErrorCategory instance;
  return instance;
}

[[nodiscard]] inline auto make_error_code(WorkflowError e) noexcept
    -> std::error_code {
  return {std::to_underlying(e), workflow_error_category()};
}

} // namespace taskweave

template <>
struct std::is_error_code_enum<taskweave::WorkflowError> : std::true_type {};
