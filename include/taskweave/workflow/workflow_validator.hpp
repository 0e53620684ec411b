#pragma once

#include "taskweave/core/constants.hpp"
#include "taskweave/core/error.hpp"
#include "taskweave/workflow/workflow.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace taskweave {

struct ValidationLimits {
  std::size_t max_tasks{limits::kMaxWorkflowTasks};
  std::size_t max_depth{limits::kMaxDependencyDepth};
  int max_retries{limits::kMaxTaskRetries};
  std::chrono::seconds max_timeout{limits::kMaxTaskTimeout};
};

/// Policy checks for workflows submitted from untrusted definitions.
/// Stricter than Workflow::validate(): unknown dependencies are errors here.
class WorkflowValidator {
public:
  WorkflowValidator() = default;
  explicit WorkflowValidator(ValidationLimits limits) : limits_(limits) {}

  [[nodiscard]] auto limits() const noexcept -> const ValidationLimits & {
    return limits_;
  }

  /// Returns the first violation; every violation is appended to
  /// `diagnostics` when given.
  [[nodiscard]] auto
  validate(const Workflow &workflow,
           std::vector<std::string> *diagnostics = nullptr) const
      -> Result<void>;

  /// Longest dependency chain, counted in tasks. A lone task has depth 1.
  /// Unknown dependencies are ignored; meaningless for cyclic workflows.
  [[nodiscard]] static auto dependency_depth(const Workflow &workflow)
      -> std::size_t;

  [[nodiscard]] static auto is_valid_task_name(std::string_view name) noexcept
      -> bool;

private:
  ValidationLimits limits_{};
};

} // namespace taskweave
