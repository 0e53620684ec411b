#include "taskweave/workflow/workflow_validator.hpp"

#include "taskweave/util/log.hpp"

#include <algorithm>
#include <format>
#include <optional>

namespace taskweave {

auto WorkflowValidator::is_valid_task_name(std::string_view name) noexcept
    -> bool {
  return !name.empty() && name.find_first_of(".[]") == std::string_view::npos;
}

auto WorkflowValidator::dependency_depth(const Workflow &workflow)
    -> std::size_t {
  // task_order() lists dependencies first, so one pass settles every depth.
  StringMap<std::size_t> depths;
  std::size_t max_depth = 0;
  for (const auto *t : workflow.tasks_in_order()) {
    std::size_t deepest_dep = 0;
    for (const auto &dep : t->dependencies()) {
      if (auto it = depths.find(dep); it != depths.end()) {
        deepest_dep = std::max(deepest_dep, it->second);
      }
    }
    depths.insert_or_assign(t->name(), deepest_dep + 1);
    max_depth = std::max(max_depth, deepest_dep + 1);
  }
  return max_depth;
}

auto WorkflowValidator::validate(const Workflow &workflow,
                                 std::vector<std::string> *diagnostics) const
    -> Result<void> {
  std::optional<WorkflowError> first;
  auto report = [&](WorkflowError code, std::string message) {
    log::debug("Workflow {} rejected: {}", workflow.name(), message);
    if (!first) {
      first = code;
    }
    if (diagnostics) {
      diagnostics->push_back(std::move(message));
    }
  };

  if (workflow.empty()) {
    report(WorkflowError::EmptyWorkflow, "Workflow has no tasks");
  }
  if (workflow.size() > limits_.max_tasks) {
    report(WorkflowError::LimitExceeded,
           std::format("Workflow has {} tasks, maximum is {}", workflow.size(),
                       limits_.max_tasks));
  }

  for (const auto &t : workflow.tasks()) {
    const auto &cfg = t.config();
    if (!is_valid_task_name(t.name())) {
      report(WorkflowError::InvalidTaskName,
             std::format("Task name '{}' is empty or contains '.', '[' or ']'",
                         t.name()));
    }
    if (cfg.retry_enabled && cfg.max_retries > limits_.max_retries) {
      report(WorkflowError::LimitExceeded,
             std::format("Task '{}' has {} retries, maximum is {}", t.name(),
                         cfg.max_retries, limits_.max_retries));
    }
    if (cfg.timeout > limits_.max_timeout) {
      report(WorkflowError::LimitExceeded,
             std::format("Task '{}' has timeout {}s, maximum is {}s", t.name(),
                         cfg.timeout.count(), limits_.max_timeout.count()));
    }
    for (const auto &dep : cfg.dependencies) {
      if (workflow.get_task(dep) == nullptr) {
        report(WorkflowError::TaskNotFound,
               std::format("Task '{}' depends on unknown task '{}'", t.name(),
                           dep));
      }
    }
  }

  if (auto cycle = workflow.find_cycle(); !cycle.empty()) {
    std::string path;
    for (const auto &name : cycle) {
      path += path.empty() ? name : " -> " + name;
    }
    report(WorkflowError::CircularDependency,
           std::format("Circular dependency detected: {}", path));
  } else if (auto depth = dependency_depth(workflow);
             depth > limits_.max_depth) {
    report(WorkflowError::LimitExceeded,
           std::format("Workflow dependency depth {} exceeds maximum {}",
                       depth, limits_.max_depth));
  }

  if (first) {
    return fail(*first);
  }
  return ok();
}

} // namespace taskweave
