#include "taskweave/workflow/workflow.hpp"

#include "taskweave/util/log.hpp"

#include <algorithm>
#include <ranges>
#include <utility>

namespace taskweave {

Workflow::Workflow(std::string name)
    : Workflow(WorkflowConfig{.name = std::move(name)}) {}

Workflow::Workflow(WorkflowConfig config)
    : id_(generate_id<WorkflowId>()), config_(std::move(config)),
      created_at_(util::Clock::now()) {}

auto Workflow::add_task(Task task) -> Result<void> {
  if (index_.contains(task.name())) {
    log::warn("Workflow {}: duplicate task name {}", config_.name,
              task.name());
    return fail(WorkflowError::DuplicateTask);
  }
  index_.emplace(task.name(), tasks_.size());
  tasks_.push_back(std::move(task));
  recompute_order();
  return ok();
}

auto Workflow::index_of(std::string_view name) const
    -> std::optional<std::size_t> {
  auto it = index_.find(name);
  if (it == index_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto Workflow::get_task(std::string_view name) -> Task * {
  auto idx = index_of(name);
  return idx ? &tasks_[*idx] : nullptr;
}

auto Workflow::get_task(std::string_view name) const -> const Task * {
  auto idx = index_of(name);
  return idx ? &tasks_[*idx] : nullptr;
}

// Depth-first post-order over dependency edges: a task is emitted once all
// of its dependencies have been emitted.
auto Workflow::recompute_order() -> void {
  const auto n = tasks_.size();
  std::vector<std::uint8_t> state(n, 0); // 0 new, 1 on stack, 2 emitted
  std::vector<std::pair<std::size_t, std::size_t>> stack;
  stack.reserve(n);
  task_order_.clear();
  task_order_.reserve(n);

  for (std::size_t start : std::views::iota(std::size_t{0}, n)) {
    if (state[start] != 0)
      continue;

    stack.emplace_back(start, 0);
    state[start] = 1;

    while (!stack.empty()) {
      auto &[node, dep_idx] = stack.back();
      const auto &deps = tasks_[node].dependencies();

      if (dep_idx < deps.size()) {
        const auto &dep_name = deps[dep_idx++];
        auto dep = index_of(dep_name);
        if (!dep) {
          continue;
        }
        if (state[*dep] == 1) {
          log::warn("Circular dependency detected involving task: {}",
                    dep_name);
          continue;
        }
        if (state[*dep] == 0) {
          state[*dep] = 1;
          stack.emplace_back(*dep, 0);
        }
      } else {
        state[node] = 2;
        task_order_.push_back(tasks_[node].name());
        stack.pop_back();
      }
    }
  }
}

auto Workflow::find_cycle() const -> std::vector<std::string> {
  const auto n = tasks_.size();
  std::vector<std::uint8_t> state(n, 0);
  std::vector<std::pair<std::size_t, std::size_t>> stack;

  for (std::size_t start : std::views::iota(std::size_t{0}, n)) {
    if (state[start] != 0)
      continue;

    stack.emplace_back(start, 0);
    state[start] = 1;

    while (!stack.empty()) {
      auto &[node, dep_idx] = stack.back();
      const auto &deps = tasks_[node].dependencies();

      if (dep_idx < deps.size()) {
        auto dep = index_of(deps[dep_idx++]);
        if (!dep) {
          continue;
        }
        if (state[*dep] == 1) {
          auto first = std::ranges::find(stack, *dep,
                                         &std::pair<std::size_t,
                                                    std::size_t>::first);
          std::vector<std::string> cycle;
          for (auto it = first; it != stack.end(); ++it) {
            cycle.push_back(tasks_[it->first].name());
          }
          cycle.push_back(tasks_[*dep].name());
          return cycle;
        }
        if (state[*dep] == 0) {
          state[*dep] = 1;
          stack.emplace_back(*dep, 0);
        }
      } else {
        state[node] = 2;
        stack.pop_back();
      }
    }
  }
  return {};
}

auto Workflow::validate() const -> Result<void> {
  if (tasks_.empty()) {
    return fail(WorkflowError::EmptyWorkflow);
  }
  if (auto cycle = find_cycle(); !cycle.empty()) {
    std::string path;
    for (const auto &name : cycle) {
      if (!path.empty()) {
        path += " -> ";
      }
      path += name;
    }
    log::error("Workflow {}: circular dependency: {}", config_.name, path);
    return fail(WorkflowError::CircularDependency);
  }
  return ok();
}

auto Workflow::tasks_in_order() const -> std::vector<const Task *> {
  std::vector<const Task *> out;
  out.reserve(task_order_.size());
  for (const auto &name : task_order_) {
    if (const auto *t = get_task(name)) {
      out.push_back(t);
    }
  }
  return out;
}

auto Workflow::dependencies_met(std::string_view name) const -> bool {
  const auto *t = get_task(name);
  if (!t) {
    return false;
  }
  return std::ranges::all_of(t->dependencies(), [this](const auto &dep) {
    const auto *r = get_result(dep);
    return r != nullptr && r->status == TaskStatus::Completed;
  });
}

auto Workflow::get_runnable_task_names() const -> std::vector<std::string> {
  std::vector<const Task *> runnable;
  for (const auto &name : task_order_) {
    const auto *t = get_task(name);
    if (t && t->status() == TaskStatus::Pending && dependencies_met(name)) {
      runnable.push_back(t);
    }
  }
  std::ranges::stable_sort(runnable, std::ranges::greater{},
                           [](const Task *t) { return t->config().priority; });

  std::vector<std::string> names;
  names.reserve(runnable.size());
  for (const auto *t : runnable) {
    names.push_back(t->name());
  }
  return names;
}

auto Workflow::blocked_task_names() const -> std::vector<std::string> {
  std::vector<bool> blocked(tasks_.size(), false);
  std::vector<std::string> names;

  for (const auto &name : task_order_) {
    auto idx = index_of(name);
    if (!idx || tasks_[*idx].status() != TaskStatus::Pending) {
      continue;
    }
    const bool is_blocked = std::ranges::any_of(
        tasks_[*idx].dependencies(), [&](const auto &dep_name) {
          auto dep = index_of(dep_name);
          if (!dep) {
            return true;
          }
          const auto dep_status = tasks_[*dep].status();
          return blocked[*dep] || (is_terminal(dep_status) &&
                                   dep_status != TaskStatus::Completed);
        });
    if (is_blocked) {
      blocked[*idx] = true;
      names.push_back(name);
    }
  }
  return names;
}

auto Workflow::store_result(TaskResult result) -> void {
  if (auto *t = get_task(result.task_name)) {
    t->set_status(result.status);
  }
  auto name = result.task_name;
  results_.insert_or_assign(std::move(name), std::move(result));
}

auto Workflow::get_result(std::string_view name) const -> const TaskResult * {
  auto it = results_.find(name);
  return it != results_.end() ? &it->second : nullptr;
}

auto Workflow::skip_task(std::string_view name) -> Result<void> {
  auto *t = get_task(name);
  if (!t) {
    return fail(WorkflowError::TaskNotFound);
  }
  if (t->status() != TaskStatus::Pending) {
    return fail(Error::InvalidState);
  }
  const auto now = util::Clock::now();
  store_result(TaskResult{
      .task_id = t->id(),
      .task_name = t->name(),
      .status = TaskStatus::Skipped,
      .started_at = now,
      .completed_at = now,
      .retry_count = t->retry_count(),
  });
  return ok();
}

auto Workflow::is_complete() const -> bool {
  return std::ranges::all_of(
      tasks_, [](const Task &t) { return is_terminal(t.status()); });
}

auto Workflow::has_failed() const -> bool {
  if (config_.continue_on_failure) {
    return false;
  }
  return std::ranges::any_of(
      tasks_, [](const Task &t) { return is_failure(t.status()); });
}

auto Workflow::progress() const -> double {
  if (tasks_.empty()) {
    return 1.0;
  }
  const auto done = std::ranges::count_if(tasks_, [](const Task &t) {
    return t.status() == TaskStatus::Completed ||
           t.status() == TaskStatus::Skipped;
  });
  return static_cast<double>(done) / static_cast<double>(tasks_.size());
}

auto Workflow::set_status(WorkflowStatus status) -> void {
  status_ = status;
  if (status == WorkflowStatus::Running && !started_at_) {
    started_at_ = util::Clock::now();
  }
  if (is_terminal(status)) {
    completed_at_ = util::Clock::now();
  }
}

WorkflowBuilder::WorkflowBuilder(std::string name) {
  config_.name = std::move(name);
}

auto WorkflowBuilder::description(std::string text) -> WorkflowBuilder && {
  config_.description = std::move(text);
  return std::move(*this);
}

auto WorkflowBuilder::version(std::string v) -> WorkflowBuilder && {
  config_.version = std::move(v);
  return std::move(*this);
}

auto WorkflowBuilder::timeout(std::chrono::seconds t) -> WorkflowBuilder && {
  config_.timeout = t;
  return std::move(*this);
}

auto WorkflowBuilder::parallel(std::size_t max_concurrent)
    -> WorkflowBuilder && {
  config_.parallel_execution = true;
  config_.max_concurrent_tasks = max_concurrent;
  return std::move(*this);
}

auto WorkflowBuilder::sequential() -> WorkflowBuilder && {
  config_.parallel_execution = false;
  config_.max_concurrent_tasks = 1;
  return std::move(*this);
}

auto WorkflowBuilder::max_concurrent(std::size_t n) -> WorkflowBuilder && {
  config_.max_concurrent_tasks = n;
  return std::move(*this);
}

auto WorkflowBuilder::continue_on_failure(bool enabled) -> WorkflowBuilder && {
  config_.continue_on_failure = enabled;
  return std::move(*this);
}

auto WorkflowBuilder::checkpoints(bool enabled) -> WorkflowBuilder && {
  config_.enable_checkpoints = enabled;
  return std::move(*this);
}

auto WorkflowBuilder::tag(std::string t) -> WorkflowBuilder && {
  config_.tags.push_back(std::move(t));
  return std::move(*this);
}

auto WorkflowBuilder::metadata(JsonValue m) -> WorkflowBuilder && {
  config_.metadata = std::move(m);
  return std::move(*this);
}

auto WorkflowBuilder::add_task(Task task) -> WorkflowBuilder && {
  tasks_.push_back(std::move(task));
  return std::move(*this);
}

auto WorkflowBuilder::build() && -> Result<Workflow> {
  if (tasks_.empty()) {
    return fail(WorkflowError::EmptyWorkflow);
  }
  Workflow workflow(std::move(config_));
  for (auto &t : tasks_) {
    if (auto r = workflow.add_task(std::move(t)); !r) {
      return fail(r.error());
    }
  }
  if (auto r = workflow.validate(); !r) {
    return fail(r.error());
  }
  return ok(std::move(workflow));
}

} // namespace taskweave
