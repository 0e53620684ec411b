#include "taskweave/executor/engine.hpp"

#include "taskweave/util/log.hpp"

#include <boost/asio/deferred.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/experimental/parallel_group.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/system_error.hpp>

#include <algorithm>
#include <exception>
#include <format>
#include <mutex>
#include <variant>

namespace taskweave {

namespace {

auto describe_exception(const std::exception_ptr &ep) -> std::string {
  try {
    std::rethrow_exception(ep);
  } catch (const std::exception &e) {
    return e.what();
  } catch (...) {
    return "unknown exception";
  }
}

// Result for a task that never ran (or was aborted) in this run.
auto synthesized_result(const Task &t, TaskStatus status, std::string error)
    -> TaskResult {
  const auto now = util::Clock::now();
  return TaskResult{
      .task_id = t.id(),
      .task_name = t.name(),
      .status = status,
      .error = std::move(error),
      .started_at = now,
      .completed_at = now,
      .retry_count = t.retry_count(),
  };
}

// Records what a dispatched unit produced. A unit that threw counts as a
// failed attempt.
auto settle(Workflow &workflow, const Task &t, const std::exception_ptr &error,
            TaskResult result) -> void {
  if (!error) {
    workflow.store_result(std::move(result));
    return;
  }
  const auto what = describe_exception(error);
  log::error("Task {} aborted: {}", t.name(), what);
  workflow.store_result(synthesized_result(
      t, TaskStatus::Failed, TaskError::execution_failed(what).to_string()));
}

auto join_names(const std::vector<std::string> &names) -> std::string {
  std::string out;
  for (const auto &name : names) {
    if (!out.empty()) {
      out += ", ";
    }
    out += name;
  }
  return out;
}

auto make_task_context(const WorkflowContext &context, const Task &t)
    -> TaskContext {
  auto ctx = context.create_task_context(t.name());
  for (const auto &dep : t.dependencies()) {
    if (auto output = context.get_task_output(dep)) {
      ctx.set_input(dep, std::move(*output));
    }
  }
  return ctx;
}

} // namespace

WorkflowEngine::WorkflowEngine(ExecutionConfig config)
    : config_(std::move(config)) {}

auto WorkflowEngine::effective_concurrency(const Workflow &workflow) const
    -> std::size_t {
  return std::max<std::size_t>(
      1, std::min(workflow.config().max_concurrent_tasks,
                  config_.max_concurrent_tasks));
}

auto WorkflowEngine::execute(Workflow &workflow,
                             StringMap<JsonValue> parameters)
    -> task<Result<ExecutionResult>> {
  using namespace awaitable_ops;

  if (auto valid = workflow.validate(); !valid) {
    co_return fail(valid.error());
  }
  if (workflow.status() != WorkflowStatus::Created) {
    co_return fail(WorkflowError::AlreadyStarted);
  }

  auto context =
      std::make_shared<WorkflowContext>(workflow.id(), workflow.name());
  for (auto &[key, value] : parameters) {
    context->set_parameter(key, std::move(value));
  }
  for (auto &t : workflow.tasks()) {
    t.apply_default_timeout(config_.task_timeout);
  }

  register_run(workflow.id(), context);
  workflow.set_status(WorkflowStatus::Running);
  log::info("Starting workflow {} ({}) with {} tasks", workflow.name(),
            workflow.id(), workflow.size());

  const auto deadline = workflow.config().timeout.count() == 0
                            ? config_.workflow_timeout
                            : workflow.config().timeout;

  std::optional<LoopExit> exit;
  std::optional<std::string> fatal;
  auto executor = co_await boost::asio::this_coro::executor;
  boost::asio::steady_timer deadline_timer(executor, deadline);
  // run_loop gets its own coroutine so that a throw ends the race at once.
  auto raced = co_await (
      co_spawn(executor, run_loop(workflow, *context), use_nothrow) ||
      deadline_timer.async_wait(use_nothrow));
  if (raced.index() == 0) {
    const auto &[error, loop_exit] = std::get<0>(raced);
    if (error) {
      fatal = describe_exception(error);
    } else {
      exit = loop_exit;
    }
  }

  ExecutionResult result{
      .workflow_id = workflow.id(),
      .workflow_name = workflow.name(),
  };

  if (fatal) {
    log::error("Workflow {} aborted: {}", workflow.name(), *fatal);
    context->cancel();
    for (auto &t : workflow.tasks()) {
      if (!is_terminal(t.status())) {
        workflow.store_result(synthesized_result(
            t, TaskStatus::Cancelled, TaskError::cancelled().to_string()));
      }
    }
    result.status = WorkflowStatus::Failed;
    result.error = std::format("Workflow execution failed: {}", *fatal);
  } else if (!exit) {
    log::error("Workflow {} timed out after {}s", workflow.name(),
               deadline.count());
    context->cancel();
    // Tasks cut short by the deadline time out; those never started are
    // cancelled.
    for (auto &t : workflow.tasks()) {
      if (t.status() == TaskStatus::Running ||
          t.status() == TaskStatus::Retrying) {
        workflow.store_result(synthesized_result(
            t, TaskStatus::TimedOut,
            make_error_code(WorkflowError::Timeout).message()));
      } else if (!is_terminal(t.status())) {
        workflow.store_result(synthesized_result(
            t, TaskStatus::Cancelled,
            make_error_code(WorkflowError::Timeout).message()));
      }
    }
    result.status = WorkflowStatus::Failed;
    result.error = make_error_code(WorkflowError::Timeout).message();
  } else if (*exit == LoopExit::Cancelled) {
    log::info("Workflow {} cancelled", workflow.name());
    for (auto &t : workflow.tasks()) {
      if (!is_terminal(t.status())) {
        workflow.store_result(synthesized_result(
            t, TaskStatus::Cancelled, TaskError::cancelled().to_string()));
      }
    }
    result.status = WorkflowStatus::Cancelled;
    result.error = "Workflow cancelled";
  } else {
    if (*exit == LoopExit::Stalled) {
      log::warn("Workflow {}: tasks blocked by unmet dependencies: {}",
                workflow.name(), join_names(workflow.blocked_task_names()));
    }
    if (workflow.has_failed()) {
      std::vector<std::string> failed;
      for (const auto &t : workflow.tasks()) {
        if (is_failure(t.status())) {
          failed.push_back(t.name());
        }
      }
      result.status = WorkflowStatus::Failed;
      result.error =
          std::format("One or more tasks failed: {}", join_names(failed));
    } else {
      result.status = WorkflowStatus::Completed;
    }
  }

  workflow.set_status(result.status);
  unregister_run(workflow.id());

  for (const auto *t : workflow.tasks_in_order()) {
    if (const auto *r = workflow.get_result(t->name())) {
      result.task_results.push_back(*r);
    }
  }
  result.started_at = workflow.started_at().value_or(workflow.created_at());
  result.completed_at = workflow.completed_at();
  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      result.completed_at.value_or(util::Clock::now()) - result.started_at);

  log::info("Workflow {} finished with status {} in {}ms ({:.0f}% done)",
            workflow.name(), to_string_view(result.status),
            result.duration.count(), workflow.progress() * 100.0);
  co_return result;
}

auto WorkflowEngine::run_loop(Workflow &workflow, WorkflowContext &context)
    -> task<LoopExit> {
  const auto concurrency = effective_concurrency(workflow);
  const bool parallel =
      workflow.config().parallel_execution && concurrency > 1;
  auto executor = co_await boost::asio::this_coro::executor;
  AsyncSemaphore semaphore(executor, concurrency);

  log::debug("Workflow {}: {} dispatch, concurrency {}", workflow.name(),
             parallel ? "parallel" : "sequential", concurrency);

  while (!workflow.is_complete()) {
    const auto state =
        get_status(workflow.id()).value_or(WorkflowStatus::Cancelled);
    if (state == WorkflowStatus::Cancelled) {
      co_return LoopExit::Cancelled;
    }
    if (state == WorkflowStatus::Paused) {
      if (workflow.status() != WorkflowStatus::Paused) {
        log::info("Workflow {} paused", workflow.name());
        workflow.set_status(WorkflowStatus::Paused);
      }
      co_await async_sleep(config_.poll_interval);
      continue;
    }
    if (workflow.status() == WorkflowStatus::Paused) {
      log::info("Workflow {} resumed", workflow.name());
      workflow.set_status(WorkflowStatus::Running);
    }

    if (workflow.has_failed() && !config_.continue_on_failure) {
      co_return LoopExit::Halted;
    }

    auto runnable = workflow.get_runnable_task_names();
    if (runnable.empty()) {
      // Nothing is in flight between rounds, so a blocked task stays
      // blocked.
      if (!workflow.blocked_task_names().empty()) {
        co_return LoopExit::Stalled;
      }
      co_await async_sleep(config_.poll_interval);
      continue;
    }

    if (parallel) {
      co_await dispatch_parallel(workflow, context, runnable, semaphore);
    } else {
      co_await dispatch_sequential(workflow, context, runnable);
    }
  }
  co_return LoopExit::Finished;
}

auto WorkflowEngine::dispatch_sequential(Workflow &workflow,
                                         WorkflowContext &context,
                                         const std::vector<std::string> &names)
    -> task<void> {
  auto executor = co_await boost::asio::this_coro::executor;
  for (const auto &name : names) {
    if (get_status(workflow.id()) != WorkflowStatus::Running) {
      co_return;
    }
    auto *t = workflow.get_task(name);
    if (!t) {
      continue;
    }
    t->set_status(TaskStatus::Queued);
    auto [error, result] = co_await co_spawn(
        executor, execute_with_retry(context, *t), use_nothrow);
    if (error && co_await cancellation_requested()) {
      // Interrupted mid-flight; execute() settles the task.
      std::rethrow_exception(error);
    }
    settle(workflow, *t, error, std::move(result));

    if (workflow.has_failed() && !config_.continue_on_failure) {
      co_return;
    }
  }
}

auto WorkflowEngine::dispatch_parallel(Workflow &workflow,
                                       WorkflowContext &context,
                                       const std::vector<std::string> &names,
                                       AsyncSemaphore &semaphore)
    -> task<void> {
  namespace exp = boost::asio::experimental;

  auto executor = co_await boost::asio::this_coro::executor;
  auto make_op = [&](Task &t) {
    return co_spawn(executor, run_unit(context, t, semaphore),
                    boost::asio::deferred);
  };
  using Op = decltype(make_op(std::declval<Task &>()));

  std::vector<Task *> dispatched;
  std::vector<Op> ops;
  dispatched.reserve(names.size());
  ops.reserve(names.size());
  for (const auto &name : names) {
    if (auto *t = workflow.get_task(name)) {
      t->set_status(TaskStatus::Queued);
      dispatched.push_back(t);
      ops.push_back(make_op(*t));
    }
  }

  auto [order, exceptions, results] =
      co_await exp::make_parallel_group(std::move(ops))
          .async_wait(exp::wait_for_all(), use_awaitable);

  // Outcomes are stored in completion order. Units interrupted by a
  // cancelled run stay in flight; execute() settles them.
  const bool interrupted = co_await cancellation_requested();
  for (auto i : order) {
    if (interrupted && exceptions[i]) {
      continue;
    }
    settle(workflow, *dispatched[i], exceptions[i], std::move(results[i]));
  }
  if (interrupted) {
    throw boost::system::system_error(boost::asio::error::operation_aborted);
  }
}

auto WorkflowEngine::run_unit(WorkflowContext &context, Task &t,
                              AsyncSemaphore &semaphore) -> task<TaskResult> {
  auto permit = co_await semaphore.acquire();
  if (context.is_cancelled()) {
    co_return synthesized_result(t, TaskStatus::Cancelled,
                                 TaskError::cancelled().to_string());
  }
  co_return co_await execute_with_retry(context, t);
}

auto WorkflowEngine::execute_with_retry(WorkflowContext &context, Task &t)
    -> task<TaskResult> {
  const int ceiling = config_.retry_on_failure ? config_.max_retries : 0;

  auto result = co_await t.execute(make_task_context(context, t));
  while (is_failure(result.status) && t.can_retry() &&
         t.retry_count() < ceiling && !context.is_cancelled()) {
    t.increment_retry();
    log::warn("Retrying task {} (attempt {}/{})", t.name(), t.retry_count(),
              t.config().max_retries);
    t.set_status(TaskStatus::Retrying);
    co_await async_sleep(t.config().retry_delay);
    result = co_await t.execute(make_task_context(context, t));
  }

  if (result.status == TaskStatus::Completed && result.output) {
    context.store_task_output(t.name(), *result.output);
  }
  co_return result;
}

auto WorkflowEngine::register_run(const WorkflowId &id,
                                  std::shared_ptr<WorkflowContext> context)
    -> void {
  std::unique_lock lock(registry_mu_);
  registry_.insert_or_assign(
      id, RunEntry{.status = WorkflowStatus::Running,
                   .context = std::move(context)});
}

auto WorkflowEngine::unregister_run(const WorkflowId &id) -> void {
  std::unique_lock lock(registry_mu_);
  registry_.erase(id);
}

auto WorkflowEngine::cancel(const WorkflowId &id) -> bool {
  std::unique_lock lock(registry_mu_);
  auto it = registry_.find(id);
  if (it == registry_.end() || is_terminal(it->second.status)) {
    return false;
  }
  it->second.status = WorkflowStatus::Cancelled;
  it->second.context->cancel();
  log::info("Cancel requested for workflow {}", id);
  return true;
}

auto WorkflowEngine::pause(const WorkflowId &id) -> bool {
  std::unique_lock lock(registry_mu_);
  auto it = registry_.find(id);
  if (it == registry_.end() || it->second.status != WorkflowStatus::Running) {
    return false;
  }
  it->second.status = WorkflowStatus::Paused;
  return true;
}

auto WorkflowEngine::resume(const WorkflowId &id) -> bool {
  std::unique_lock lock(registry_mu_);
  auto it = registry_.find(id);
  if (it == registry_.end() || it->second.status != WorkflowStatus::Paused) {
    return false;
  }
  it->second.status = WorkflowStatus::Running;
  return true;
}

auto WorkflowEngine::get_status(const WorkflowId &id) const
    -> std::optional<WorkflowStatus> {
  std::shared_lock lock(registry_mu_);
  auto it = registry_.find(id);
  if (it == registry_.end()) {
    return std::nullopt;
  }
  return it->second.status;
}

auto WorkflowEngine::running_workflows() const -> std::vector<WorkflowId> {
  std::shared_lock lock(registry_mu_);
  std::vector<WorkflowId> out;
  out.reserve(registry_.size());
  for (const auto &[id, _] : registry_) {
    out.push_back(id);
  }
  return out;
}

auto WorkflowEngine::running_count() const -> std::size_t {
  std::shared_lock lock(registry_mu_);
  return registry_.size();
}

} // namespace taskweave
