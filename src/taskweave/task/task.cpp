#include "taskweave/task/task.hpp"

#include "taskweave/util/log.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/system_error.hpp>

#include <exception>
#include <format>
#include <variant>

namespace taskweave {

namespace {

auto finish(TaskResult &result, TaskStatus status) -> void {
  result.status = status;
  result.completed_at = util::Clock::now();
  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      *result.completed_at - result.started_at);
}

} // namespace

Task::Task(TaskConfig config, TaskHandler handler)
    : id_(generate_id<TaskId>()), config_(std::move(config)),
      handler_(std::move(handler)) {}

auto Task::builder(std::string name) -> Builder {
  Builder b;
  b.config_.name = std::move(name);
  return b;
}

auto Task::Builder::build() && -> Result<Task> {
  if (config_.name.empty()) {
    return fail(Error::InvalidArgument);
  }
  if (config_.max_retries < 0) {
    return fail(Error::InvalidArgument);
  }
  if (config_.description.empty()) {
    config_.description = std::format("Task: {}", config_.name);
  }
  return ok(Task{std::move(config_), std::move(handler_)});
}

auto Task::execute(TaskContext ctx) -> task<TaskResult> {
  using namespace awaitable_ops;

  status_ = TaskStatus::Running;
  TaskResult result{
      .task_id = id_,
      .task_name = config_.name,
      .status = TaskStatus::Running,
      .started_at = util::Clock::now(),
      .retry_count = retry_count_,
  };

  if (!handler_) {
    result.output = empty_json_object();
    finish(result, TaskStatus::Completed);
    status_ = result.status;
    co_return result;
  }

  log::debug("Executing task {} (attempt {})", config_.name, retry_count_ + 1);

  auto executor = co_await boost::asio::this_coro::executor;
  boost::asio::steady_timer deadline(executor, config_.timeout);

  // The handler runs as its own coroutine so that a throw ends its arm of
  // the race instead of leaving the timer to decide it.
  auto raced = co_await (
      co_spawn(executor, handler_(std::move(ctx)), use_nothrow) ||
      deadline.async_wait(use_awaitable));

  if (co_await cancellation_requested()) {
    // Interrupted by the caller. The attempt has no outcome of its own and
    // the task stays Running for the caller to settle.
    log::debug("Task {} interrupted", config_.name);
    throw boost::system::system_error(boost::asio::error::operation_aborted);
  }

  if (raced.index() == 0) {
    auto &[error, outcome] = std::get<0>(raced);
    if (error) {
      try {
        std::rethrow_exception(error);
      } catch (const boost::system::system_error &e) {
        if (e.code() == boost::asio::error::operation_aborted) {
          result.error = TaskError::cancelled().to_string();
          finish(result, TaskStatus::Cancelled);
        } else {
          result.error = TaskError::execution_failed(e.what()).to_string();
          finish(result, TaskStatus::Failed);
        }
      } catch (const std::exception &e) {
        result.error = TaskError::execution_failed(e.what()).to_string();
        finish(result, TaskStatus::Failed);
      }
    } else if (outcome) {
      result.output = std::move(*outcome);
      finish(result, TaskStatus::Completed);
    } else {
      result.error = outcome.error().to_string();
      finish(result, TaskStatus::Failed);
    }
  } else {
    result.error = std::format("Task timed out after {} seconds",
                               config_.timeout.count());
    finish(result, TaskStatus::TimedOut);
  }

  status_ = result.status;
  if (result.status != TaskStatus::Completed) {
    log::debug("Task {} ended {}: {}", config_.name,
               to_string_view(result.status), result.error.value_or(""));
  }
  co_return result;
}

} // namespace taskweave
