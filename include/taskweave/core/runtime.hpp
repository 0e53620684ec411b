#pragma once

#include "taskweave/core/coroutine.hpp"
#include "taskweave/core/error.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <atomic>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

namespace taskweave {

/// A pool of threads driving one io_context. Workflow runs, task handlers
/// and timers all live on this context.
class Runtime {
public:
  using executor_type = boost::asio::io_context::executor_type;

  explicit Runtime(unsigned num_threads = 0);
  ~Runtime() noexcept;

  Runtime(const Runtime &) = delete;
  Runtime &operator=(const Runtime &) = delete;

  [[nodiscard]] auto start() -> Result<void>;
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  [[nodiscard]] auto thread_count() const noexcept -> unsigned {
    return num_threads_;
  }

  [[nodiscard]] auto executor() noexcept -> executor_type {
    return ctx_.get_executor();
  }

  /// Launch a coroutine without waiting for it.
  template <typename T> auto spawn(task<T> coro) -> void {
    co_spawn(ctx_, std::move(coro), detached);
  }

  /// Run a coroutine to completion from a thread that is not one of the
  /// runtime's workers. Rethrows whatever the coroutine throws.
  template <typename T> auto block_on(task<T> coro) -> T {
    auto fut = co_spawn(ctx_, std::move(coro), boost::asio::use_future);
    return fut.get();
  }

private:
  unsigned num_threads_;
  boost::asio::io_context ctx_;
  std::optional<boost::asio::executor_work_guard<executor_type>> work_guard_;
  std::vector<std::jthread> threads_;
  std::atomic<bool> running_{false};
};

} // namespace taskweave
