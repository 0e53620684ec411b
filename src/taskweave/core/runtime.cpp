#include "taskweave/core/runtime.hpp"

#include "taskweave/util/log.hpp"

#include <algorithm>
#include <exception>

namespace taskweave {

Runtime::Runtime(unsigned num_threads)
    : num_threads_(num_threads == 0
                       ? std::max(1U, std::thread::hardware_concurrency())
                       : num_threads),
      ctx_(static_cast<int>(num_threads_)) {}

Runtime::~Runtime() noexcept { stop(); }

auto Runtime::start() -> Result<void> {
  if (running_.exchange(true))
    return ok();

  log::debug("Starting runtime with {} threads", num_threads_);

  ctx_.restart();
  work_guard_.emplace(boost::asio::make_work_guard(ctx_));
  threads_.reserve(num_threads_);
  for (unsigned i = 0; i < num_threads_; ++i) {
    threads_.emplace_back([this, i] {
      try {
        ctx_.run();
      } catch (const std::exception &e) {
        log::error("Runtime worker {} terminated: {}", i, e.what());
      }
    });
  }
  return ok();
}

auto Runtime::stop() noexcept -> void {
  if (!running_.exchange(false))
    return;

  if (work_guard_.has_value()) {
    work_guard_->reset();
    work_guard_.reset();
  }
  ctx_.stop();

  // std::jthread auto-joins on destruction, just clear the vector
  threads_.clear();
  log::debug("Runtime stopped");
}

auto Runtime::is_running() const noexcept -> bool {
  return running_.load(std::memory_order_acquire);
}

} // namespace taskweave
