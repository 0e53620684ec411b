#pragma once

#include "taskweave/core/coroutine.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/system/error_code.hpp>

#include <atomic>
#include <cstddef>
#include <utility>

namespace taskweave {

class AsyncSemaphore;

/// Returns its permit on destruction.
class SemaphorePermit {
public:
  SemaphorePermit() = default;
  explicit SemaphorePermit(AsyncSemaphore *owner) noexcept : owner_(owner) {}
  ~SemaphorePermit();

  SemaphorePermit(SemaphorePermit &&other) noexcept
      : owner_(std::exchange(other.owner_, nullptr)) {}
  SemaphorePermit &operator=(SemaphorePermit &&other) noexcept;

  SemaphorePermit(const SemaphorePermit &) = delete;
  SemaphorePermit &operator=(const SemaphorePermit &) = delete;

private:
  AsyncSemaphore *owner_{nullptr};
};

/// Counting semaphore for coroutines. A buffered channel of capacity N
/// holds one message per permit in use: acquiring sends (and waits while
/// the buffer is full), releasing receives.
class AsyncSemaphore {
public:
  AsyncSemaphore(boost::asio::any_io_executor executor, std::size_t permits)
      : channel_(std::move(executor), permits), permits_(permits) {}

  AsyncSemaphore(const AsyncSemaphore &) = delete;
  AsyncSemaphore &operator=(const AsyncSemaphore &) = delete;

  [[nodiscard]] auto acquire() -> task<SemaphorePermit> {
    co_await channel_.async_send(boost::system::error_code{}, use_awaitable);
    in_use_.fetch_add(1, std::memory_order_acq_rel);
    co_return SemaphorePermit{this};
  }

  auto release() noexcept -> void {
    if (channel_.try_receive([](boost::system::error_code) {})) {
      in_use_.fetch_sub(1, std::memory_order_acq_rel);
    }
  }

  [[nodiscard]] auto permits() const noexcept -> std::size_t {
    return permits_;
  }
  [[nodiscard]] auto in_use() const noexcept -> std::size_t {
    return in_use_.load(std::memory_order_acquire);
  }

private:
  boost::asio::experimental::concurrent_channel<void(
      boost::system::error_code)>
      channel_;
  std::size_t permits_;
  std::atomic<std::size_t> in_use_{0};
};

inline SemaphorePermit::~SemaphorePermit() {
  if (owner_) {
    owner_->release();
  }
}

inline SemaphorePermit &
SemaphorePermit::operator=(SemaphorePermit &&other) noexcept {
  if (this != &other) {
    if (owner_) {
      owner_->release();
    }
    owner_ = std::exchange(other.owner_, nullptr);
  }
  return *this;
}

} // namespace taskweave
