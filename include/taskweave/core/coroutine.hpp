#pragma once

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancellation_type.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <chrono>

namespace taskweave {

template <typename T = void> using task = boost::asio::awaitable<T>;

/// Convenience alias for fire-and-forget coroutines.
using spawn_task = task<void>;

using boost::asio::co_spawn;
using boost::asio::detached;
using boost::asio::use_awaitable;

inline constexpr auto use_nothrow =
    boost::asio::as_tuple(boost::asio::use_awaitable);

namespace awaitable_ops = boost::asio::experimental::awaitable_operators;

/// Suspends the calling coroutine on its own executor. Returns early only
/// when the surrounding operation is cancelled.
inline auto async_sleep(std::chrono::steady_clock::duration duration)
    -> task<void> {
  auto executor = co_await boost::asio::this_coro::executor;
  boost::asio::steady_timer timer(executor, duration);
  auto [ec] = co_await timer.async_wait(use_nothrow);
  if (ec == boost::asio::error::operation_aborted) {
    // A cancelled sleep is a normal way out of a timer race.
    co_return;
  }
}

/// True once the coroutine chain awaiting this call has been cancelled from
/// outside, e.g. because it lost an awaitable_ops race.
inline auto cancellation_requested() -> task<bool> {
  auto state = co_await boost::asio::this_coro::cancellation_state;
  co_return state.cancelled() != boost::asio::cancellation_type::none;
}

} // namespace taskweave
