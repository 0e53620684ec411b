#include "taskweave/core/coroutine.hpp"
#include "taskweave/executor/semaphore.hpp"
#include "test_utils.hpp"

#include <boost/asio/deferred.hpp>
#include <boost/asio/experimental/parallel_group.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <vector>

using namespace taskweave;
using namespace std::chrono_literals;

namespace {

auto hold(AsyncSemaphore &sem, std::atomic<int> &current, std::atomic<int> &peak)
    -> task<void> {
  auto permit = co_await sem.acquire();
  const int now = current.fetch_add(1) + 1;
  peak.store(std::max(peak.load(), now));
  co_await async_sleep(10ms);
  current.fetch_sub(1);
}

} // namespace

// The semaphore must live on the executor run_coro drives, so each test
// builds it inside the coroutine.
TEST(SemaphoreTest, PermitReleasedOnScopeExit) {
  test::run_coro([]() -> task<void> {
    AsyncSemaphore sem(co_await boost::asio::this_coro::executor, 2);
    EXPECT_EQ(sem.permits(), 2U);
    {
      auto a = co_await sem.acquire();
      auto b = co_await sem.acquire();
      EXPECT_EQ(sem.in_use(), 2U);
    }
    EXPECT_EQ(sem.in_use(), 0U);
  }());
}

TEST(SemaphoreTest, MovedPermitReleasesOnce) {
  test::run_coro([]() -> task<void> {
    AsyncSemaphore sem(co_await boost::asio::this_coro::executor, 1);
    auto a = co_await sem.acquire();
    SemaphorePermit moved = std::move(a);
    EXPECT_EQ(sem.in_use(), 1U);
    moved = SemaphorePermit{};
    EXPECT_EQ(sem.in_use(), 0U);
    auto again = co_await sem.acquire();
    EXPECT_EQ(sem.in_use(), 1U);
  }());
}

TEST(SemaphoreTest, BoundsConcurrentHolders) {
  namespace exp = boost::asio::experimental;

  std::atomic<int> current{0};
  std::atomic<int> peak{0};

  test::run_coro([&]() -> task<void> {
    auto executor = co_await boost::asio::this_coro::executor;
    AsyncSemaphore sem(executor, 3);

    using Op = decltype(co_spawn(executor, hold(sem, current, peak),
                                 boost::asio::deferred));
    std::vector<Op> ops;
    for (int i = 0; i < 10; ++i) {
      ops.push_back(
          co_spawn(executor, hold(sem, current, peak), boost::asio::deferred));
    }
    co_await exp::make_parallel_group(std::move(ops))
        .async_wait(exp::wait_for_all(), use_awaitable);
    EXPECT_EQ(sem.in_use(), 0U);
  }());

  EXPECT_EQ(peak.load(), 3);
  EXPECT_EQ(current.load(), 0);
}

TEST(CoroutineTest, AsyncSleepCancelledByRace) {
  using namespace awaitable_ops;
  const auto start = std::chrono::steady_clock::now();
  auto winner = test::run_coro([]() -> task<int> {
    auto r = co_await (async_sleep(5s) || async_sleep(10ms));
    co_return static_cast<int>(r.index());
  }());
  EXPECT_EQ(winner, 1);
  EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
}
