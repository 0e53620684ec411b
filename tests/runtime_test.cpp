#include "taskweave/core/runtime.hpp"
#include "test_utils.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "gtest/gtest.h"

using namespace taskweave;

namespace {

constexpr auto kSpawnTimeout = std::chrono::seconds(2);

auto increment_counter(std::atomic<int> *count_ptr) -> spawn_task {
  count_ptr->fetch_add(1);
  co_return;
}

auto delayed_value(int value) -> task<int> {
  co_await async_sleep(std::chrono::milliseconds(20));
  co_return value;
}

} // namespace

TEST(RuntimeTest, BasicStartStop) {
  Runtime rt(1);
  EXPECT_FALSE(rt.is_running());
  ASSERT_TRUE(rt.start().has_value());
  EXPECT_TRUE(rt.is_running());
  rt.stop();
  EXPECT_FALSE(rt.is_running());
}

TEST(RuntimeTest, ThreadCount) {
  Runtime rt(4);
  EXPECT_EQ(rt.thread_count(), 4U);

  Runtime defaulted;
  EXPECT_GE(defaulted.thread_count(), 1U);
}

TEST(RuntimeTest, StartAndStopAreIdempotent) {
  Runtime rt(2);
  ASSERT_TRUE(rt.start().has_value());
  ASSERT_TRUE(rt.start().has_value());
  EXPECT_TRUE(rt.is_running());

  rt.stop();
  EXPECT_FALSE(rt.is_running());
  rt.stop();
  EXPECT_FALSE(rt.is_running());
}

TEST(RuntimeTest, SpawnRunsCoroutines) {
  Runtime rt(2);
  ASSERT_TRUE(rt.start().has_value());

  std::atomic<int> count{0};
  for (int i = 0; i < 16; ++i) {
    rt.spawn(increment_counter(&count));
  }
  EXPECT_TRUE(
      test::poll_until([&] { return count.load() == 16; }, kSpawnTimeout));
  rt.stop();
}

TEST(RuntimeTest, BlockOnReturnsValue) {
  Runtime rt(2);
  ASSERT_TRUE(rt.start().has_value());
  EXPECT_EQ(rt.block_on(delayed_value(42)), 42);
  rt.stop();
}

TEST(RuntimeTest, BlockOnRethrows) {
  Runtime rt(1);
  ASSERT_TRUE(rt.start().has_value());
  auto failing = []() -> task<int> {
    co_await async_sleep(std::chrono::milliseconds(1));
    throw std::runtime_error("boom");
  };
  EXPECT_THROW(rt.block_on(failing()), std::runtime_error);
  rt.stop();
}

TEST(RuntimeTest, RestartAfterStop) {
  Runtime rt(1);
  ASSERT_TRUE(rt.start().has_value());
  rt.stop();
  ASSERT_TRUE(rt.start().has_value());
  EXPECT_EQ(rt.block_on(delayed_value(7)), 7);
  rt.stop();
}
