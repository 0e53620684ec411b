#include "taskweave/scheduler/cron.hpp"

#include "gtest/gtest.h"

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

using namespace taskweave;
using namespace std::chrono;
using namespace std::chrono_literals;

namespace {

auto at(year_month_day ymd, hours h = 0h, minutes m = 0min,
        seconds s = 0s) -> util::TimePoint {
  return sys_days{ymd} + h + m + s;
}

auto must_parse(std::string_view expr) -> CronExpression {
  auto r = CronExpression::parse(expr);
  if (!r) {
    throw std::runtime_error("bad cron in test: " + std::string(expr));
  }
  return std::move(*r);
}

} // namespace

TEST(CronParseTest, HourlyAtMinuteZero) {
  auto cron = must_parse("0 * * * *");
  EXPECT_EQ(cron.minutes(), std::vector<int>{0});
  EXPECT_EQ(cron.hours().size(), 24U);
  EXPECT_EQ(cron.days_of_month().size(), 31U);
  EXPECT_EQ(cron.months().size(), 12U);
  EXPECT_EQ(cron.days_of_week().size(), 7U);
}

TEST(CronParseTest, StepsRangesAndLists) {
  EXPECT_EQ(must_parse("*/15 * * * *").minutes(),
            (std::vector<int>{0, 15, 30, 45}));
  EXPECT_EQ(must_parse("0 9-17 * * *").hours(),
            (std::vector<int>{9, 10, 11, 12, 13, 14, 15, 16, 17}));
  EXPECT_EQ(must_parse("5,10 * * * *").minutes(), (std::vector<int>{5, 10}));
  EXPECT_EQ(must_parse("10/20 * * * *").minutes(),
            (std::vector<int>{10, 30, 50}));
  EXPECT_EQ(must_parse("0 0-12/6 * * *").hours(),
            (std::vector<int>{0, 6, 12}));
  EXPECT_EQ(must_parse("0 0 * * 1-5").days_of_week(),
            (std::vector<int>{1, 2, 3, 4, 5}));
  EXPECT_EQ(must_parse("0 0 1,15 */3 *").months(),
            (std::vector<int>{1, 4, 7, 10}));
}

TEST(CronParseTest, WhitespaceIsNormalized) {
  auto cron = must_parse("  0   12 * *  * ");
  EXPECT_EQ(cron.expression(), "0   12 * *  *");
  EXPECT_EQ(cron.hours(), std::vector<int>{12});
}

TEST(CronParseTest, RejectsMalformed) {
  for (const char *expr :
       {"", "* * * *", "* * * * * *", "60 * * * *", "* 24 * * *",
        "* * 0 * *", "* * 32 * *", "* * * 0 *", "* * * 13 *", "* * * * 7",
        "*/0 * * * *", "a * * * *", "5-1 * * * *", "1,,2 * * * *",
        "-1 * * * *", "1-x * * * *"}) {
    auto r = CronExpression::parse(expr);
    ASSERT_FALSE(r.has_value()) << "'" << expr << "'";
    EXPECT_EQ(r.error(), make_error_code(SchedulerError::InvalidCron));
  }
  EXPECT_EQ(make_error_code(SchedulerError::InvalidCron).message(),
            "Invalid cron expression");
}

TEST(CronMatchTest, IgnoresSeconds) {
  auto cron = must_parse("0 10 * * *");
  EXPECT_TRUE(cron.matches(at(2024y / January / 15d, 10h, 0min, 45s)));
  EXPECT_FALSE(cron.matches(at(2024y / January / 15d, 10h, 1min)));
  EXPECT_FALSE(cron.matches(at(2024y / January / 15d, 11h)));
}

TEST(CronMatchTest, DayOfMonthOrDayOfWeekWhenBothRestricted) {
  // The 13th, or any Friday.
  auto cron = must_parse("0 0 13 * 5");
  EXPECT_TRUE(cron.matches(at(2024y / January / 19d)));  // Friday
  EXPECT_TRUE(cron.matches(at(2024y / January / 13d)));  // Saturday the 13th
  EXPECT_FALSE(cron.matches(at(2024y / January / 14d))); // Sunday
}

TEST(CronMatchTest, SingleRestrictedDayField) {
  auto sundays = must_parse("0 0 * * 0");
  EXPECT_TRUE(sundays.matches(at(2024y / January / 14d)));
  EXPECT_FALSE(sundays.matches(at(2024y / January / 15d)));

  auto first = must_parse("0 0 1 * *");
  EXPECT_TRUE(first.matches(at(2024y / March / 1d)));
  EXPECT_FALSE(first.matches(at(2024y / March / 2d)));
}

TEST(CronNextTest, StrictlyAfter) {
  auto cron = must_parse("0 * * * *");
  EXPECT_EQ(cron.next_after(at(2024y / January / 15d, 10h, 30min)),
            at(2024y / January / 15d, 11h));
  EXPECT_EQ(cron.next_after(at(2024y / January / 15d, 11h)),
            at(2024y / January / 15d, 12h));
  EXPECT_EQ(cron.next_after(at(2024y / January / 15d, 23h, 59min, 59s)),
            at(2024y / January / 16d));
}

TEST(CronNextTest, QuarterHours) {
  auto cron = must_parse("*/15 * * * *");
  EXPECT_EQ(cron.next_after(at(2024y / January / 15d, 10h, 7min, 30s)),
            at(2024y / January / 15d, 10h, 15min));
  EXPECT_EQ(cron.next_after(at(2024y / January / 15d, 10h, 45min)),
            at(2024y / January / 15d, 11h));
}

TEST(CronNextTest, WeekdaysSkipWeekend) {
  auto cron = must_parse("30 8 * * 1-5");
  // Friday after the slot rolls to Monday.
  EXPECT_EQ(cron.next_after(at(2024y / January / 19d, 9h)),
            at(2024y / January / 22d, 8h, 30min));
}

TEST(CronNextTest, MonthAndYearRollover) {
  EXPECT_EQ(must_parse("0 0 1 * *").next_after(at(2024y / January / 15d)),
            at(2024y / February / 1d));
  EXPECT_EQ(must_parse("0 0 1 1 *").next_after(at(2024y / June / 1d)),
            at(2025y / January / 1d));
  EXPECT_EQ(must_parse("0 0 31 * *").next_after(at(2024y / April / 1d)),
            at(2024y / May / 31d));
}

TEST(CronNextTest, LeapDay) {
  auto cron = must_parse("0 12 29 2 *");
  EXPECT_EQ(cron.next_after(at(2023y / March / 1d)),
            at(2024y / February / 29d, 12h));
  EXPECT_EQ(cron.next_after(at(2024y / February / 29d, 12h)),
            at(2028y / February / 29d, 12h));
}

TEST(CronNextTest, ImpossibleDateHasNoNextRun) {
  EXPECT_FALSE(
      must_parse("0 0 31 2 *").next_after(at(2024y / January / 1d)).has_value());
  EXPECT_FALSE(
      must_parse("0 0 30 2 *").next_after(at(2024y / January / 1d)).has_value());
}

TEST(CronNextTest, NextAlwaysMatches) {
  auto cron = must_parse("17 */5 2,20 * 3");
  auto t = at(2024y / January / 1d);
  for (int i = 0; i < 50; ++i) {
    auto next = cron.next_after(t);
    ASSERT_TRUE(next.has_value());
    EXPECT_GT(*next, t);
    EXPECT_TRUE(cron.matches(*next));
    t = *next;
  }
}
