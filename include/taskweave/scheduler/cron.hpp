#pragma once

#include "taskweave/core/error.hpp"
#include "taskweave/scheduler/scheduler_error.hpp"
#include "taskweave/util/time.hpp"

#include <bitset>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace taskweave {

/// Five-field cron expression: minute hour day-of-month month day-of-week.
/// Each field accepts `*`, lists, `a-b` ranges and `/n` steps. Times are
/// interpreted in UTC.
class CronExpression {
public:
  [[nodiscard]] static auto parse(std::string_view expr)
      -> Result<CronExpression>;

  [[nodiscard]] auto expression() const noexcept -> const std::string & {
    return expression_;
  }

  [[nodiscard]] auto minutes() const -> std::vector<int>;
  [[nodiscard]] auto hours() const -> std::vector<int>;
  [[nodiscard]] auto days_of_month() const -> std::vector<int>;
  [[nodiscard]] auto months() const -> std::vector<int>;
  [[nodiscard]] auto days_of_week() const -> std::vector<int>;

  /// Minute, hour and month must all match. Day-of-month and day-of-week
  /// follow POSIX: when both are restricted either one may match.
  [[nodiscard]] auto matches(util::TimePoint tp) const -> bool;

  /// First matching minute strictly after `after`, or nullopt if there is
  /// none within five years (e.g. "0 0 31 2 *").
  [[nodiscard]] auto next_after(util::TimePoint after) const
      -> std::optional<util::TimePoint>;

  [[nodiscard]] friend auto operator==(const CronExpression &lhs,
                                       const CronExpression &rhs) -> bool {
    return lhs.expression_ == rhs.expression_;
  }

private:
  struct Fields {
    std::bitset<60> minute;
    std::bitset<24> hour;
    std::bitset<32> dom;
    std::bitset<13> month;
    std::bitset<7> dow;
    bool dom_restricted{false};
    bool dow_restricted{false};
  };

  CronExpression(std::string expression, Fields fields);

  [[nodiscard]] auto day_matches(std::chrono::sys_days day) const -> bool;

  std::string expression_;
  Fields fields_;
};

} // namespace taskweave
