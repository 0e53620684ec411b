#include "taskweave/scheduler/cron.hpp"

#include "taskweave/core/constants.hpp"
#include "taskweave/util/conv.hpp"
#include "taskweave/util/log.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <chrono>
#include <ranges>
#include <string>
#include <vector>

namespace taskweave {
namespace {

using Days = std::chrono::days;
using Hours = std::chrono::hours;
using Minutes = std::chrono::minutes;

template <std::size_t N>
auto parse_field(std::string_view field, std::bitset<N> &bits, int min_val,
                 int max_val, bool &restricted) -> Result<void> {
  bits.reset();
  restricted = true;

  for (auto chunk : field | std::views::split(',')) {
    std::string_view part(chunk.begin(), chunk.end());
    if (part.empty()) {
      return fail(SchedulerError::InvalidCron);
    }

    int step = 1;
    bool has_step = false;
    if (auto slash = part.find('/'); slash != std::string_view::npos) {
      auto parsed = util::parse_int<int>(part.substr(slash + 1));
      if (!parsed || *parsed <= 0) {
        return fail(SchedulerError::InvalidCron);
      }
      step = *parsed;
      has_step = true;
      part = part.substr(0, slash);
    }

    int start = 0;
    int end = 0;
    if (part == "*") {
      start = min_val;
      end = max_val;
      if (!has_step) {
        restricted = false;
      }
    } else if (auto dash = part.find('-'); dash != std::string_view::npos) {
      auto a = util::parse_int<int>(part.substr(0, dash));
      auto b = util::parse_int<int>(part.substr(dash + 1));
      if (!a || !b) {
        return fail(SchedulerError::InvalidCron);
      }
      start = *a;
      end = *b;
    } else {
      auto v = util::parse_int<int>(part);
      if (!v) {
        return fail(SchedulerError::InvalidCron);
      }
      start = *v;
      // "a/n" runs from a to the end of the field.
      end = has_step ? max_val : *v;
    }

    if (start < min_val || end > max_val || start > end) {
      return fail(SchedulerError::InvalidCron);
    }
    for (int v = start; v <= end; v += step) {
      bits.set(static_cast<std::size_t>(v));
    }
  }

  if (bits.none()) {
    return fail(SchedulerError::InvalidCron);
  }
  return ok();
}

template <std::size_t N>
auto to_values(const std::bitset<N> &bits, int min_val, int max_val)
    -> std::vector<int> {
  std::vector<int> out;
  for (int v = min_val; v <= max_val; ++v) {
    if (bits.test(static_cast<std::size_t>(v))) {
      out.push_back(v);
    }
  }
  return out;
}

} // namespace

CronExpression::CronExpression(std::string expression, Fields fields)
    : expression_(std::move(expression)), fields_(fields) {}

auto CronExpression::parse(std::string_view expr) -> Result<CronExpression> {
  std::string trimmed = boost::algorithm::trim_copy(std::string(expr));

  std::vector<std::string> tokens;
  if (!trimmed.empty()) {
    boost::algorithm::split(tokens, trimmed, boost::algorithm::is_space(),
                            boost::algorithm::token_compress_on);
  }
  if (tokens.size() != 5) {
    log::debug("Cron '{}': expected 5 fields, got {}", expr, tokens.size());
    return fail(SchedulerError::InvalidCron);
  }

  Fields f{};
  bool unused = false;
  auto parsed = parse_field(tokens[0], f.minute, 0, 59, unused)
                    .and_then([&] {
                      return parse_field(tokens[1], f.hour, 0, 23, unused);
                    })
                    .and_then([&] {
                      return parse_field(tokens[2], f.dom, 1, 31,
                                         f.dom_restricted);
                    })
                    .and_then([&] {
                      return parse_field(tokens[3], f.month, 1, 12, unused);
                    })
                    .and_then([&] {
                      return parse_field(tokens[4], f.dow, 0, 6,
                                         f.dow_restricted);
                    });
  if (!parsed) {
    log::debug("Cron '{}': invalid field", expr);
    return fail(parsed.error());
  }

  return ok(CronExpression(std::move(trimmed), f));
}

auto CronExpression::minutes() const -> std::vector<int> {
  return to_values(fields_.minute, 0, 59);
}

auto CronExpression::hours() const -> std::vector<int> {
  return to_values(fields_.hour, 0, 23);
}

auto CronExpression::days_of_month() const -> std::vector<int> {
  return to_values(fields_.dom, 1, 31);
}

auto CronExpression::months() const -> std::vector<int> {
  return to_values(fields_.month, 1, 12);
}

auto CronExpression::days_of_week() const -> std::vector<int> {
  return to_values(fields_.dow, 0, 6);
}

auto CronExpression::day_matches(std::chrono::sys_days day) const -> bool {
  const std::chrono::year_month_day ymd{day};
  const auto dom = static_cast<unsigned>(ymd.day());
  const auto dow = std::chrono::weekday{day}.c_encoding();
  const bool dom_ok = fields_.dom.test(dom);
  const bool dow_ok = fields_.dow.test(dow);

  if (fields_.dom_restricted && fields_.dow_restricted) {
    return dom_ok || dow_ok;
  }
  return dom_ok && dow_ok;
}

auto CronExpression::matches(util::TimePoint tp) const -> bool {
  const auto minute_tp = std::chrono::floor<Minutes>(tp);
  const auto day = std::chrono::floor<Days>(minute_tp);
  const std::chrono::hh_mm_ss hms{minute_tp - day};
  const std::chrono::year_month_day ymd{day};

  return fields_.minute.test(static_cast<std::size_t>(hms.minutes().count())) &&
         fields_.hour.test(static_cast<std::size_t>(hms.hours().count())) &&
         fields_.month.test(static_cast<unsigned>(ymd.month())) &&
         day_matches(day);
}

// Skips whole months and days that cannot match before scanning the hours
// and minutes of a candidate day.
auto CronExpression::next_after(util::TimePoint after) const
    -> std::optional<util::TimePoint> {
  auto candidate = std::chrono::floor<Minutes>(after) + Minutes{1};
  const auto horizon =
      std::chrono::floor<Days>(after) + Days{cron::kSearchHorizonDays};

  while (std::chrono::floor<Days>(candidate) <= horizon) {
    const auto day = std::chrono::floor<Days>(candidate);
    const std::chrono::year_month_day ymd{day};

    if (!fields_.month.test(static_cast<unsigned>(ymd.month()))) {
      auto next_month = ymd.year() / ymd.month();
      next_month += std::chrono::months{1};
      candidate = std::chrono::sys_days{next_month / 1};
      continue;
    }
    if (!day_matches(day)) {
      candidate = day + Days{1};
      continue;
    }

    const auto minute_of_day =
        std::chrono::duration_cast<Minutes>(candidate - day).count();
    const int first_hour = static_cast<int>(minute_of_day / 60);
    const int first_minute = static_cast<int>(minute_of_day % 60);
    for (int h = first_hour; h < 24; ++h) {
      if (!fields_.hour.test(static_cast<std::size_t>(h))) {
        continue;
      }
      for (int m = (h == first_hour ? first_minute : 0); m < 60; ++m) {
        if (fields_.minute.test(static_cast<std::size_t>(m))) {
          return day + Hours{h} + Minutes{m};
        }
      }
    }
    candidate = day + Days{1};
  }
  return std::nullopt;
}

} // namespace taskweave
