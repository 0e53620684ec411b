#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace taskweave::util {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Formats time point to ISO 8601 (YYYY-MM-DDTHH:MM:SSZ)
[[nodiscard]] inline auto format_iso8601(TimePoint tp) -> std::string {
  if (tp == TimePoint{})
    return {};
  auto const sec_tp = std::chrono::floor<std::chrono::seconds>(tp);
  return std::format("{:%Y-%m-%dT%H:%M:%SZ}", sec_tp);
}

[[nodiscard]] inline auto format_iso8601(std::optional<TimePoint> tp)
    -> std::string {
  return tp ? format_iso8601(*tp) : std::string{"-"};
}

// Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SSZ" or "now".
[[nodiscard]] inline auto parse_iso8601(std::string_view value)
    -> std::optional<TimePoint> {
  if (value.empty() || value == "now") {
    return Clock::now();
  }

  std::istringstream ss{std::string(value)};
  if (value.size() == 10) {
    std::chrono::year_month_day ymd;
    ss >> std::chrono::parse("%Y-%m-%d", ymd);
    if (ss.fail()) {
      return std::nullopt;
    }
    return std::chrono::sys_days{ymd};
  }

  std::chrono::sys_seconds tp;
  ss >> std::chrono::parse("%Y-%m-%dT%H:%M:%SZ", tp);
  if (ss.fail()) {
    return std::nullopt;
  }
  return tp;
}

// Converts time_point to Unix epoch milliseconds.
[[nodiscard]] inline auto to_unix_millis(TimePoint tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

} // namespace taskweave::util
