#pragma once

#include <cstdint>
#include <string>
#include <system_error>
#include <utility>

namespace taskweave {

enum class SchedulerError : std::uint8_t {
  Success = 0,
  InvalidCron,
  JobNotFound,
  Conflict,
};

class SchedulerErrorCategory : public std::error_category {
public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "taskweave.scheduler";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    switch (static_cast<SchedulerError>(ev)) {
    case SchedulerError::Success:
      return "success";
    case SchedulerError::InvalidCron:
      return "Invalid cron expression";
    case SchedulerError::JobNotFound:
      return "Job not found";
    case SchedulerError::Conflict:
      return "Schedule conflict";
    }
    return "unknown scheduler error";
  }
};

[[nodiscard]] inline auto scheduler_error_category() noexcept
    -> const SchedulerErrorCategory & {
  static const SchedulerErrorCategory instance;
  return instance;
}

[[nodiscard]] inline auto make_error_code(SchedulerError e) noexcept
    -> std::error_code {
  return {std::to_underlying(e), scheduler_error_category()};
}

} // namespace taskweave

template <>
struct std::is_error_code_enum<taskweave::SchedulerError> : std::true_type {};
