#pragma once

#include "taskweave/core/error.hpp"
#include "taskweave/scheduler/cron.hpp"
#include "taskweave/util/id.hpp"
#include "taskweave/util/time.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace taskweave {

struct ScheduleConfig {
  std::string cron{"0 * * * *"};
  // Recorded only; cron fields are evaluated in UTC.
  std::string timezone{"UTC"};
  bool enabled{true};
  std::optional<util::TimePoint> start_date;
  std::optional<util::TimePoint> end_date;
  std::optional<std::uint32_t> max_runs;
  bool catch_up{false};
};

/// A recurring trigger for one workflow. `next_run` is empty once the job
/// is exhausted (max_runs reached or past end_date); otherwise it is always
/// later than `last_run`.
struct ScheduledJob {
  JobId id;
  std::string name;
  WorkflowId workflow_id;
  ScheduleConfig config;
  CronExpression cron;
  std::uint32_t run_count{0};
  std::optional<util::TimePoint> last_run;
  std::optional<util::TimePoint> next_run;
  util::TimePoint created_at;

  [[nodiscard]] static auto create(std::string name, WorkflowId workflow_id,
                                   ScheduleConfig config,
                                   util::TimePoint now = util::Clock::now())
      -> Result<ScheduledJob>;

  auto compute_next_run(util::TimePoint now = util::Clock::now()) -> void;

  [[nodiscard]] auto should_run(util::TimePoint now = util::Clock::now()) const
      -> bool;

  auto record_run(util::TimePoint now = util::Clock::now()) -> void;

  [[nodiscard]] auto exhausted() const noexcept -> bool {
    return config.max_runs && run_count >= *config.max_runs;
  }
};

} // namespace taskweave
