#include "taskweave/scheduler/scheduled_job.hpp"

#include "taskweave/util/log.hpp"

#include <algorithm>
#include <utility>

namespace taskweave {

auto ScheduledJob::create(std::string name, WorkflowId workflow_id,
                          ScheduleConfig config, util::TimePoint now)
    -> Result<ScheduledJob> {
  auto cron = CronExpression::parse(config.cron);
  if (!cron) {
    log::warn("Job {}: invalid cron '{}'", name, config.cron);
    return fail(cron.error());
  }

  ScheduledJob job{
      .id = generate_id<JobId>(),
      .name = std::move(name),
      .workflow_id = std::move(workflow_id),
      .config = std::move(config),
      .cron = std::move(*cron),
      .created_at = now,
  };
  job.compute_next_run(now);
  return ok(std::move(job));
}

auto ScheduledJob::compute_next_run(util::TimePoint now) -> void {
  if (exhausted()) {
    next_run.reset();
    return;
  }

  auto base = last_run ? std::max(*last_run, now) : now;
  if (config.start_date) {
    // next_after is exclusive; step back so start_date itself can fire.
    base = std::max(base, *config.start_date - std::chrono::seconds{1});
  }

  next_run = cron.next_after(base);
  if (next_run && config.end_date && *next_run > *config.end_date) {
    next_run.reset();
  }
}

auto ScheduledJob::should_run(util::TimePoint now) const -> bool {
  return config.enabled && next_run && now >= *next_run;
}

auto ScheduledJob::record_run(util::TimePoint now) -> void {
  ++run_count;
  last_run = now;
  compute_next_run(now);
}

} // namespace taskweave
