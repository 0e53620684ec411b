#include "taskweave/scheduler/scheduler.hpp"

#include "taskweave/scheduler/scheduler_error.hpp"
#include "taskweave/util/log.hpp"

#include <algorithm>
#include <mutex>
#include <ranges>
#include <utility>

namespace taskweave {

auto Scheduler::schedule(std::string name, WorkflowId workflow_id,
                         ScheduleConfig config) -> Result<JobId> {
  auto job = ScheduledJob::create(std::move(name), std::move(workflow_id),
                                  std::move(config));
  if (!job) {
    return fail(job.error());
  }

  std::unique_lock lock(mu_);
  const bool duplicate = std::ranges::any_of(
      jobs_, [&](const auto &kv) { return kv.second.name == job->name; });
  if (duplicate) {
    log::warn("Schedule conflict: job named {} already exists", job->name);
    return fail(SchedulerError::Conflict);
  }

  auto id = job->id;
  log::info("Scheduled job: {} (cron '{}', next run {})", job->name,
            job->cron.expression(), util::format_iso8601(job->next_run));
  jobs_.emplace(id, std::move(*job));
  return ok(std::move(id));
}

auto Scheduler::schedule_cron(std::string name, WorkflowId workflow_id,
                              std::string_view cron) -> Result<JobId> {
  return schedule(std::move(name), std::move(workflow_id),
                  ScheduleConfig{.cron = std::string(cron)});
}

auto Scheduler::unschedule(const JobId &id) -> std::optional<ScheduledJob> {
  std::unique_lock lock(mu_);
  auto it = jobs_.find(id);
  if (it == jobs_.end()) {
    return std::nullopt;
  }
  auto job = std::move(it->second);
  jobs_.erase(it);
  log::info("Unscheduled job: {}", job.name);
  return job;
}

auto Scheduler::get_job(const JobId &id) const -> std::optional<ScheduledJob> {
  std::shared_lock lock(mu_);
  auto it = jobs_.find(id);
  if (it == jobs_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto Scheduler::list_jobs() const -> std::vector<ScheduledJob> {
  std::shared_lock lock(mu_);
  return jobs_ | std::views::values | std::ranges::to<std::vector>();
}

auto Scheduler::get_due_jobs(util::TimePoint now) const
    -> std::vector<ScheduledJob> {
  std::shared_lock lock(mu_);
  return jobs_ | std::views::values |
         std::views::filter(
             [now](const ScheduledJob &job) { return job.should_run(now); }) |
         std::ranges::to<std::vector>();
}

auto Scheduler::pause(const JobId &id) -> bool {
  std::unique_lock lock(mu_);
  auto it = jobs_.find(id);
  if (it == jobs_.end()) {
    return false;
  }
  it->second.config.enabled = false;
  log::debug("Paused job: {}", it->second.name);
  return true;
}

auto Scheduler::resume(const JobId &id, util::TimePoint now) -> bool {
  std::unique_lock lock(mu_);
  auto it = jobs_.find(id);
  if (it == jobs_.end()) {
    return false;
  }
  auto &job = it->second;
  job.config.enabled = true;
  job.compute_next_run(now);
  log::debug("Resumed job: {} (next run {})", job.name,
             util::format_iso8601(job.next_run));
  return true;
}

auto Scheduler::record_execution(const JobId &id, util::TimePoint now)
    -> Result<void> {
  std::unique_lock lock(mu_);
  auto it = jobs_.find(id);
  if (it == jobs_.end()) {
    return fail(SchedulerError::JobNotFound);
  }
  auto &job = it->second;
  job.record_run(now);
  log::debug("Job {} ran ({} total), next run {}", job.name, job.run_count,
             util::format_iso8601(job.next_run));
  return ok();
}

auto Scheduler::start() -> void {
  if (running_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  log::info("Scheduler started");
}

auto Scheduler::stop() -> void {
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }
  log::info("Scheduler stopped");
}

auto Scheduler::size() const -> std::size_t {
  std::shared_lock lock(mu_);
  return jobs_.size();
}

} // namespace taskweave
