#pragma once

#include "taskweave/core/error.hpp"
#include "taskweave/scheduler/scheduled_job.hpp"
#include "taskweave/util/id.hpp"
#include "taskweave/util/time.hpp"

#include <ankerl/unordered_dense.h>

#include <atomic>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace taskweave {

/// In-memory registry of cron jobs. It owns no timer: the host polls
/// get_due_jobs(), runs each job's workflow and then calls
/// record_execution(). start()/stop() only toggle a liveness flag.
/// All methods are thread-safe.
class Scheduler {
public:
  Scheduler() = default;

  Scheduler(const Scheduler &) = delete;
  auto operator=(const Scheduler &) -> Scheduler & = delete;

  [[nodiscard]] auto schedule(std::string name, WorkflowId workflow_id,
                              ScheduleConfig config) -> Result<JobId>;
  [[nodiscard]] auto schedule_cron(std::string name, WorkflowId workflow_id,
                                   std::string_view cron) -> Result<JobId>;

  auto unschedule(const JobId &id) -> std::optional<ScheduledJob>;

  [[nodiscard]] auto get_job(const JobId &id) const
      -> std::optional<ScheduledJob>;
  [[nodiscard]] auto list_jobs() const -> std::vector<ScheduledJob>;
  [[nodiscard]] auto
  get_due_jobs(util::TimePoint now = util::Clock::now()) const
      -> std::vector<ScheduledJob>;

  auto pause(const JobId &id) -> bool;
  auto resume(const JobId &id, util::TimePoint now = util::Clock::now())
      -> bool;

  [[nodiscard]] auto
  record_execution(const JobId &id, util::TimePoint now = util::Clock::now())
      -> Result<void>;

  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto size() const -> std::size_t;

private:
  mutable std::shared_mutex mu_;
  ankerl::unordered_dense::map<JobId, ScheduledJob> jobs_;
  std::atomic<bool> running_{false};
};

} // namespace taskweave
