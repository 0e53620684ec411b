#pragma once

#include "taskweave/executor/execution.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace taskweave {

struct RuntimeConfig {
  unsigned threads{0}; // 0 = hardware_concurrency

  auto operator==(const RuntimeConfig &) const -> bool = default;
};

struct LogConfig {
  std::string level{"info"};
  std::string file; // empty = stdout

  auto operator==(const LogConfig &) const -> bool = default;
};

/// A schedule declared in the config file. `workflow` names a workflow the
/// host registers; the loader only checks that the cron text parses.
struct ScheduleEntry {
  std::string name;
  std::string workflow;
  std::string cron{"0 * * * *"};
  bool enabled{true};
  std::optional<std::uint32_t> max_runs;

  auto operator==(const ScheduleEntry &) const -> bool = default;
};

struct EngineConfig {
  ExecutionConfig engine;
  RuntimeConfig runtime;
  LogConfig log;
  std::vector<ScheduleEntry> schedules;
};

} // namespace taskweave
