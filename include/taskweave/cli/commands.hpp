#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace taskweave::cli {

struct CronOptions {
  std::string expression;
  std::size_t count{5};
  std::optional<std::string> from; // ISO8601 or "now"
};

struct ConfigOptions {
  std::string config_file;
};

struct DemoOptions {
  std::optional<std::string> config_file;
  std::size_t tasks{4};
  std::size_t parallel{2};
  double fail_rate{0.0};
  int sleep_ms{100};
};

[[nodiscard]] auto cmd_cron(const CronOptions &opts) -> int;
[[nodiscard]] auto cmd_config(const ConfigOptions &opts) -> int;
[[nodiscard]] auto cmd_demo(const DemoOptions &opts) -> int;

} // namespace taskweave::cli
