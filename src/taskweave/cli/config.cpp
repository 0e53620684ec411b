#include "taskweave/cli/commands.hpp"
#include "taskweave/config/config.hpp"
#include "taskweave/scheduler/scheduler.hpp"
#include "taskweave/util/log.hpp"
#include "taskweave/util/time.hpp"

#include <print>
#include <string>

namespace taskweave::cli {

auto cmd_config(const ConfigOptions &opts) -> int {
  auto cfg = ConfigLoader::load_from_file(opts.config_file);
  if (!cfg) {
    std::println(stderr, "Error: {}: {}", opts.config_file,
                 cfg.error().message());
    return 1;
  }

  Scheduler scheduler;
  auto ids = register_schedules(scheduler, *cfg);
  if (!ids) {
    std::println(stderr, "Error: {}: {}", opts.config_file,
                 ids.error().message());
    return 1;
  }

  std::print("{}", to_toml(*cfg));
  if (!ids->empty()) {
    std::println("\n# Next runs");
  }
  for (const auto &id : *ids) {
    if (auto job = scheduler.get_job(id)) {
      std::println("# {}: {}", job->name,
                   job->next_run ? util::format_iso8601(*job->next_run)
                                 : std::string{"never"});
    }
  }
  return 0;
}

} // namespace taskweave::cli
