#pragma once

#include "taskweave/config/engine_config.hpp"
#include "taskweave/core/error.hpp"
#include "taskweave/util/id.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace taskweave {

class Scheduler;

/// Loads an EngineConfig from TOML, then applies TASKWEAVE_* environment
/// overrides and validates the result. Any malformed value, bad override or
/// unparseable schedule cron yields Error::ParseError.
class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<EngineConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str,
                                             std::string *diagnostic = nullptr)
      -> Result<EngineConfig>;
};

/// Registers every `[[schedules]]` entry with `scheduler`, using the entry's
/// `workflow` text as the WorkflowId. Either all entries are registered or,
/// on the first rejected one, none are and its error is returned.
[[nodiscard]] auto register_schedules(Scheduler &scheduler,
                                      const EngineConfig &cfg)
    -> Result<std::vector<JobId>>;

/// Renders the effective configuration back as TOML.
[[nodiscard]] auto to_toml(const EngineConfig &cfg) -> std::string;

} // namespace taskweave
