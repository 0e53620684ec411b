#include "taskweave/config/config.hpp"
#include "taskweave/config/toml_util.hpp"

#include "taskweave/core/error.hpp"
#include "taskweave/scheduler/cron.hpp"
#include "taskweave/scheduler/scheduler.hpp"
#include "taskweave/util/log.hpp"

#include <boost/lexical_cast.hpp>

#include <cstdint>
#include <cstdlib>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace taskweave {
namespace detail {

struct EngineToml {
  int max_concurrent_tasks{5};
  int task_timeout_sec{300};
  int workflow_timeout_sec{3600};
  bool retry_on_failure{true};
  int max_retries{3};
  bool continue_on_failure{false};
  bool enable_checkpoints{true};
  int poll_interval_ms{100};
};

struct RuntimeToml {
  int threads{0};
};

struct LogToml {
  std::string level{"info"};
  std::string file;
};

struct ScheduleToml {
  std::string name;
  std::string workflow;
  std::string cron{"0 * * * *"};
  bool enabled{true};
  int max_runs{0}; // 0 = unlimited
};

struct ConfigToml {
  EngineToml engine{};
  RuntimeToml runtime{};
  LogToml log{};
  std::vector<ScheduleToml> schedules;
};

} // namespace detail
} // namespace taskweave

namespace glz {
template <> struct meta<taskweave::detail::EngineToml> {
  using T = taskweave::detail::EngineToml;
  static constexpr auto value = object(
      "max_concurrent_tasks", &T::max_concurrent_tasks, "task_timeout_sec",
      &T::task_timeout_sec, "workflow_timeout_sec", &T::workflow_timeout_sec,
      "retry_on_failure", &T::retry_on_failure, "max_retries", &T::max_retries,
      "continue_on_failure", &T::continue_on_failure, "enable_checkpoints",
      &T::enable_checkpoints, "poll_interval_ms", &T::poll_interval_ms);
};

template <> struct meta<taskweave::detail::RuntimeToml> {
  using T = taskweave::detail::RuntimeToml;
  static constexpr auto value = object("threads", &T::threads);
};

template <> struct meta<taskweave::detail::LogToml> {
  using T = taskweave::detail::LogToml;
  static constexpr auto value = object("level", &T::level, "file", &T::file);
};

template <> struct meta<taskweave::detail::ScheduleToml> {
  using T = taskweave::detail::ScheduleToml;
  static constexpr auto value =
      object("name", &T::name, "workflow", &T::workflow, "cron", &T::cron,
             "enabled", &T::enabled, "max_runs", &T::max_runs);
};

template <> struct meta<taskweave::detail::ConfigToml> {
  using T = taskweave::detail::ConfigToml;
  static constexpr auto value =
      object("engine", &T::engine, "runtime", &T::runtime, "log", &T::log,
             "schedules", &T::schedules);
};
} // namespace glz

namespace taskweave {
namespace {

auto apply_env_overrides(EngineConfig &cfg) -> void {
  if (const char *v = std::getenv("TASKWEAVE_LOG_LEVEL"); v != nullptr) {
    cfg.log.level = v;
  }
  if (const char *v = std::getenv("TASKWEAVE_MAX_CONCURRENT_TASKS");
      v != nullptr) {
    cfg.engine.max_concurrent_tasks = boost::lexical_cast<std::size_t>(v);
  }
  if (const char *v = std::getenv("TASKWEAVE_RUNTIME_THREADS"); v != nullptr) {
    cfg.runtime.threads = boost::lexical_cast<unsigned>(v);
  }
}

[[nodiscard]] auto validate(const EngineConfig &cfg) -> Result<void> {
  if (cfg.engine.max_concurrent_tasks == 0 ||
      cfg.engine.task_timeout.count() <= 0 ||
      cfg.engine.workflow_timeout.count() <= 0 ||
      cfg.engine.poll_interval.count() <= 0 || cfg.engine.max_retries < 0) {
    log::error("Invalid [engine] settings");
    return fail(Error::ParseError);
  }
  if (!log::parse_level(cfg.log.level)) {
    log::error("Unknown log level: {}", cfg.log.level);
    return fail(Error::ParseError);
  }
  for (const auto &s : cfg.schedules) {
    if (s.name.empty() || s.workflow.empty()) {
      log::error("Schedule entries need a name and a workflow");
      return fail(Error::ParseError);
    }
    if (!CronExpression::parse(s.cron)) {
      log::error("Schedule {}: invalid cron '{}'", s.name, s.cron);
      return fail(Error::ParseError);
    }
  }
  return ok();
}

[[nodiscard]] auto convert_toml(std::string_view toml_text,
                                std::string *diagnostic)
    -> Result<EngineConfig> {
  auto raw_result =
      toml_util::parse_toml<detail::ConfigToml>(toml_text, diagnostic);
  if (!raw_result)
    return fail(raw_result.error());
  auto &raw = *raw_result;

  // Negative values must not wrap when narrowed to unsigned fields.
  if (raw.engine.max_concurrent_tasks <= 0 || raw.runtime.threads < 0) {
    return fail(Error::ParseError);
  }

  EngineConfig cfg{};
  cfg.engine.max_concurrent_tasks =
      static_cast<std::size_t>(raw.engine.max_concurrent_tasks);
  cfg.engine.task_timeout = std::chrono::seconds{raw.engine.task_timeout_sec};
  cfg.engine.workflow_timeout =
      std::chrono::seconds{raw.engine.workflow_timeout_sec};
  cfg.engine.retry_on_failure = raw.engine.retry_on_failure;
  cfg.engine.max_retries = raw.engine.max_retries;
  cfg.engine.continue_on_failure = raw.engine.continue_on_failure;
  cfg.engine.enable_checkpoints = raw.engine.enable_checkpoints;
  cfg.engine.poll_interval =
      std::chrono::milliseconds{raw.engine.poll_interval_ms};

  cfg.runtime.threads = static_cast<unsigned>(raw.runtime.threads);

  cfg.log.level = std::move(raw.log.level);
  cfg.log.file = std::move(raw.log.file);

  cfg.schedules.reserve(raw.schedules.size());
  for (auto &s : raw.schedules) {
    ScheduleEntry entry{
        .name = std::move(s.name),
        .workflow = std::move(s.workflow),
        .cron = std::move(s.cron),
        .enabled = s.enabled,
    };
    if (s.max_runs > 0) {
      entry.max_runs = static_cast<std::uint32_t>(s.max_runs);
    }
    cfg.schedules.push_back(std::move(entry));
  }

  apply_env_overrides(cfg);

  if (auto r = validate(cfg); !r) {
    return fail(r.error());
  }
  return ok(std::move(cfg));
}

} // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<EngineConfig> {
  auto text = toml_util::read_file(path);
  if (!text) {
    log::error("Cannot read config file {}", path);
    return fail(text.error());
  }
  return load_from_string(*text);
}

auto ConfigLoader::load_from_string(std::string_view toml_str,
                                    std::string *diagnostic)
    -> Result<EngineConfig> {
  try {
    return convert_toml(toml_str, diagnostic);
  } catch (const boost::bad_lexical_cast &e) {
    log::error("Invalid TASKWEAVE_* environment override: {}", e.what());
    if (diagnostic) {
      *diagnostic = e.what();
    }
    return fail(Error::ParseError);
  } catch (const std::exception &e) {
    log::error("Failed to parse TOML configuration: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto to_toml(const EngineConfig &cfg) -> std::string {
  const auto &e = cfg.engine;
  auto out = std::format(
      "[engine]\n"
      "max_concurrent_tasks = {}\n"
      "task_timeout_sec = {}\n"
      "workflow_timeout_sec = {}\n"
      "retry_on_failure = {}\n"
      "max_retries = {}\n"
      "continue_on_failure = {}\n"
      "enable_checkpoints = {}\n"
      "poll_interval_ms = {}\n"
      "\n[runtime]\n"
      "threads = {}\n"
      "\n[log]\n"
      "level = \"{}\"\n"
      "file = \"{}\"\n",
      e.max_concurrent_tasks, e.task_timeout.count(),
      e.workflow_timeout.count(), e.retry_on_failure, e.max_retries,
      e.continue_on_failure, e.enable_checkpoints, e.poll_interval.count(),
      cfg.runtime.threads, cfg.log.level, cfg.log.file);

  for (const auto &s : cfg.schedules) {
    out += std::format("\n[[schedules]]\n"
                       "name = \"{}\"\n"
                       "workflow = \"{}\"\n"
                       "cron = \"{}\"\n"
                       "enabled = {}\n",
                       s.name, s.workflow, s.cron, s.enabled);
    if (s.max_runs) {
      out += std::format("max_runs = {}\n", *s.max_runs);
    }
  }
  return out;
}

auto register_schedules(Scheduler &scheduler, const EngineConfig &cfg)
    -> Result<std::vector<JobId>> {
  std::vector<JobId> ids;
  ids.reserve(cfg.schedules.size());
  for (const auto &s : cfg.schedules) {
    auto id = scheduler.schedule(s.name, WorkflowId{s.workflow},
                                 ScheduleConfig{.cron = s.cron,
                                                .enabled = s.enabled,
                                                .max_runs = s.max_runs});
    if (!id) {
      log::error("Schedule {} rejected: {}", s.name, id.error().message());
      for (const auto &registered : ids) {
        scheduler.unschedule(registered);
      }
      return fail(id.error());
    }
    ids.push_back(std::move(*id));
  }
  return ok(std::move(ids));
}

} // namespace taskweave
