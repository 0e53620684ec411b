#include "taskweave/cli/commands.hpp"
#include "taskweave/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdio>
#include <cstdlib>
#include <string>

int main(int argc, char *argv[]) {
  // Keep command output on stdout clean.
  taskweave::log::set_output_stderr();
  taskweave::log::set_level(taskweave::log::Level::Warn);

  CLI::App app{"taskweave", "Workflow orchestration core: cron and demo runs"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  taskweave cron \"*/15 9-17 * * 1-5\" -n 10\n"
             "  taskweave config -c taskweave.toml\n"
             "  taskweave demo --tasks 8 --parallel 4 --fail-rate 0.2");

  std::string log_level;
  app.add_option("-l,--log-level", log_level,
                 "Log level: trace|debug|info|warn|error")
      ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}))
      ->each([](const std::string &level) {
        taskweave::log::set_level(level);
      });

  taskweave::cli::CronOptions cron_opts;
  auto *cron = app.add_subcommand("cron", "Show the next fire times of a cron "
                                          "expression");
  cron->add_option("expression", cron_opts.expression,
                   "Five-field cron expression (quote it)")
      ->required();
  cron->add_option("-n,--count", cron_opts.count,
                   "Number of fire times to print (default: 5)")
      ->check(CLI::Range(1, 1000));
  cron->add_option("--from", cron_opts.from,
                   "Start time (ISO8601 or 'now', default: now)");
  cron->callback(
      [&cron_opts]() { std::exit(taskweave::cli::cmd_cron(cron_opts)); });

  taskweave::cli::ConfigOptions config_opts;
  auto *config = app.add_subcommand("config", "Load, validate and print an "
                                              "engine config file");
  config
      ->add_option("-c,--config", config_opts.config_file, "Engine config file")
      ->required()
      ->check(CLI::ExistingFile);
  config->callback(
      [&config_opts]() { std::exit(taskweave::cli::cmd_config(config_opts)); });

  taskweave::cli::DemoOptions demo_opts;
  auto *demo =
      app.add_subcommand("demo", "Run a fan-out/fan-in workflow of sleeping "
                                 "tasks");
  demo->add_option("-c,--config", demo_opts.config_file, "Engine config file")
      ->check(CLI::ExistingFile);
  demo->add_option("--tasks", demo_opts.tasks, "Number of fan-out tasks")
      ->check(CLI::Range(1, 64));
  demo->add_option("--parallel", demo_opts.parallel,
                   "Concurrent tasks per run")
      ->check(CLI::Range(1, 64));
  demo->add_option("--fail-rate", demo_opts.fail_rate,
                   "Probability that a fan-out task fails")
      ->check(CLI::Range(0.0, 1.0));
  demo->add_option("--sleep-ms", demo_opts.sleep_ms,
                   "Mean task duration in milliseconds")
      ->check(CLI::Range(0, 60000));
  demo->callback(
      [&demo_opts]() { std::exit(taskweave::cli::cmd_demo(demo_opts)); });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
