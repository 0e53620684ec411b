#include "taskweave/cli/commands.hpp"
#include "taskweave/config/config.hpp"
#include "taskweave/core/coroutine.hpp"
#include "taskweave/core/runtime.hpp"
#include "taskweave/executor/engine.hpp"
#include "taskweave/util/json.hpp"
#include "taskweave/util/log.hpp"
#include "taskweave/workflow/workflow.hpp"

#include <chrono>
#include <format>
#include <print>
#include <random>
#include <string>
#include <vector>

namespace taskweave::cli {

namespace {

auto sleeping_handler(std::string name, std::chrono::milliseconds delay,
                      bool fail_it) -> TaskHandler {
  return [name = std::move(name), delay,
          fail_it](TaskContext ctx) -> task<TaskOutcome> {
    co_await async_sleep(delay);
    if (ctx.is_cancelled()) {
      co_return std::unexpected(TaskError::cancelled());
    }
    if (fail_it) {
      co_return std::unexpected(
          TaskError::execution_failed(std::format("{} failed", name)));
    }
    co_return JsonValue{{"task", name},
                        {"inputs", static_cast<int>(ctx.inputs().size())},
                        {"sleep_ms", static_cast<int>(delay.count())}};
  };
}

// extract -> work_0..work_{n-1} -> merge
auto build_demo_workflow(const DemoOptions &opts) -> Result<Workflow> {
  std::mt19937 rng{std::random_device{}()};
  std::uniform_real_distribution<double> coin{0.0, 1.0};
  std::uniform_int_distribution<int> jitter{opts.sleep_ms / 2,
                                            opts.sleep_ms * 3 / 2};
  auto delay = [&] { return std::chrono::milliseconds{jitter(rng)}; };

  WorkflowBuilder builder("demo");
  std::move(builder).description("fan-out/fan-in demo").parallel(opts.parallel);

  auto extract = Task::builder("extract")
                     .handler(sleeping_handler("extract", delay(), false))
                     .priority(10)
                     .build();
  if (!extract) {
    return fail(extract.error());
  }
  std::move(builder).add_task(std::move(*extract));

  std::vector<std::string> workers;
  for (std::size_t i = 0; i < opts.tasks; ++i) {
    auto name = std::format("work_{}", i);
    auto t = Task::builder(name)
                 .handler(sleeping_handler(name, delay(),
                                           coin(rng) < opts.fail_rate))
                 .depends_on("extract")
                 .retry(1, std::chrono::seconds{0})
                 .build();
    if (!t) {
      return fail(t.error());
    }
    std::move(builder).add_task(std::move(*t));
    workers.push_back(std::move(name));
  }

  auto merge = Task::builder("merge")
                   .handler(sleeping_handler("merge", delay(), false))
                   .depends_on_all(std::move(workers))
                   .build();
  if (!merge) {
    return fail(merge.error());
  }
  return std::move(builder).add_task(std::move(*merge)).build();
}

} // namespace

auto cmd_demo(const DemoOptions &opts) -> int {
  EngineConfig cfg{};
  if (opts.config_file) {
    auto loaded = ConfigLoader::load_from_file(*opts.config_file);
    if (!loaded) {
      std::println(stderr, "Error: {}: {}", *opts.config_file,
                   loaded.error().message());
      return 1;
    }
    cfg = std::move(*loaded);
    log::set_level(cfg.log.level);
    if (!cfg.log.file.empty() && !log::set_output_file(cfg.log.file)) {
      std::println(stderr, "Error: cannot open log file {}", cfg.log.file);
      return 1;
    }
  }

  auto workflow = build_demo_workflow(opts);
  if (!workflow) {
    std::println(stderr, "Error: {}", workflow.error().message());
    return 1;
  }

  log::start();
  Runtime runtime(cfg.runtime.threads);
  if (auto r = runtime.start(); !r) {
    log::stop();
    std::println(stderr, "Error: {}", r.error().message());
    return 1;
  }

  WorkflowEngine engine(cfg.engine);
  auto result = runtime.block_on(engine.execute(*workflow));
  runtime.stop();
  log::stop();

  if (!result) {
    std::println(stderr, "Error: {}", result.error().message());
    return 1;
  }

  std::println("{:<12} {:<10} {:>8} {:>7}  {}", "TASK", "STATUS", "MS",
               "RETRY", "DETAIL");
  for (const auto &r : result->task_results) {
    std::println("{:<12} {:<10} {:>8} {:>7}  {}", r.task_name,
                 to_string_view(r.status), r.duration.count(), r.retry_count,
                 r.error ? *r.error
                         : (r.output ? dump_json(*r.output) : std::string{}));
  }
  std::println("");
  std::println("workflow {} {} in {} ms", result->workflow_name,
               to_string_view(result->status), result->duration.count());
  if (result->error) {
    std::println("error: {}", *result->error);
  }
  return result->succeeded() ? 0 : 2;
}

} // namespace taskweave::cli
