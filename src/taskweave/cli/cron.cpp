#include "taskweave/cli/commands.hpp"
#include "taskweave/scheduler/cron.hpp"
#include "taskweave/util/log.hpp"
#include "taskweave/util/time.hpp"

#include <print>
#include <string>
#include <vector>

namespace taskweave::cli {

namespace {

auto join(const std::vector<int> &values) -> std::string {
  std::string out;
  for (int v : values) {
    if (!out.empty()) {
      out += ',';
    }
    out += std::to_string(v);
  }
  return out;
}

} // namespace

auto cmd_cron(const CronOptions &opts) -> int {
  auto cron = CronExpression::parse(opts.expression);
  if (!cron) {
    std::println(stderr, "Error: {}: '{}'", cron.error().message(),
                 opts.expression);
    return 1;
  }

  auto from = util::parse_iso8601(opts.from.value_or("now"));
  if (!from) {
    std::println(stderr, "Error: invalid --from time: {}", *opts.from);
    return 1;
  }

  std::println("expression:   {}", cron->expression());
  std::println("minutes:      {}", join(cron->minutes()));
  std::println("hours:        {}", join(cron->hours()));
  std::println("days/month:   {}", join(cron->days_of_month()));
  std::println("months:       {}", join(cron->months()));
  std::println("days/week:    {}", join(cron->days_of_week()));
  std::println("");

  auto at = *from;
  for (std::size_t i = 0; i < opts.count; ++i) {
    auto next = cron->next_after(at);
    if (!next) {
      std::println("(no further matches)");
      break;
    }
    std::println("{}", util::format_iso8601(*next));
    at = *next;
  }
  return 0;
}

} // namespace taskweave::cli
