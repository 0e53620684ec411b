#pragma once

#include <chrono>
#include <cstddef>

namespace taskweave {

namespace timing {
constexpr auto kDefaultPollInterval = std::chrono::milliseconds(100);
} // namespace timing

namespace limits {
constexpr std::size_t kMaxWorkflowTasks = 100;
constexpr std::size_t kMaxDependencyDepth = 20;
constexpr int kMaxTaskRetries = 10;
constexpr auto kMaxTaskTimeout = std::chrono::seconds(300);
} // namespace limits

namespace cron {
// Five years, leap days included.
constexpr int kSearchHorizonDays = 366 * 5 + 2;
} // namespace cron

} // namespace taskweave
