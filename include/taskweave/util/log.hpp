#pragma once

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace taskweave::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };

inline constexpr std::array<std::string_view, 5> level_names = {
    "trace", "debug", "info", "warn", "error"};

inline constexpr std::array<std::string_view, 5> level_colors = {
    "\o{33}[90m", // trace: gray
    "\o{33}[36m", // debug: cyan
    "\o{33}[32m", // info: green
    "\o{33}[33m", // warn: yellow
    "\o{33}[31m"  // error: red
};

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] inline auto level_color(Level level) -> std::string_view {
  return level_colors.at(std::to_underlying(level));
}

[[nodiscard]] inline auto parse_level(std::string_view name) noexcept
    -> std::optional<Level> {
  const auto *it = std::ranges::find(level_names, name);
  if (it == level_names.end()) {
    return std::nullopt;
  }
  return static_cast<Level>(std::distance(level_names.begin(), it));
}

// Async logger: lines are formatted on the calling thread and handed to a
// writer thread through a Boost concurrent_channel. Before start() every
// line is written synchronously.
class Logger {
  static constexpr std::size_t QUEUE_CAPACITY = 8192;
  static constexpr std::size_t BATCH_SIZE = 64;
  using LogChannel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, std::string)>;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<FILE *> output_{stdout};
  std::atomic<std::uint64_t> dropped_messages_{0};
  std::mutex files_mu_;
  std::vector<FILE *> files_;
  boost::asio::io_context queue_ctx_{1};
  std::atomic<std::shared_ptr<LogChannel>> queue_;
  std::jthread writer_;

  [[nodiscard]] auto out() const noexcept -> FILE * {
    auto *f = output_.load(std::memory_order_acquire);
    return f ? f : stdout;
  }

  auto write_line(std::string_view line) const -> void {
    auto *f = out();
    std::fwrite(line.data(), 1, line.size(), f);
    std::fflush(f);
  }

  auto writer_loop(std::shared_ptr<LogChannel> queue) -> void {
    std::vector<std::string> batch;
    batch.reserve(BATCH_SIZE);

    while (running_.load(std::memory_order_acquire)) {
      boost::system::error_code recv_ec;
      queue->async_receive(
          [&](const boost::system::error_code &ec, std::string item) {
            recv_ec = ec;
            if (!ec) {
              batch.push_back(std::move(item));
            }
          });
      queue_ctx_.restart();
      (void)queue_ctx_.run_one();
      if (recv_ec) {
        break;
      }

      while (batch.size() < BATCH_SIZE &&
             queue->try_receive(
                 [&](const boost::system::error_code &ec, std::string item) {
                   if (!ec) {
                     batch.push_back(std::move(item));
                   }
                 })) {
      }

      auto *f = out();
      for (const auto &msg : batch) {
        std::fwrite(msg.data(), 1, msg.size(), f);
      }
      std::fflush(f);
      batch.clear();
    }

    // Drain whatever is left after close().
    while (queue->try_receive(
        [&](const boost::system::error_code &ec, std::string item) {
          if (!ec) {
            write_line(item);
          }
        })) {
    }
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    std::scoped_lock lock(files_mu_);
    for (auto *f : files_) {
      std::fclose(f);
    }
  }

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto start() -> void {
    if (running_.exchange(true, std::memory_order_acq_rel))
      return;
    queue_ctx_.restart();
    auto queue =
        std::make_shared<LogChannel>(queue_ctx_.get_executor(), QUEUE_CAPACITY);
    queue_.store(queue, std::memory_order_release);
    writer_ = std::jthread([this, q = std::move(queue)] { writer_loop(q); });
  }

  auto stop() -> void {
    if (!running_.exchange(false, std::memory_order_acq_rel))
      return;
    auto queue = queue_.exchange(nullptr, std::memory_order_acq_rel);
    if (queue) {
      queue->close();
    }
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  auto set_output_stderr() noexcept -> void {
    output_.store(stderr, std::memory_order_release);
  }

  /// Appends to `path`; an empty path switches back to stdout. Replaced
  /// files stay open until the logger is destroyed since the writer thread
  /// may still hold them.
  auto set_output_file(std::string_view path) -> bool {
    if (path.empty()) {
      output_.store(stdout, std::memory_order_release);
      return true;
    }
    FILE *f = std::fopen(std::string(path).c_str(), "a");
    if (!f)
      return false;
    std::setvbuf(f, nullptr, _IOLBF, 0);
    {
      std::scoped_lock lock(files_mu_);
      files_.push_back(f);
    }
    output_.store(f, std::memory_order_release);
    return true;
  }

  [[nodiscard]] auto dropped_messages() const noexcept -> std::uint64_t {
    return dropped_messages_.load(std::memory_order_relaxed);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    auto time = std::chrono::floor<std::chrono::seconds>(
        std::chrono::system_clock::now());
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    auto line = std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] {}\n", time,
                            level_color(level), level_name(level),
                            "\o{33}[0m", tid,
                            std::format(fmt, std::forward<Args>(args)...));

    if (!running_.load(std::memory_order_acquire)) {
      write_line(line);
      return;
    }
    auto queue = queue_.load(std::memory_order_acquire);
    if (!queue || !queue->try_send(boost::system::error_code{}, line)) {
      // Queue full: drop rather than block a runtime thread.
      dropped_messages_.fetch_add(1, std::memory_order_relaxed);
    }
  }
};

inline Logger &logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name).value_or(Level::Info));
}

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

inline auto set_output_stderr() noexcept -> void {
  logger().set_output_stderr();
}

inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

} // namespace taskweave::log
