#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <functional>
#include <iterator>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace safeid::log {

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
    -> Level {
  const auto *it = std::ranges::find(level_names, name);
  return (it != level_names.end())
             ? static_cast<Level>(std::distance(level_names.begin(), it))
             : Level::Info;
}

// Lines are written synchronously until start(); afterwards they are posted to
// a private io_context drained by one writer thread, and stop() flushes it.
class Logger {
  using WorkGuard =
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};

  // Guards running_ transitions against posts, so no line is posted after
  // stop() has released the writer.
  std::mutex post_mutex_;
  std::mutex sink_mutex_;
  FILE *out_{stdout};
  FILE *file_{nullptr};

  boost::asio::io_context writer_ctx_{1};
  std::optional<WorkGuard> work_;
  std::jthread writer_;

  auto write_line(std::string_view line) -> void {
    std::lock_guard lock(sink_mutex_);
    std::fwrite(line.data(), 1, line.size(), out_);
    std::fflush(out_);
  }

  auto replace_sink(FILE *out, FILE *file) -> void {
    std::lock_guard lock(sink_mutex_);
    if (file_ != nullptr && file_ != file) {
      std::fclose(file_);
    }
    file_ = file;
    out_ = out;
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    replace_sink(stdout, nullptr);
  }

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto start() -> void {
    std::lock_guard lock(post_mutex_);
    if (running_.load(std::memory_order_acquire))
      return;
    writer_ctx_.restart();
    work_.emplace(writer_ctx_.get_executor());
    writer_ = std::jthread([this] { writer_ctx_.run(); });
    running_.store(true, std::memory_order_release);
  }

  auto stop() -> void {
    {
      std::lock_guard lock(post_mutex_);
      if (!running_.exchange(false, std::memory_order_acq_rel))
        return;
    }
    // Releasing the guard lets run() return once the queue is drained.
    work_.reset();
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  [[nodiscard]] auto running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  auto set_output_stdout() -> void { replace_sink(stdout, nullptr); }

  auto set_output_stderr() -> void { replace_sink(stderr, nullptr); }

  // Empty path restores stdout. Returns false when the file cannot be opened;
  // the current sink is kept in that case.
  auto set_output_file(std::string_view path) -> bool {
    if (path.empty()) {
      set_output_stdout();
      return true;
    }
    FILE *f = std::fopen(std::string(path).c_str(), "a");
    if (f == nullptr) {
      return false;
    }
    std::setvbuf(f, nullptr, _IOLBF, 0);
    replace_sink(f, f);
    return true;
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;

    std::string line;
    line.reserve(128);
    std::format_to(std::back_inserter(line),
                   "[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] ", now,
                   level_color(level), level_name(level), "\o{33}[0m", tid);
    std::format_to(std::back_inserter(line), fmt,
                   std::forward<Args>(args)...);
    line.push_back('\n');

    {
      std::lock_guard lock(post_mutex_);
      if (running_.load(std::memory_order_relaxed)) {
        boost::asio::post(writer_ctx_, [this, msg = std::move(line)] {
          write_line(msg);
        });
        return;
      }
    }
    write_line(line);
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
  logger().set_level(parse_level(name));
}

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

inline auto set_output_stderr() -> void { logger().set_output_stderr(); }

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

} // namespace safeid::log
