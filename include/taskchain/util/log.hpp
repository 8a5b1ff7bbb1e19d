#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <format>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace taskchain::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error
};

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"trace", "debug", "info", "warn",
                                        "error"};
  return names[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto level_color(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view colors[] = {
      "\033[90m",  // trace: gray
      "\033[36m",  // debug: cyan
      "\033[32m",  // info: green
      "\033[33m",  // warn: yellow
      "\033[31m"   // error: red
  };
  return colors[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto parse_level(std::string_view name) noexcept
    -> Level {
  if (name == "trace")
    return Level::Trace;
  if (name == "debug")
    return Level::Debug;
  if (name == "warn")
    return Level::Warn;
  if (name == "error")
    return Level::Error;
  return Level::Info;
}

// Async logger. Worker threads format on their own stack and hand finished
// lines to a single writer thread; the writer owns the sink.
class Logger {
  static constexpr std::size_t QUEUE_CAPACITY = 8192;
  static constexpr std::size_t BATCH_SIZE = 64;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<bool> colored_{true};

  std::mutex mu_;
  std::condition_variable cv_;
  std::deque<std::string> pending_;
  std::FILE* sink_{stdout};
  std::thread writer_;

  auto writer_loop() -> void {
    std::vector<std::string> batch;
    batch.reserve(BATCH_SIZE);

    while (true) {
      std::FILE* sink = nullptr;
      {
        std::unique_lock lock(mu_);
        cv_.wait(lock, [this] {
          return !pending_.empty() ||
                 !running_.load(std::memory_order_acquire);
        });
        while (!pending_.empty() && batch.size() < BATCH_SIZE) {
          batch.push_back(std::move(pending_.front()));
          pending_.pop_front();
        }
        sink = sink_;
        if (batch.empty() && !running_.load(std::memory_order_acquire)) {
          break;
        }
      }

      for (const auto& msg : batch) {
        std::fputs(msg.c_str(), sink);
      }
      std::fflush(sink);
      batch.clear();
    }
  }

  auto format_line(Level level, std::string_view msg) const -> std::string {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::floor<std::chrono::milliseconds>(now);
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    if (colored_.load(std::memory_order_relaxed)) {
      return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] {}\n", time,
                         level_color(level), level_name(level), "\033[0m",
                         tid, msg);
    }
    return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] {}\n", time,
                       level_name(level), tid, msg);
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    if (sink_ != stdout && sink_ != nullptr) {
      std::fclose(sink_);
    }
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto start() -> void {
    if (running_.exchange(true))
      return;
    writer_ = std::thread([this] { writer_loop(); });
  }

  auto stop() -> void {
    {
      std::lock_guard lock(mu_);
      if (!running_.exchange(false))
        return;
    }
    cv_.notify_all();
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  // Redirects output to an append-mode file. Must be called before start().
  // Returns false and keeps the current sink when the file cannot be opened.
  auto set_file(const std::string& path) -> bool {
    std::FILE* file = std::fopen(path.c_str(), "a");
    if (file == nullptr) {
      return false;
    }
    std::lock_guard lock(mu_);
    if (sink_ != stdout && sink_ != nullptr) {
      std::fclose(sink_);
    }
    sink_ = file;
    colored_.store(false, std::memory_order_relaxed);
    return true;
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    auto line =
        format_line(level, std::format(fmt, std::forward<Args>(args)...));

    {
      std::lock_guard lock(mu_);
      if (running_.load(std::memory_order_acquire) &&
          pending_.size() < QUEUE_CAPACITY) {
        pending_.push_back(std::move(line));
        cv_.notify_one();
        return;
      }
      // Not started, shutting down, or backed up: write synchronously.
      std::fputs(line.c_str(), sink_);
      std::fflush(sink_);
    }
  }
};

// Global logger instance
inline Logger& logger() {
  static Logger instance;
  return instance;
}

// Public API
inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}

inline auto set_file(const std::string& path) -> bool {
  return logger().set_file(path);
}

inline auto start() -> void {
  logger().start();
}
inline auto stop() -> void {
  logger().stop();
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

}  // namespace taskchain::log
