#pragma once

#include <boost/asio/error.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unistd.h>
#include <utility>

namespace datahub::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };

inline constexpr std::array<std::string_view, 5> level_names = {
    "trace", "debug", "info", "warn", "error"};

inline constexpr std::array<std::string_view, 5> level_colors = {
    "\033[90m", // trace: gray
    "\033[36m", // debug: cyan
    "\033[32m", // info: green
    "\033[33m", // warn: yellow
    "\033[31m"  // error: red
};

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] inline auto parse_level(std::string_view name)
    -> std::optional<Level> {
  const auto *it = std::ranges::find(level_names, name);
  if (it == level_names.end()) {
    return std::nullopt;
  }
  return static_cast<Level>(std::distance(level_names.begin(), it));
}

// Lines are formatted on the calling thread and handed to a single writer
// thread through a bounded channel. Before start() and after stop() every
// call writes synchronously.
class Logger {
  static constexpr std::size_t kQueueCapacity = 4096;
  using Channel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, std::string)>;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> dropped_{0};

  std::mutex out_mutex_;
  FILE *out_{stdout};
  bool owns_out_{false};
  std::atomic<bool> colors_{::isatty(::fileno(stdout)) != 0};

  boost::asio::io_context writer_ctx_{1};
  // Callers copy the pointer, so a channel detached by stop() outlives any
  // send already in flight.
  std::atomic<std::shared_ptr<Channel>> channel_;
  std::jthread writer_;

  auto write(std::string_view line) -> void {
    std::scoped_lock lock(out_mutex_);
    std::fwrite(line.data(), 1, line.size(), out_);
    std::fflush(out_);
  }

  auto receive_next(std::shared_ptr<Channel> channel) -> void {
    auto &ch = *channel;
    ch.async_receive([this, channel = std::move(channel)](
                         const boost::system::error_code &ec,
                         std::string line) mutable {
      if (ec) {
        return;
      }
      write(line);
      receive_next(std::move(channel));
    });
  }

  auto swap_output(FILE *next, bool owned) -> void {
    std::scoped_lock lock(out_mutex_);
    if (owns_out_ && out_ != nullptr) {
      std::fclose(out_);
    }
    out_ = next;
    owns_out_ = owned;
    colors_.store(::isatty(::fileno(next)) != 0, std::memory_order_release);
  }

  template <typename... Args>
  [[nodiscard]] auto format_line(Level level, std::format_string<Args...> fmt,
                                 Args &&...args) -> std::string {
    const auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    std::string line;
    line.reserve(128);
    if (colors_.load(std::memory_order_acquire)) {
      std::format_to(std::back_inserter(line),
                     "[{:%Y-%m-%d %H:%M:%S}] [{}{}\033[0m] ", now,
                     level_colors.at(std::to_underlying(level)),
                     level_name(level));
    } else {
      std::format_to(std::back_inserter(line), "[{:%Y-%m-%d %H:%M:%S}] [{}] ",
                     now, level_name(level));
    }
    std::format_to(std::back_inserter(line), fmt, std::forward<Args>(args)...);
    line.push_back('\n');
    return line;
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    if (owns_out_ && out_ != nullptr) {
      std::fclose(out_);
    }
  }

  Logger(const Logger &) = delete;
  auto operator=(const Logger &) -> Logger & = delete;

  auto start() -> void {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    writer_ctx_.restart();
    auto channel =
        std::make_shared<Channel>(writer_ctx_.get_executor(), kQueueCapacity);
    receive_next(channel);
    writer_ = std::jthread([this] { writer_ctx_.run(); });
    channel_.store(std::move(channel), std::memory_order_release);
  }

  // Queued lines are flushed before the writer exits: the end-of-stream
  // marker is ordered behind them in the channel. Lines logged after the
  // channel is detached are written synchronously.
  auto stop() -> void {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
      return;
    }
    auto channel = channel_.exchange(nullptr, std::memory_order_acq_rel);
    while (!channel->try_send(boost::asio::error::eof, std::string{})) {
      std::this_thread::yield();
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

  auto set_output_stderr() -> void { swap_output(stderr, false); }

  auto set_output_stdout() -> void { swap_output(stdout, false); }

  [[nodiscard]] auto set_output_file(std::string_view path) -> bool {
    if (path.empty()) {
      set_output_stdout();
      return true;
    }
    FILE *f = std::fopen(std::string(path).c_str(), "a");
    if (f == nullptr) {
      return false;
    }
    std::setvbuf(f, nullptr, _IOLBF, 0);
    swap_output(f, true);
    return true;
  }

  [[nodiscard]] auto dropped() const noexcept -> std::uint64_t {
    return dropped_.load(std::memory_order_relaxed);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (level < level_.load(std::memory_order_acquire)) {
      return;
    }
    auto line = format_line(level, fmt, std::forward<Args>(args)...);
    auto channel = channel_.load(std::memory_order_acquire);
    if (!channel) {
      write(line);
      return;
    }
    if (!channel->try_send(boost::system::error_code{}, std::move(line))) {
      dropped_.fetch_add(1, std::memory_order_relaxed);
    }
  }
};

inline auto logger() -> Logger & {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name).value_or(Level::Info));
}

[[nodiscard]] inline auto set_output_file(std::string_view path) -> bool {
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

} // namespace datahub::log
