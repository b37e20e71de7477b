#pragma once

#include "datahub/scheduler/instance.hpp"
#include "datahub/util/time.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <format>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <unistd.h>
#include <vector>

namespace datahub::cli::fmt {

namespace ansi {

inline constexpr std::string_view kReset = "\033[0m";
inline constexpr std::string_view kDim = "\033[2m";
inline constexpr std::string_view kRed = "\033[31m";
inline constexpr std::string_view kGreen = "\033[32m";
inline constexpr std::string_view kYellow = "\033[33m";
inline constexpr std::string_view kBlue = "\033[34m";
inline constexpr std::string_view kCyan = "\033[36m";

// Escapes are only emitted when stdout is a terminal.
inline auto paint(std::string_view text, std::string_view code)
    -> std::string {
  static const bool tty = ::isatty(::fileno(stdout)) != 0;
  if (!tty) {
    return std::string(text);
  }
  return std::format("{}{}{}", code, text, kReset);
}

inline auto green(std::string_view text) -> std::string {
  return paint(text, kGreen);
}
inline auto red(std::string_view text) -> std::string {
  return paint(text, kRed);
}
inline auto yellow(std::string_view text) -> std::string {
  return paint(text, kYellow);
}

// Printable width of `text`, skipping SGR escape sequences.
inline auto visible_width(std::string_view text) -> std::size_t {
  std::size_t width = 0;
  bool escape = false;
  for (const char c : text) {
    if (c == '\033') {
      escape = true;
    } else if (escape) {
      escape = c != 'm';
    } else {
      ++width;
    }
  }
  return width;
}

} // namespace ansi

[[nodiscard]] constexpr auto state_color(InstanceState state) noexcept
    -> std::string_view {
  switch (state) {
  case InstanceState::Pending:
  case InstanceState::Waiting:
    return ansi::kDim;
  case InstanceState::Ready:
    return ansi::kYellow;
  case InstanceState::Running:
    return ansi::kBlue;
  case InstanceState::Succeeded:
    return ansi::kGreen;
  case InstanceState::Failed:
  case InstanceState::Killed:
    return ansi::kRed;
  case InstanceState::Skipped:
    return ansi::kCyan;
  }
  return ansi::kReset;
}

inline auto colorize_instance_state(InstanceState state) -> std::string {
  return ansi::paint(to_string_view(state), state_color(state));
}

// Fixed-width text table for the CLI listings. Cells may carry colour.
class Table {
public:
  struct Column {
    std::string header;
    std::size_t width;
    bool right_align{false};
  };

  explicit Table(std::vector<Column> columns) : columns_(std::move(columns)) {}

  auto print_header() const -> void {
    std::vector<std::string> headers;
    std::size_t rule = 0;
    for (const auto &col : columns_) {
      headers.push_back(col.header);
      rule += col.width + 1;
    }
    print_row(headers);
    std::println("{}", std::string(rule > 0 ? rule - 1 : 0, '-'));
  }

  auto print_row(const std::vector<std::string> &cells) const -> void {
    std::string line;
    const auto n = std::min(columns_.size(), cells.size());
    for (std::size_t i = 0; i < n; ++i) {
      const auto &col = columns_[i];
      const auto width = ansi::visible_width(cells[i]);
      const std::string pad(width < col.width ? col.width - width : 0, ' ');
      if (i > 0) {
        line += ' ';
      }
      line += col.right_align ? pad + cells[i] : cells[i] + pad;
    }
    std::println("{}", line);
  }

private:
  std::vector<Column> columns_;
};

inline auto format_timestamp(const std::optional<TimePoint> &tp)
    -> std::string {
  return tp ? util::format_local_timestamp(*tp) : std::string("-");
}

// "42s", "3m 5s" or "2h 10m".
inline auto format_duration(const std::optional<TimePoint> &start,
                            const std::optional<TimePoint> &end)
    -> std::string {
  if (!start || !end) {
    return "-";
  }
  const auto secs =
      std::chrono::duration_cast<std::chrono::seconds>(*end - *start).count();
  if (secs < 60) {
    return std::format("{}s", secs);
  }
  if (secs < 3600) {
    return std::format("{}m {}s", secs / 60, secs % 60);
  }
  return std::format("{}h {}m", secs / 3600, (secs % 3600) / 60);
}

} // namespace datahub::cli::fmt
