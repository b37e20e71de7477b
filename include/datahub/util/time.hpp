#pragma once

#include "datahub/core/error.hpp"
#include "datahub/util/conv.hpp"

#include <chrono>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace datahub {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

namespace util {

// YYYY-MM-DDTHH:MM:SSZ, always UTC.
[[nodiscard]] inline auto format_iso8601(TimePoint tp) -> std::string {
  return std::format("{:%Y-%m-%dT%H:%M:%SZ}",
                     std::chrono::floor<std::chrono::seconds>(tp));
}

[[nodiscard]] inline auto format_iso8601(const std::optional<TimePoint> &tp)
    -> std::string {
  return tp ? format_iso8601(*tp) : std::string{};
}

// Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM" and "YYYY-MM-DDTHH:MM:SS", with an
// optional trailing 'Z'. A space may replace the 'T'.
[[nodiscard]] inline auto parse_iso8601(std::string_view text)
    -> Result<TimePoint> {
  using namespace std::chrono;
  if (!text.empty() && (text.back() == 'Z' || text.back() == 'z')) {
    text.remove_suffix(1);
  }
  if (text.size() != 10 && text.size() != 16 && text.size() != 19) {
    return fail(Error::ParseError);
  }
  if (text[4] != '-' || text[7] != '-') {
    return fail(Error::ParseError);
  }

  auto y = parse_int<int>(text.substr(0, 4));
  auto m = parse_int<unsigned>(text.substr(5, 2));
  auto d = parse_int<unsigned>(text.substr(8, 2));
  if (!y || !m || !d) {
    return fail(Error::ParseError);
  }
  const year_month_day ymd{year{*y}, month{*m}, day{*d}};
  if (!ymd.ok()) {
    return fail(Error::ParseError);
  }

  TimePoint tp = sys_days{ymd};
  if (text.size() == 10) {
    return ok(tp);
  }

  if ((text[10] != 'T' && text[10] != ' ') || text[13] != ':') {
    return fail(Error::ParseError);
  }
  auto hh = parse_int<int>(text.substr(11, 2));
  auto mm = parse_int<int>(text.substr(14, 2));
  if (!hh || !mm || *hh > 23 || *mm > 59) {
    return fail(Error::ParseError);
  }
  tp += hours{*hh} + minutes{*mm};
  if (text.size() == 19) {
    if (text[16] != ':') {
      return fail(Error::ParseError);
    }
    auto ss = parse_int<int>(text.substr(17, 2));
    if (!ss || *ss > 59) {
      return fail(Error::ParseError);
    }
    tp += seconds{*ss};
  }
  return ok(tp);
}

[[nodiscard]] inline auto format_local_timestamp(TimePoint tp) -> std::string {
  return std::format("{:%Y-%m-%d %H:%M:%S}",
                     std::chrono::floor<std::chrono::seconds>(tp));
}

[[nodiscard]] inline auto to_unix_millis(TimePoint tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

[[nodiscard]] inline auto from_unix_millis(std::int64_t millis) -> TimePoint {
  return TimePoint{std::chrono::duration_cast<Clock::duration>(
      std::chrono::milliseconds{millis})};
}

// Optional timestamps are stored as 0 when unset.
[[nodiscard]] inline auto to_unix_millis(const std::optional<TimePoint> &tp)
    -> std::int64_t {
  return tp ? to_unix_millis(*tp) : 0;
}

[[nodiscard]] inline auto optional_from_unix_millis(std::int64_t millis)
    -> std::optional<TimePoint> {
  if (millis == 0) {
    return std::nullopt;
  }
  return from_unix_millis(millis);
}

} // namespace util
} // namespace datahub
