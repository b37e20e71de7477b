#include "datahub/scheduler/period.hpp"

#include <chrono>
#include <format>
#include <utility>

namespace datahub {

auto FiringCycle::id() const -> CycleId {
  if (period == SchedulePeriod::Once) {
    return CycleId{"once"};
  }
  return CycleId{std::format("{}@{}", to_string_view(period),
                             util::format_iso8601(start))};
}

auto cycle_start(SchedulePeriod period, TimePoint now) -> TimePoint {
  using namespace std::chrono;
  switch (period) {
  case SchedulePeriod::Once:
    return TimePoint{};
  case SchedulePeriod::Hourly:
    return floor<hours>(now);
  case SchedulePeriod::Daily:
    return floor<days>(now);
  case SchedulePeriod::Weekly: {
    const sys_days today = floor<days>(now);
    const weekday wd{today};
    // iso_encoding: Monday = 1 ... Sunday = 7
    return today - days{wd.iso_encoding() - 1};
  }
  case SchedulePeriod::Monthly: {
    const year_month_day ymd{floor<days>(now)};
    return sys_days{ymd.year() / ymd.month() / 1};
  }
  }
  std::unreachable();
}

auto next_cycle_start(SchedulePeriod period, TimePoint start)
    -> std::optional<TimePoint> {
  using namespace std::chrono;
  switch (period) {
  case SchedulePeriod::Once:
    return std::nullopt;
  case SchedulePeriod::Hourly:
    return start + hours{1};
  case SchedulePeriod::Daily:
    return start + days{1};
  case SchedulePeriod::Weekly:
    return start + weeks{1};
  case SchedulePeriod::Monthly: {
    const year_month_day ymd{floor<days>(start)};
    return sys_days{(ymd.year() / ymd.month() / 1) + months{1}};
  }
  }
  std::unreachable();
}

} // namespace datahub
