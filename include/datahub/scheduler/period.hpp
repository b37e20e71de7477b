#pragma once

#include "datahub/catalog/task.hpp"
#include "datahub/util/id.hpp"
#include "datahub/util/time.hpp"

#include <optional>

namespace datahub {

// The period boundary a trigger tick falls into. Every task of the same
// period that fires for the same boundary shares the cycle, which is how a
// child instance finds its parents' instances.
struct FiringCycle {
  SchedulePeriod period{SchedulePeriod::Daily};
  TimePoint start{};

  // "daily@2024-05-01T00:00:00Z"; ONCE tasks all share "once".
  [[nodiscard]] auto id() const -> CycleId;

  auto operator==(const FiringCycle &) const -> bool = default;
};

// Start of the UTC period containing `now`: top of the hour, midnight,
// Monday midnight, or the first of the month. ONCE maps to the epoch.
[[nodiscard]] auto cycle_start(SchedulePeriod period, TimePoint now)
    -> TimePoint;

[[nodiscard]] inline auto current_cycle(SchedulePeriod period, TimePoint now)
    -> FiringCycle {
  return FiringCycle{.period = period, .start = cycle_start(period, now)};
}

// nullopt for ONCE, which has no next boundary.
[[nodiscard]] auto next_cycle_start(SchedulePeriod period, TimePoint start)
    -> std::optional<TimePoint>;

} // namespace datahub
