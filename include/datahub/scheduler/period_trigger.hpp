#pragma once

#include "datahub/catalog/task.hpp"
#include "datahub/scheduler/period.hpp"
#include "datahub/util/id.hpp"

#include <ankerl/unordered_dense.h>

#include <optional>
#include <span>
#include <vector>

namespace datahub {

struct TriggerMark {
  TaskId task;
  FiringCycle cycle;

  auto operator==(const TriggerMark &) const -> bool = default;
};

// Remembers the last cycle each task fired for. A task is due when it has
// never fired, when its period changed, or when the clock has crossed into a
// later boundary. Missed boundaries are not back-filled.
class PeriodTrigger {
public:
  [[nodiscard]] auto due(const Task &task, TimePoint now) const
      -> std::optional<FiringCycle>;
  auto mark(const TaskId &task, const FiringCycle &cycle) -> void;

  // Sorted by task id.
  [[nodiscard]] auto marks() const -> std::vector<TriggerMark>;
  auto restore(std::span<const TriggerMark> marks) -> void;

private:
  ankerl::unordered_dense::map<TaskId, FiringCycle> marks_;
};

} // namespace datahub
