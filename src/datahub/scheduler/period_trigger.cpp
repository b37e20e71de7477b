#include "datahub/scheduler/period_trigger.hpp"

#include <algorithm>

namespace datahub {

auto PeriodTrigger::due(const Task &task, TimePoint now) const
    -> std::optional<FiringCycle> {
  const auto cycle = current_cycle(task.period, now);
  auto it = marks_.find(task.id);
  if (it == marks_.end()) {
    return cycle;
  }
  const auto &last = it->second;
  if (last.period != cycle.period || last.start < cycle.start) {
    return cycle;
  }
  return std::nullopt;
}

auto PeriodTrigger::mark(const TaskId &task, const FiringCycle &cycle)
    -> void {
  marks_.insert_or_assign(task, cycle);
}

auto PeriodTrigger::marks() const -> std::vector<TriggerMark> {
  std::vector<TriggerMark> out;
  out.reserve(marks_.size());
  for (const auto &[task, cycle] : marks_) {
    out.push_back(TriggerMark{.task = task, .cycle = cycle});
  }
  std::ranges::sort(out, {}, &TriggerMark::task);
  return out;
}

auto PeriodTrigger::restore(std::span<const TriggerMark> marks) -> void {
  marks_.clear();
  for (const auto &m : marks) {
    marks_.insert_or_assign(m.task, m.cycle);
  }
}

} // namespace datahub
