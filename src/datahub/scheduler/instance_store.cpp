#include "datahub/scheduler/instance_store.hpp"
#include "datahub/util/log.hpp"

#include <exception>
#include <format>
#include <utility>

namespace datahub {

auto InstanceStore::lineage_key(const TaskId &task, const CycleId &cycle)
    -> std::string {
  return std::format("{}\x1f{}", task, cycle);
}

auto InstanceStore::insert(Instance instance) -> Result<Instance *> {
  if (instance.id.empty()) {
    instance.id =
        make_instance_id(instance.task_id, instance.cycle_id, instance.attempt);
  }
  if (by_id_.contains(instance.id)) {
    return fail(Error::AlreadyExists);
  }

  auto key = lineage_key(instance.task_id, instance.cycle_id);
  auto latest_it = latest_.find(key);
  if (latest_it != latest_.end() &&
      instances_[latest_it->second].attempt >= instance.attempt) {
    return fail(Error::AlreadyExists);
  }

  const auto idx = instances_.size();
  instance.sequence = idx;
  by_id_.emplace(instance.id, idx);
  latest_[std::move(key)] = idx;
  instances_.push_back(std::move(instance));
  ++version_;
  return ok(&instances_.back());
}

auto InstanceStore::find(const InstanceId &id) -> Instance * {
  auto it = by_id_.find(id);
  return it == by_id_.end() ? nullptr : &instances_[it->second];
}

auto InstanceStore::find(const InstanceId &id) const -> const Instance * {
  auto it = by_id_.find(id);
  return it == by_id_.end() ? nullptr : &instances_[it->second];
}

auto InstanceStore::latest(const TaskId &task, const CycleId &cycle) const
    -> const Instance * {
  auto it = latest_.find(lineage_key(task, cycle));
  return it == latest_.end() ? nullptr : &instances_[it->second];
}

auto InstanceStore::ids_in_state(InstanceState state) const
    -> std::vector<InstanceId> {
  std::vector<InstanceId> out;
  for (const auto &inst : instances_) {
    if (inst.state == state) {
      out.push_back(inst.id);
    }
  }
  return out;
}

auto InstanceStore::transition(Instance &instance, InstanceState to,
                               TimePoint now, FailureReason reason,
                               std::string message) -> Result<void> {
  if (!can_transition(instance.state, to)) {
    log::warn("Rejected transition {} -> {} for {}",
              to_string_view(instance.state), to_string_view(to), instance.id);
    return fail(Error::InvalidState);
  }

  instance.state = to;
  switch (to) {
  case InstanceState::Ready:
    instance.admitted_at = now;
    break;
  case InstanceState::Running:
    instance.started_at = now;
    break;
  case InstanceState::Succeeded:
  case InstanceState::Failed:
  case InstanceState::Killed:
  case InstanceState::Skipped:
    instance.finished_at = now;
    instance.reason = reason;
    instance.message = std::move(message);
    break;
  case InstanceState::Pending:
  case InstanceState::Waiting:
    break;
  }
  ++version_;
  return ok();
}

auto InstanceStore::state_counts() const -> std::vector<std::size_t> {
  std::vector<std::size_t> counts(
      std::to_underlying(InstanceState::Skipped) + 1, 0);
  for (const auto &inst : instances_) {
    ++counts[std::to_underlying(inst.state)];
  }
  return counts;
}

auto InstanceStore::snapshot() const -> std::vector<Instance> {
  return {instances_.begin(), instances_.end()};
}

auto InstanceStore::restore(std::vector<Instance> instances) -> Result<void> {
  instances_.clear();
  by_id_.clear();
  latest_.clear();
  for (auto &inst : instances) {
    if (auto r = insert(std::move(inst)); !r) {
      log::error("Failed to restore instance: {}", r.error().message());
      return fail(r.error());
    }
  }
  ++version_;
  return ok();
}

auto InstanceStore::for_each_in_state(
    InstanceState state, std::string_view stage,
    const std::function<void(Instance &)> &fn) -> void {
  for (const auto &id : ids_in_state(state)) {
    auto *inst = find(id);
    if (inst == nullptr || inst->state != state) {
      continue;
    }
    try {
      fn(*inst);
    } catch (const std::exception &e) {
      log::error("{} failed for instance {}: {}", stage, id, e.what());
    }
  }
}

} // namespace datahub
