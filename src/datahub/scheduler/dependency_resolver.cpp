#include "datahub/scheduler/dependency_resolver.hpp"
#include "datahub/util/log.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <utility>

namespace datahub {

auto evaluate_link(const ParentLink &link, const Instance *parent)
    -> LinkStatus {
  if (parent == nullptr) {
    return LinkStatus::Unsatisfiable;
  }
  if (!parent->terminal()) {
    return LinkStatus::Unresolved;
  }

  switch (link.condition) {
  case ConditionKind::Force:
    return LinkStatus::Satisfied;
  case ConditionKind::Success:
    if (parent->state == InstanceState::Succeeded) {
      return LinkStatus::Satisfied;
    }
    if (is_failure(parent->state) && parent->policy.soft_fail) {
      return LinkStatus::Satisfied;
    }
    return LinkStatus::Blocked;
  }
  std::unreachable();
}

auto DependencyResolver::evaluate(Instance &instance, TimePoint now) -> bool {
  if (instance.state != InstanceState::Waiting) {
    return false;
  }

  bool changed = false;
  const ParentLink *blocked = nullptr;
  for (auto &link : instance.parents) {
    const auto status =
        evaluate_link(link, store_.latest(link.parent, instance.cycle_id));
    if (status != link.status) {
      link.status = status;
      changed = true;
    }
    if (status == LinkStatus::Blocked && blocked == nullptr) {
      blocked = &link;
    }
  }
  if (changed) {
    store_.touch();
  }

  if (blocked != nullptr) {
    const auto *parent = store_.latest(blocked->parent, instance.cycle_id);
    auto message = std::format("parent {} ended {}", blocked->parent,
                               to_string_view(parent->state));
    if (auto r = store_.transition(instance, InstanceState::Skipped, now,
                                   FailureReason::DependencyBlocked,
                                   std::move(message));
        !r) {
      return false;
    }
    log::info("Skipped {}: {}", instance.id, instance.message);
    if (on_terminal_) {
      on_terminal_(instance, now);
    }
    return true;
  }

  const bool all_satisfied =
      std::ranges::all_of(instance.parents, [](const ParentLink &link) {
        return link.status == LinkStatus::Satisfied;
      });
  if (!all_satisfied) {
    return false;
  }

  if (auto r = store_.transition(instance, InstanceState::Ready, now); !r) {
    return false;
  }
  log::debug("{} is ready", instance.id);
  if (on_ready_) {
    on_ready_(instance);
  }
  return true;
}

auto DependencyResolver::on_parent_terminal(const Instance &parent,
                                            const DependencyGraph &graph,
                                            TimePoint now) -> void {
  // Copy the ids: evaluate() may recurse back here through on_terminal_.
  const auto parent_task = parent.task_id;
  const auto cycle = parent.cycle_id;
  for (const auto &child : graph.children_of(parent_task)) {
    auto *latest = store_.latest(child, cycle);
    if (latest == nullptr) {
      continue;
    }
    auto *inst = store_.find(latest->id);
    if (inst == nullptr || inst->state != InstanceState::Waiting) {
      continue;
    }
    try {
      evaluate(*inst, now);
    } catch (const std::exception &e) {
      log::error("Dependency evaluation failed for {}: {}", inst->id,
                 e.what());
    }
  }
}

auto DependencyResolver::sweep(TimePoint now) -> std::size_t {
  std::size_t moved = 0;
  store_.for_each_in_state(InstanceState::Waiting, "dependency sweep",
                           [&](Instance &inst) {
                             if (evaluate(inst, now)) {
                               ++moved;
                             }
                           });
  return moved;
}

} // namespace datahub
