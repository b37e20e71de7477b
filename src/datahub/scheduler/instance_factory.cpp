#include "datahub/scheduler/instance_factory.hpp"
#include "datahub/util/log.hpp"

#include <utility>

namespace datahub {

auto InstanceFactory::create(const Task &task, const FiringCycle &cycle,
                             const DependencyGraph &graph, TimePoint now)
    -> Result<Instance *> {
  const auto idx = graph.index_of(task.id);
  if (idx == kInvalidNode) {
    return fail(Error::NotFound);
  }

  auto cycle_id = cycle.id();
  if (store_.latest(task.id, cycle_id) != nullptr) {
    return fail(Error::AlreadyExists);
  }

  Instance inst{
      .id = make_instance_id(task.id, cycle_id, 1),
      .task_id = task.id,
      .cycle = cycle,
      .cycle_id = std::move(cycle_id),
      .attempt = 1,
      .payload = task.payload,
      .policy = task.policy,
      .created_at = now,
  };
  for (const auto &edge : graph.parents(idx)) {
    inst.parents.push_back(ParentLink{.parent = graph.task(edge.parent).id,
                                      .condition = edge.condition});
  }

  auto inserted = store_.insert(std::move(inst));
  if (!inserted) {
    return inserted;
  }
  auto *created = *inserted;
  link_parents(*created);
  if (auto r = store_.transition(*created, InstanceState::Waiting, now); !r) {
    return fail(r.error());
  }
  log::debug("Created {} with {} parent link(s)", created->id,
             created->parents.size());
  return ok(created);
}

auto InstanceFactory::create_retry(const Instance &failed, TimePoint now)
    -> Result<Instance *> {
  if (!is_failure(failed.state)) {
    return fail(Error::InvalidState);
  }

  const auto finished = failed.finished_at.value_or(now);
  Instance inst{
      .id = make_instance_id(failed.task_id, failed.cycle_id,
                             failed.attempt + 1),
      .task_id = failed.task_id,
      .cycle = failed.cycle,
      .cycle_id = failed.cycle_id,
      .attempt = failed.attempt + 1,
      .payload = failed.payload,
      .policy = failed.policy,
      .parents = failed.parents,
      .created_at = now,
      .not_before = finished + failed.policy.retry_delay,
  };
  for (auto &link : inst.parents) {
    link.status = LinkStatus::Unresolved;
  }

  auto inserted = store_.insert(std::move(inst));
  if (inserted) {
    log::info("Scheduled retry {} at {}", (*inserted)->id,
              util::format_iso8601((*inserted)->not_before));
  }
  return inserted;
}

auto InstanceFactory::activate(Instance &instance, TimePoint now)
    -> Result<void> {
  link_parents(instance);
  return store_.transition(instance, InstanceState::Waiting, now);
}

auto InstanceFactory::link_parents(Instance &instance) -> void {
  bool changed = false;
  for (auto &link : instance.parents) {
    const auto status = store_.latest(link.parent, instance.cycle_id) == nullptr
                            ? LinkStatus::Unsatisfiable
                            : LinkStatus::Unresolved;
    if (link.status != status) {
      link.status = status;
      changed = true;
    }
  }
  if (changed) {
    store_.touch();
  }
}

} // namespace datahub
