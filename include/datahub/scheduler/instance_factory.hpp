#pragma once

#include "datahub/catalog/task.hpp"
#include "datahub/core/error.hpp"
#include "datahub/dag/dependency_graph.hpp"
#include "datahub/scheduler/instance_store.hpp"
#include "datahub/scheduler/period.hpp"

namespace datahub {

class InstanceFactory {
public:
  explicit InstanceFactory(InstanceStore &store) : store_(store) {}

  // First attempt of `task` for `cycle`, left in Waiting with one link per
  // graph parent. AlreadyExists when the cycle already has an instance.
  [[nodiscard]] auto create(const Task &task, const FiringCycle &cycle,
                            const DependencyGraph &graph, TimePoint now)
      -> Result<Instance *>;

  // Next attempt after `failed`, left in Pending until not_before.
  [[nodiscard]] auto create_retry(const Instance &failed, TimePoint now)
      -> Result<Instance *>;

  // Pending -> Waiting for a retry whose delay has passed.
  [[nodiscard]] auto activate(Instance &instance, TimePoint now)
      -> Result<void>;

  // Recomputes link existence: a parent without an instance for the cycle is
  // Unsatisfiable, otherwise the link is left for the resolver.
  auto link_parents(Instance &instance) -> void;

private:
  InstanceStore &store_;
};

} // namespace datahub
