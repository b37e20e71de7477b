#pragma once

#include "datahub/dag/dependency_graph.hpp"
#include "datahub/scheduler/instance_store.hpp"

#include <functional>

namespace datahub {

// Status of one parent link given the parent's latest attempt for the same
// cycle (nullptr when the parent never fired for it).
[[nodiscard]] auto evaluate_link(const ParentLink &link,
                                 const Instance *parent) -> LinkStatus;

// Moves Waiting instances to Ready once every link is satisfied, or to
// Skipped as soon as one link is blocked.
class DependencyResolver {
public:
  using ReadyCallback = std::move_only_function<void(Instance &)>;
  using TerminalCallback =
      std::move_only_function<void(Instance &, TimePoint)>;

  explicit DependencyResolver(InstanceStore &store) : store_(store) {}

  auto set_on_ready(ReadyCallback cb) -> void { on_ready_ = std::move(cb); }
  auto set_on_terminal(TerminalCallback cb) -> void {
    on_terminal_ = std::move(cb);
  }

  // Returns true when the instance left Waiting.
  auto evaluate(Instance &instance, TimePoint now) -> bool;

  // Re-evaluates the children of `parent` in the parent's cycle.
  auto on_parent_terminal(const Instance &parent, const DependencyGraph &graph,
                          TimePoint now) -> void;

  // Re-evaluates every Waiting instance.
  auto sweep(TimePoint now) -> std::size_t;

private:
  InstanceStore &store_;
  ReadyCallback on_ready_;
  TerminalCallback on_terminal_;
};

} // namespace datahub
