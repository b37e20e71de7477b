#pragma once

#include "datahub/catalog/task.hpp"
#include "datahub/core/error.hpp"
#include "datahub/util/id.hpp"

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace datahub {

using NodeIndex = std::uint32_t;
constexpr NodeIndex kInvalidNode = UINT32_MAX;

struct GraphEdge {
  NodeIndex parent{kInvalidNode};
  ConditionKind condition{ConditionKind::Success};
};

// A catalog problem that keeps `task` from being scheduled. `code` is one of
// DanglingParent, UnknownCondition, CycleDetected, ExcludedParent or
// AlreadyExists (duplicate id).
struct IntegrityIssue {
  TaskId task;
  Error code{Error::Unknown};
  std::string detail;

  [[nodiscard]] auto key() const -> std::string;
  auto operator==(const IntegrityIssue &) const -> bool = default;
};

// Directed graph over one catalog snapshot, parents pointing at children.
// Built once per tick and immutable afterwards. The children index is derived
// here and never stored in the catalog.
class DependencyGraph {
public:
  DependencyGraph() = default;

  [[nodiscard]] static auto build(std::vector<Task> tasks) -> DependencyGraph;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return tasks_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return tasks_.empty(); }

  [[nodiscard]] auto index_of(const TaskId &id) const -> NodeIndex;
  [[nodiscard]] auto find(const TaskId &id) const -> const Task *;
  [[nodiscard]] auto task(NodeIndex idx) const -> const Task &;

  [[nodiscard]] auto parents(NodeIndex idx) const noexcept
      -> std::span<const GraphEdge>;
  [[nodiscard]] auto children(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;
  [[nodiscard]] auto children_of(const TaskId &id) const -> std::vector<TaskId>;

  [[nodiscard]] auto is_schedulable(NodeIndex idx) const noexcept -> bool;
  [[nodiscard]] auto is_schedulable(const TaskId &id) const -> bool;

  // Schedulable tasks only; every task appears after all of its parents and
  // ties keep catalog order.
  [[nodiscard]] auto topological_order() const noexcept
      -> std::span<const NodeIndex> {
    return order_;
  }

  [[nodiscard]] auto issues() const noexcept
      -> std::span<const IntegrityIssue> {
    return issues_;
  }

private:
  auto add_edge(NodeIndex parent, NodeIndex child, ConditionKind condition)
      -> void;
  auto exclude(NodeIndex idx, Error code, std::string detail) -> void;
  auto mark_cycles() -> void;
  auto compute_order() -> void;

  struct Node {
    std::vector<GraphEdge> parents;
    std::vector<NodeIndex> children;
    bool excluded{false};
  };

  std::vector<Task> tasks_;
  std::vector<Node> nodes_;
  ankerl::unordered_dense::map<TaskId, NodeIndex> key_to_idx_;
  std::vector<NodeIndex> order_;
  std::vector<IntegrityIssue> issues_;
};

} // namespace datahub
