#include "datahub/dag/dependency_graph.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <utility>
#include <vector>

namespace datahub {

auto IntegrityIssue::key() const -> std::string {
  return std::format("{}|{}|{}", task, std::to_underlying(code), detail);
}

auto DependencyGraph::build(std::vector<Task> tasks) -> DependencyGraph {
  DependencyGraph graph;
  graph.tasks_.reserve(tasks.size());
  graph.nodes_.reserve(tasks.size());

  for (auto &task : tasks) {
    if (graph.key_to_idx_.contains(task.id)) {
      graph.issues_.push_back(IntegrityIssue{
          .task = task.id,
          .code = Error::AlreadyExists,
          .detail = "duplicate task id, later definition ignored"});
      continue;
    }
    const auto idx = static_cast<NodeIndex>(graph.tasks_.size());
    graph.key_to_idx_.emplace(task.id, idx);
    graph.tasks_.push_back(std::move(task));
    graph.nodes_.emplace_back();
  }

  for (NodeIndex child = 0; child < graph.tasks_.size(); ++child) {
    const auto &task = graph.tasks_[child];
    for (const auto &edge : task.parents) {
      auto condition = parse_condition(edge.condition);
      if (!condition) {
        graph.exclude(child, Error::UnknownCondition,
                      std::format("parent '{}' uses unknown condition '{}'",
                                  edge.task, edge.condition));
        continue;
      }
      const auto parent = graph.index_of(edge.task);
      if (parent == kInvalidNode) {
        graph.exclude(child, Error::DanglingParent,
                      std::format("parent '{}' does not exist or is removed",
                                  edge.task));
        continue;
      }
      if (parent == child) {
        graph.exclude(child, Error::CycleDetected, "task depends on itself");
        continue;
      }
      graph.add_edge(parent, child, *condition);
    }
  }

  graph.mark_cycles();
  graph.compute_order();

  return graph;
}

auto DependencyGraph::add_edge(NodeIndex parent, NodeIndex child,
                               ConditionKind condition) -> void {
  auto &child_parents = nodes_[child].parents;
  const bool duplicate = std::ranges::any_of(
      child_parents, [&](const GraphEdge &e) { return e.parent == parent; });
  if (duplicate) {
    return;
  }
  child_parents.push_back(GraphEdge{.parent = parent, .condition = condition});
  nodes_[parent].children.push_back(child);
}

auto DependencyGraph::exclude(NodeIndex idx, Error code, std::string detail)
    -> void {
  nodes_[idx].excluded = true;
  issues_.push_back(IntegrityIssue{
      .task = tasks_[idx].id, .code = code, .detail = std::move(detail)});
}

// Iterative DFS over the children lists. A child that is still on the
// recursion stack closes a cycle; every task on that stack segment is
// excluded. Tasks that only lead into a cycle are handled by compute_order().
auto DependencyGraph::mark_cycles() -> void {
  std::vector<std::uint8_t> state(nodes_.size(), 0);
  std::vector<bool> in_cycle(nodes_.size(), false);
  std::vector<std::pair<NodeIndex, std::size_t>> stack;
  stack.reserve(nodes_.size());

  for (NodeIndex start = 0; start < nodes_.size(); ++start) {
    if (state[start] != 0) {
      continue;
    }
    stack.emplace_back(start, 0);
    state[start] = 1;

    while (!stack.empty()) {
      auto &[node, next_child] = stack.back();
      const auto &children = nodes_[node].children;
      if (next_child >= children.size()) {
        state[node] = 2;
        stack.pop_back();
        continue;
      }

      const NodeIndex child = children[next_child++];
      if (state[child] == 0) {
        state[child] = 1;
        stack.emplace_back(child, 0);
        continue;
      }
      if (state[child] != 1) {
        continue;
      }

      auto begin = std::ranges::find_if(
          stack, [child](const auto &frame) { return frame.first == child; });
      std::string path;
      for (auto it = begin; it != stack.end(); ++it) {
        path += std::format("{} -> ", tasks_[it->first].id);
      }
      path += tasks_[child].id.str();

      for (auto it = begin; it != stack.end(); ++it) {
        if (!in_cycle[it->first]) {
          in_cycle[it->first] = true;
          exclude(it->first, Error::CycleDetected, path);
        }
      }
    }
  }
}

auto DependencyGraph::compute_order() -> void {
  std::vector<std::size_t> in_degree;
  in_degree.reserve(nodes_.size());
  for (const auto &node : nodes_) {
    in_degree.push_back(node.parents.size());
  }

  std::vector<NodeIndex> ready;
  ready.reserve(nodes_.size());
  for (NodeIndex idx = 0; idx < nodes_.size(); ++idx) {
    if (in_degree[idx] == 0) {
      ready.push_back(idx);
    }
  }

  std::vector<bool> emitted(nodes_.size(), false);
  order_.reserve(nodes_.size());
  for (std::size_t head = 0; head < ready.size(); ++head) {
    const NodeIndex current = ready[head];
    emitted[current] = true;

    auto &node = nodes_[current];
    if (!node.excluded) {
      auto blocked = std::ranges::find_if(node.parents, [&](const GraphEdge &e) {
        return nodes_[e.parent].excluded;
      });
      if (blocked != node.parents.end()) {
        exclude(current, Error::ExcludedParent,
                std::format("parent '{}' is excluded",
                            tasks_[blocked->parent].id));
      } else {
        order_.push_back(current);
      }
    }

    for (NodeIndex child : node.children) {
      if (--in_degree[child] == 0) {
        ready.push_back(child);
      }
    }
  }

  for (NodeIndex idx = 0; idx < nodes_.size(); ++idx) {
    if (!emitted[idx] && !nodes_[idx].excluded) {
      exclude(idx, Error::ExcludedParent, "downstream of a dependency cycle");
    }
  }
}

auto DependencyGraph::index_of(const TaskId &id) const -> NodeIndex {
  auto it = key_to_idx_.find(id);
  return it != key_to_idx_.end() ? it->second : kInvalidNode;
}

auto DependencyGraph::find(const TaskId &id) const -> const Task * {
  const auto idx = index_of(id);
  return idx == kInvalidNode ? nullptr : &tasks_[idx];
}

auto DependencyGraph::task(NodeIndex idx) const -> const Task & {
  return tasks_.at(idx);
}

auto DependencyGraph::parents(NodeIndex idx) const noexcept
    -> std::span<const GraphEdge> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].parents;
}

auto DependencyGraph::children(NodeIndex idx) const noexcept
    -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].children;
}

auto DependencyGraph::children_of(const TaskId &id) const
    -> std::vector<TaskId> {
  std::vector<TaskId> out;
  for (NodeIndex child : children(index_of(id))) {
    out.push_back(tasks_[child].id);
  }
  return out;
}

auto DependencyGraph::is_schedulable(NodeIndex idx) const noexcept -> bool {
  return idx < nodes_.size() && !nodes_[idx].excluded;
}

auto DependencyGraph::is_schedulable(const TaskId &id) const -> bool {
  return is_schedulable(index_of(id));
}

} // namespace datahub
