#include "datahub/dag/dependency_graph.hpp"
#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <algorithm>

using namespace datahub;
using namespace datahub::test;

namespace {

auto order_ids(const DependencyGraph &graph) -> std::vector<std::string> {
  std::vector<std::string> out;
  for (auto idx : graph.topological_order()) {
    out.push_back(graph.task(idx).id.str());
  }
  return out;
}

auto has_issue(const DependencyGraph &graph, std::string_view task, Error code)
    -> bool {
  return std::ranges::any_of(graph.issues(), [&](const IntegrityIssue &i) {
    return i.task == task && i.code == code;
  });
}

} // namespace

TEST(DependencyGraphTest, EmptyCatalog) {
  auto graph = DependencyGraph::build({});
  EXPECT_TRUE(graph.empty());
  EXPECT_TRUE(graph.topological_order().empty());
  EXPECT_TRUE(graph.issues().empty());
}

TEST(DependencyGraphTest, ParentsComeBeforeChildren) {
  // Catalog order deliberately lists children first.
  std::vector<Task> tasks{build(daily("report").depends_on("join")),
                          build(daily("join")
                                    .depends_on("orders")
                                    .depends_on("users", "force")),
                          build(daily("users")), build(daily("orders"))};
  auto graph = DependencyGraph::build(std::move(tasks));

  EXPECT_TRUE(graph.issues().empty());
  EXPECT_EQ(order_ids(graph),
            (std::vector<std::string>{"users", "orders", "join", "report"}));
}

TEST(DependencyGraphTest, TiesKeepCatalogOrder) {
  std::vector<Task> tasks{build(daily("c")), build(daily("a")),
                          build(daily("b"))};
  auto graph = DependencyGraph::build(std::move(tasks));
  EXPECT_EQ(order_ids(graph), (std::vector<std::string>{"c", "a", "b"}));
}

TEST(DependencyGraphTest, ChildrenAreDerivedFromParents) {
  std::vector<Task> tasks{build(daily("root")),
                          build(daily("left").depends_on("root")),
                          build(daily("right").depends_on("root", "force"))};
  auto graph = DependencyGraph::build(std::move(tasks));

  auto children = graph.children_of(TaskId{"root"});
  ASSERT_EQ(children.size(), 2u);
  EXPECT_EQ(children[0], TaskId{"left"});
  EXPECT_EQ(children[1], TaskId{"right"});

  const auto right = graph.index_of(TaskId{"right"});
  ASSERT_EQ(graph.parents(right).size(), 1u);
  EXPECT_EQ(graph.parents(right)[0].condition, ConditionKind::Force);
  EXPECT_TRUE(graph.children_of(TaskId{"left"}).empty());
}

TEST(DependencyGraphTest, DanglingParentExcludesTaskAndDescendants) {
  std::vector<Task> tasks{build(daily("a").depends_on("ghost")),
                          build(daily("b").depends_on("a")),
                          build(daily("c"))};
  auto graph = DependencyGraph::build(std::move(tasks));

  EXPECT_TRUE(has_issue(graph, "a", Error::DanglingParent));
  EXPECT_TRUE(has_issue(graph, "b", Error::ExcludedParent));
  EXPECT_FALSE(graph.is_schedulable(TaskId{"a"}));
  EXPECT_FALSE(graph.is_schedulable(TaskId{"b"}));
  EXPECT_TRUE(graph.is_schedulable(TaskId{"c"}));
  EXPECT_EQ(order_ids(graph), (std::vector<std::string>{"c"}));
}

TEST(DependencyGraphTest, UnknownConditionIsAnIntegrityIssue) {
  std::vector<Task> tasks{build(daily("a")),
                          build(daily("b").depends_on("a", "sometimes"))};
  auto graph = DependencyGraph::build(std::move(tasks));

  EXPECT_TRUE(has_issue(graph, "b", Error::UnknownCondition));
  EXPECT_TRUE(graph.is_schedulable(TaskId{"a"}));
  EXPECT_FALSE(graph.is_schedulable(TaskId{"b"}));
}

TEST(DependencyGraphTest, ConditionParsingIsCaseInsensitive) {
  std::vector<Task> tasks{build(daily("a")),
                          build(daily("b").depends_on("a", " FORCE ")),
                          build(daily("c").depends_on("a", ""))};
  auto graph = DependencyGraph::build(std::move(tasks));
  EXPECT_TRUE(graph.issues().empty());
  EXPECT_EQ(graph.parents(graph.index_of(TaskId{"b"}))[0].condition,
            ConditionKind::Force);
  EXPECT_EQ(graph.parents(graph.index_of(TaskId{"c"}))[0].condition,
            ConditionKind::Success);
}

TEST(DependencyGraphTest, CycleMembersAndDownstreamAreExcluded) {
  std::vector<Task> tasks{build(daily("root")),
                          build(daily("x").depends_on("root").depends_on("z")),
                          build(daily("y").depends_on("x")),
                          build(daily("z").depends_on("y")),
                          build(daily("after").depends_on("z")),
                          build(daily("ok").depends_on("root"))};
  auto graph = DependencyGraph::build(std::move(tasks));

  EXPECT_TRUE(has_issue(graph, "x", Error::CycleDetected));
  EXPECT_TRUE(has_issue(graph, "y", Error::CycleDetected));
  EXPECT_TRUE(has_issue(graph, "z", Error::CycleDetected));
  EXPECT_TRUE(has_issue(graph, "after", Error::ExcludedParent));
  EXPECT_EQ(order_ids(graph), (std::vector<std::string>{"root", "ok"}));
}

TEST(DependencyGraphTest, SelfEdgeIsACycle) {
  std::vector<Task> tasks{build(daily("loop").depends_on("loop"))};
  auto graph = DependencyGraph::build(std::move(tasks));
  EXPECT_TRUE(has_issue(graph, "loop", Error::CycleDetected));
  EXPECT_TRUE(graph.topological_order().empty());
}

TEST(DependencyGraphTest, DuplicateEdgesCollapse) {
  std::vector<Task> tasks{
      build(daily("a")),
      build(daily("b").depends_on("a").depends_on("a", "success"))};
  auto graph = DependencyGraph::build(std::move(tasks));
  EXPECT_EQ(graph.parents(graph.index_of(TaskId{"b"})).size(), 1u);
  EXPECT_EQ(graph.children_of(TaskId{"a"}).size(), 1u);
}

TEST(DependencyGraphTest, DuplicateIdKeepsFirstDefinition) {
  std::vector<Task> tasks{build(daily("a").priority(1)),
                          build(daily("a").priority(9))};
  auto graph = DependencyGraph::build(std::move(tasks));
  EXPECT_EQ(graph.size(), 1u);
  EXPECT_TRUE(has_issue(graph, "a", Error::AlreadyExists));
  ASSERT_NE(graph.find(TaskId{"a"}), nullptr);
  EXPECT_EQ(graph.find(TaskId{"a"})->policy.priority, 1);
}

TEST(DependencyGraphTest, IssueKeysAreStable) {
  std::vector<Task> first{build(daily("a").depends_on("ghost"))};
  std::vector<Task> second{build(daily("a").depends_on("ghost"))};
  auto g1 = DependencyGraph::build(std::move(first));
  auto g2 = DependencyGraph::build(std::move(second));
  ASSERT_EQ(g1.issues().size(), 1u);
  ASSERT_EQ(g2.issues().size(), 1u);
  EXPECT_EQ(g1.issues()[0].key(), g2.issues()[0].key());
}
