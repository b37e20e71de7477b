#include "datahub/scheduler/instance_factory.hpp"
#include "datahub/scheduler/instance_store.hpp"
#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <stdexcept>
#include <tuple>

using namespace datahub;
using namespace datahub::test;

namespace {

auto make(std::string task, int attempt = 1) -> Instance {
  const auto cycle = current_cycle(SchedulePeriod::Daily, at("2024-05-01"));
  Instance inst{.task_id = TaskId{std::move(task)},
                .cycle = cycle,
                .cycle_id = cycle.id(),
                .attempt = attempt};
  return inst;
}

const CycleId kCycle{"daily@2024-05-01T00:00:00Z"};

} // namespace

TEST(InstanceTest, TransitionTable) {
  using S = InstanceState;
  EXPECT_TRUE(can_transition(S::Pending, S::Waiting));
  EXPECT_TRUE(can_transition(S::Waiting, S::Ready));
  EXPECT_TRUE(can_transition(S::Waiting, S::Skipped));
  EXPECT_TRUE(can_transition(S::Ready, S::Running));
  EXPECT_TRUE(can_transition(S::Ready, S::Failed));
  EXPECT_TRUE(can_transition(S::Running, S::Killed));

  EXPECT_FALSE(can_transition(S::Pending, S::Ready));
  EXPECT_FALSE(can_transition(S::Waiting, S::Running));
  EXPECT_FALSE(can_transition(S::Ready, S::Skipped));
  EXPECT_FALSE(can_transition(S::Running, S::Waiting));
  EXPECT_FALSE(can_transition(S::Succeeded, S::Failed));
  EXPECT_FALSE(can_transition(S::Skipped, S::Waiting));
}

TEST(InstanceTest, IdFormat) {
  EXPECT_EQ(make_instance_id(TaskId{"a"}, kCycle, 2),
            "a:daily@2024-05-01T00:00:00Z#2");
}

TEST(InstanceStoreTest, InsertAssignsIdAndSequence) {
  InstanceStore store;
  auto a = store.insert(make("a"));
  auto b = store.insert(make("b"));
  ASSERT_TRUE(a);
  ASSERT_TRUE(b);
  EXPECT_EQ((*a)->id, "a:daily@2024-05-01T00:00:00Z#1");
  EXPECT_EQ((*a)->sequence, 0u);
  EXPECT_EQ((*b)->sequence, 1u);
  EXPECT_EQ(store.size(), 2u);
  EXPECT_EQ(store.find((*a)->id), *a);
}

TEST(InstanceStoreTest, RejectsDuplicateAndStaleAttempts) {
  InstanceStore store;
  ASSERT_TRUE(store.insert(make("a", 2)));

  auto dup = store.insert(make("a", 2));
  ASSERT_FALSE(dup);
  EXPECT_EQ(dup.error(), make_error_code(Error::AlreadyExists));

  auto older = store.insert(make("a", 1));
  ASSERT_FALSE(older);
  EXPECT_EQ(older.error(), make_error_code(Error::AlreadyExists));

  ASSERT_TRUE(store.insert(make("a", 3)));
  ASSERT_NE(store.latest(TaskId{"a"}, kCycle), nullptr);
  EXPECT_EQ(store.latest(TaskId{"a"}, kCycle)->attempt, 3);
}

TEST(InstanceStoreTest, TransitionStampsTimes) {
  InstanceStore store;
  auto *inst = *store.insert(make("a"));
  const auto t0 = at("2024-05-01T00:01");
  const auto t1 = at("2024-05-01T00:02");
  const auto t2 = at("2024-05-01T00:03");

  ASSERT_TRUE(store.transition(*inst, InstanceState::Waiting, t0));
  ASSERT_TRUE(store.transition(*inst, InstanceState::Ready, t0));
  ASSERT_TRUE(store.transition(*inst, InstanceState::Running, t1));
  ASSERT_TRUE(store.transition(*inst, InstanceState::Failed, t2,
                               FailureReason::ExecutionFailure, "boom"));

  EXPECT_EQ(inst->admitted_at, t0);
  EXPECT_EQ(inst->started_at, t1);
  EXPECT_EQ(inst->finished_at, t2);
  EXPECT_EQ(inst->reason, FailureReason::ExecutionFailure);
  EXPECT_EQ(inst->message, "boom");
}

TEST(InstanceStoreTest, InvalidTransitionLeavesInstanceUntouched) {
  InstanceStore store;
  auto *inst = *store.insert(make("a"));
  const auto version = store.version();

  auto r = store.transition(*inst, InstanceState::Running, at("2024-05-01"));
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidState));
  EXPECT_EQ(inst->state, InstanceState::Pending);
  EXPECT_EQ(store.version(), version);
}

TEST(InstanceStoreTest, StateCountsAndIds) {
  InstanceStore store;
  auto *a = *store.insert(make("a"));
  std::ignore = *store.insert(make("b"));
  ASSERT_TRUE(store.transition(*a, InstanceState::Waiting, at("2024-05-01")));

  auto counts = store.state_counts();
  EXPECT_EQ(counts[std::to_underlying(InstanceState::Pending)], 1u);
  EXPECT_EQ(counts[std::to_underlying(InstanceState::Waiting)], 1u);
  EXPECT_EQ(store.ids_in_state(InstanceState::Waiting),
            std::vector<InstanceId>{a->id});
}

TEST(InstanceStoreTest, ForEachContinuesAfterException) {
  InstanceStore store;
  std::ignore = *store.insert(make("a"));
  std::ignore = *store.insert(make("b"));

  int visited = 0;
  store.for_each_in_state(InstanceState::Pending, "test", [&](Instance &inst) {
    ++visited;
    if (inst.task_id == "a") {
      throw std::runtime_error("bad instance");
    }
  });
  EXPECT_EQ(visited, 2);
}

TEST(InstanceStoreTest, RestoreReplacesContent) {
  InstanceStore store;
  std::ignore = *store.insert(make("old"));

  std::vector<Instance> saved{make("x"), make("y")};
  ASSERT_TRUE(store.restore(std::move(saved)));
  EXPECT_EQ(store.size(), 2u);
  EXPECT_EQ(store.latest(TaskId{"old"}, kCycle), nullptr);
  ASSERT_NE(store.latest(TaskId{"y"}, kCycle), nullptr);
  EXPECT_EQ(store.latest(TaskId{"y"}, kCycle)->sequence, 1u);
}

TEST(InstanceFactoryTest, CreateLinksParentsAndWaits) {
  InstanceStore store;
  InstanceFactory factory(store);
  auto graph = DependencyGraph::build(
      {build(daily("a")), build(daily("b").depends_on("a", "force"))});
  const auto now = at("2024-05-01T00:10");
  const auto cycle = current_cycle(SchedulePeriod::Daily, now);

  auto a = factory.create(*graph.find(TaskId{"a"}), cycle, graph, now);
  ASSERT_TRUE(a);
  EXPECT_EQ((*a)->state, InstanceState::Waiting);
  EXPECT_TRUE((*a)->parents.empty());

  auto b = factory.create(*graph.find(TaskId{"b"}), cycle, graph, now);
  ASSERT_TRUE(b);
  ASSERT_EQ((*b)->parents.size(), 1u);
  EXPECT_EQ((*b)->parents[0].parent, TaskId{"a"});
  EXPECT_EQ((*b)->parents[0].condition, ConditionKind::Force);
  EXPECT_EQ((*b)->parents[0].status, LinkStatus::Unresolved);
  EXPECT_EQ((*b)->created_at, now);
}

TEST(InstanceFactoryTest, MissingParentInstanceIsUnsatisfiable) {
  InstanceStore store;
  InstanceFactory factory(store);
  auto graph = DependencyGraph::build(
      {build(daily("a")), build(daily("b").depends_on("a"))});
  const auto now = at("2024-05-01T00:10");

  auto b = factory.create(*graph.find(TaskId{"b"}),
                          current_cycle(SchedulePeriod::Daily, now), graph,
                          now);
  ASSERT_TRUE(b);
  EXPECT_EQ((*b)->parents[0].status, LinkStatus::Unsatisfiable);
}

TEST(InstanceFactoryTest, CreateIsIdempotentPerCycle) {
  InstanceStore store;
  InstanceFactory factory(store);
  auto graph = DependencyGraph::build({build(daily("a"))});
  const auto now = at("2024-05-01T00:10");
  const auto cycle = current_cycle(SchedulePeriod::Daily, now);
  const auto &task = *graph.find(TaskId{"a"});

  ASSERT_TRUE(factory.create(task, cycle, graph, now));
  auto again = factory.create(task, cycle, graph, now);
  ASSERT_FALSE(again);
  EXPECT_EQ(again.error(), make_error_code(Error::AlreadyExists));
  EXPECT_EQ(store.size(), 1u);
}

TEST(InstanceFactoryTest, UnknownTaskIsNotFound) {
  InstanceStore store;
  InstanceFactory factory(store);
  auto graph = DependencyGraph::build({});
  const auto task = build(daily("ghost"));
  auto r = factory.create(task, current_cycle(task.period, at("2024-05-01")),
                          graph, at("2024-05-01"));
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), make_error_code(Error::NotFound));
}

TEST(InstanceFactoryTest, RetryCopiesPolicyAndWaitsForDelay) {
  InstanceStore store;
  InstanceFactory factory(store);
  auto graph = DependencyGraph::build(
      {build(daily("a").retry(2, 5min).priority(3))});
  const auto t0 = at("2024-05-01T00:10");
  auto *first = *factory.create(*graph.find(TaskId{"a"}),
                                current_cycle(SchedulePeriod::Daily, t0),
                                graph, t0);
  ASSERT_TRUE(store.transition(*first, InstanceState::Ready, t0));
  ASSERT_TRUE(store.transition(*first, InstanceState::Running, t0));
  const auto t1 = at("2024-05-01T00:20");
  ASSERT_TRUE(store.transition(*first, InstanceState::Failed, t1,
                               FailureReason::ExecutionFailure));

  auto retry = factory.create_retry(*first, t1);
  ASSERT_TRUE(retry);
  EXPECT_EQ((*retry)->attempt, 2);
  EXPECT_EQ((*retry)->id, "a:daily@2024-05-01T00:00:00Z#2");
  EXPECT_EQ((*retry)->state, InstanceState::Pending);
  EXPECT_EQ((*retry)->not_before, at("2024-05-01T00:25"));
  EXPECT_EQ((*retry)->policy.priority, 3);
  EXPECT_EQ(store.latest(TaskId{"a"}, first->cycle_id), *retry);

  ASSERT_TRUE(factory.activate(**retry, at("2024-05-01T00:25")));
  EXPECT_EQ((*retry)->state, InstanceState::Waiting);
}

TEST(InstanceFactoryTest, RetryRequiresFailure) {
  InstanceStore store;
  InstanceFactory factory(store);
  auto *inst = *store.insert(make("a"));
  auto r = factory.create_retry(*inst, at("2024-05-01"));
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidState));
}
