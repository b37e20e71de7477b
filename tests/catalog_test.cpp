#include "datahub/catalog/task_catalog.hpp"
#include "datahub/config/catalog_loader.hpp"
#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <filesystem>
#include <fstream>

using namespace datahub;
using namespace datahub::test;

namespace {

constexpr std::string_view kCatalog = R"(
[defaults]
queue = "etl"
retries = 1
retry_delay = 10
pending_timeout = 60

[[tasks]]
id = "orders"
operator = "sql"
mirror_id = 42
args = "insert overwrite table orders select * from raw"
owners = [7, 9]

[[tasks]]
id = "users"
operator = "spark"
period = "hourly"
queue = "adhoc"
priority = 2
retries = 0
created_at = "2024-04-01T08:00:00Z"

[[tasks]]
id = "join"
operator = "virtual"
parents = ["orders", "users"]

[[tasks]]
id = "report"
operator = "map_reduce"
soft_fail = true
running_timeout = 30
parents = ["join"]
)";

auto write_file(const std::string &path, std::string_view text) -> void {
  std::ofstream out(path, std::ios::trunc);
  out << text;
}

} // namespace

TEST(CatalogLoaderTest, ParsesTasksWithDefaults) {
  auto tasks = CatalogLoader::load_from_string(kCatalog);
  ASSERT_TRUE(tasks.has_value()) << tasks.error().message();
  ASSERT_EQ(tasks->size(), 4u);

  const auto &orders = (*tasks)[0];
  EXPECT_EQ(orders.id, TaskId{"orders"});
  EXPECT_EQ(orders.name, "orders");
  EXPECT_EQ(orders.period, SchedulePeriod::Daily);
  EXPECT_EQ(orders.policy.queue, "etl");
  EXPECT_EQ(orders.policy.retries, 1);
  EXPECT_EQ(orders.policy.retry_delay, std::chrono::minutes(10));
  EXPECT_EQ(orders.policy.pending_timeout, std::chrono::minutes(60));
  EXPECT_EQ(orders.owners, (std::vector<std::int64_t>{7, 9}));
  const auto &payload = std::get<RealPayload>(orders.payload);
  EXPECT_EQ(payload.op, OperatorType::Sql);
  EXPECT_EQ(payload.mirror_id, 42);

  const auto &users = (*tasks)[1];
  EXPECT_EQ(users.period, SchedulePeriod::Hourly);
  EXPECT_EQ(users.policy.queue, "adhoc");
  EXPECT_EQ(users.policy.priority, 2);
  EXPECT_EQ(users.policy.retries, 0);
  EXPECT_EQ(users.created_at, at("2024-04-01T08:00:00Z"));
  EXPECT_EQ(std::get<RealPayload>(users.payload).op, OperatorType::Spark);

  const auto &join = (*tasks)[2];
  EXPECT_TRUE(join.is_virtual());
  ASSERT_EQ(join.parents.size(), 2u);
  EXPECT_EQ(join.parents[0].task, TaskId{"orders"});
  EXPECT_EQ(join.parents[0].condition, "success");

  const auto &report = (*tasks)[3];
  EXPECT_EQ(std::get<RealPayload>(report.payload).op, OperatorType::MapReduce);
  EXPECT_TRUE(report.policy.soft_fail);
  EXPECT_EQ(report.policy.running_timeout, std::chrono::minutes(30));
}

TEST(CatalogLoaderTest, MissingIdIsRejected) {
  std::string diagnostic;
  auto tasks = CatalogLoader::load_from_string(R"(
[[tasks]]
operator = "sql"
)",
                                               &diagnostic);
  ASSERT_FALSE(tasks);
  EXPECT_EQ(tasks.error(), make_error_code(Error::InvalidArgument));
  EXPECT_NE(diagnostic.find("missing required field 'id'"), std::string::npos);
}

TEST(CatalogLoaderTest, DuplicateIdIsRejected) {
  auto tasks = CatalogLoader::load_from_string(R"(
[[tasks]]
id = "a"

[[tasks]]
id = "a"
)");
  ASSERT_FALSE(tasks);
  EXPECT_EQ(tasks.error(), make_error_code(Error::AlreadyExists));
}

TEST(CatalogLoaderTest, UnknownOperatorOrPeriodIsRejected) {
  std::string diagnostic;
  auto bad_op = CatalogLoader::load_from_string(R"(
[[tasks]]
id = "a"
operator = "hive"
)",
                                                &diagnostic);
  ASSERT_FALSE(bad_op);
  EXPECT_NE(diagnostic.find("hive"), std::string::npos);

  auto bad_period = CatalogLoader::load_from_string(R"(
[[tasks]]
id = "a"
period = "fortnightly"
)");
  ASSERT_FALSE(bad_period);
  EXPECT_EQ(bad_period.error(), make_error_code(Error::InvalidArgument));
}

TEST(CatalogLoaderTest, NegativeRetriesAreRejected) {
  auto tasks = CatalogLoader::load_from_string(R"(
[[tasks]]
id = "a"
retries = -1
)");
  ASSERT_FALSE(tasks);
  EXPECT_EQ(tasks.error(), make_error_code(Error::InvalidArgument));
}

TEST(CatalogLoaderTest, GraphProblemsAreLeftToTheGraph) {
  // Unknown conditions and dangling parents still load; the dependency graph
  // reports them per task.
  auto tasks = CatalogLoader::load_from_string(R"(
[[tasks]]
id = "a"
parents = ["ghost"]
)");
  ASSERT_TRUE(tasks.has_value());
  ASSERT_EQ(tasks->size(), 1u);
  EXPECT_EQ((*tasks)[0].parents[0].task, TaskId{"ghost"});
}

TEST(CatalogLoaderTest, MissingFile) {
  auto tasks = CatalogLoader::load_from_file("/nonexistent/catalog.toml");
  ASSERT_FALSE(tasks);
  EXPECT_EQ(tasks.error(), make_error_code(Error::FileNotFound));
}

TEST(InMemoryTaskCatalogTest, SnapshotSkipsInvalidAndRemoved) {
  InMemoryTaskCatalog catalog;
  ASSERT_TRUE(catalog.upsert(build(daily("a"))));
  ASSERT_TRUE(catalog.upsert(build(daily("b"))));
  ASSERT_TRUE(catalog.upsert(build(daily("c").valid(false))));

  auto snap = catalog.snapshot();
  ASSERT_TRUE(snap);
  EXPECT_EQ(snap->tasks.size(), 2u);

  const auto rev = snap->revision;
  ASSERT_TRUE(catalog.remove(TaskId{"a"}));
  snap = catalog.snapshot();
  ASSERT_EQ(snap->tasks.size(), 1u);
  EXPECT_EQ(snap->tasks[0].id, TaskId{"b"});
  EXPECT_GT(snap->revision, rev);

  // Soft-deleted definitions remain readable.
  auto removed = catalog.find(TaskId{"a"});
  ASSERT_TRUE(removed);
  EXPECT_TRUE(removed->is_remove);
}

TEST(InMemoryTaskCatalogTest, UpsertReplacesInPlace) {
  InMemoryTaskCatalog catalog;
  ASSERT_TRUE(catalog.upsert(build(daily("a"))));
  ASSERT_TRUE(catalog.upsert(build(daily("b"))));
  ASSERT_TRUE(catalog.upsert(build(daily("a").priority(9))));

  auto snap = catalog.snapshot();
  ASSERT_EQ(snap->tasks.size(), 2u);
  EXPECT_EQ(snap->tasks[0].id, TaskId{"a"});
  EXPECT_EQ(snap->tasks[0].policy.priority, 9);
}

TEST(InMemoryTaskCatalogTest, UnknownIdsAreNotFound) {
  InMemoryTaskCatalog catalog;
  auto removed = catalog.remove(TaskId{"x"});
  ASSERT_FALSE(removed);
  EXPECT_EQ(removed.error(), make_error_code(Error::NotFound));
  EXPECT_FALSE(catalog.set_valid(TaskId{"x"}, true));
  EXPECT_FALSE(catalog.find(TaskId{"x"}));
}

TEST(InMemoryTaskCatalogTest, RejectsInvalidTask) {
  InMemoryTaskCatalog catalog;
  Task task;
  auto r = catalog.upsert(task);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidArgument));
}

TEST(TomlTaskCatalogTest, ReloadsOnChangeAndKeepsLastGood) {
  TempPath path("catalog");
  write_file(path.str(), kCatalog);

  TomlTaskCatalog catalog(path.str());
  auto first = catalog.snapshot();
  ASSERT_TRUE(first) << first.error().message();
  EXPECT_EQ(first->tasks.size(), 4u);

  // Unchanged file keeps the revision.
  auto same = catalog.snapshot();
  ASSERT_TRUE(same);
  EXPECT_EQ(same->revision, first->revision);

  write_file(path.str(), "[[tasks]]\nid = \"solo\"\n");
  std::filesystem::last_write_time(
      path.str(), std::filesystem::last_write_time(path.str()) +
                      std::chrono::seconds(5));
  auto second = catalog.snapshot();
  ASSERT_TRUE(second);
  ASSERT_EQ(second->tasks.size(), 1u);
  EXPECT_GT(second->revision, first->revision);

  write_file(path.str(), "[[tasks]]\noperator = \"sql\"\n");
  std::filesystem::last_write_time(
      path.str(), std::filesystem::last_write_time(path.str()) +
                      std::chrono::seconds(10));
  auto broken = catalog.snapshot();
  ASSERT_TRUE(broken);
  EXPECT_EQ(broken->revision, second->revision);
  EXPECT_EQ(broken->tasks.size(), 1u);
}

TEST(TomlTaskCatalogTest, MissingFileWithoutHistoryFails) {
  TomlTaskCatalog catalog("/nonexistent/catalog.toml");
  auto snap = catalog.snapshot();
  ASSERT_FALSE(snap);
  EXPECT_EQ(snap.error(), make_error_code(Error::FileNotFound));
}
