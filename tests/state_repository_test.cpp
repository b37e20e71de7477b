#include "datahub/storage/file_lock.hpp"
#include "datahub/storage/state_repository.hpp"
#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <filesystem>
#include <fstream>

using namespace datahub;
using namespace datahub::test;

namespace {

auto sample_state() -> TrackerState {
  const auto cycle =
      current_cycle(SchedulePeriod::Daily, at("2024-05-01T00:10"));
  Instance running{
      .id = make_instance_id(TaskId{"b"}, cycle.id(), 2),
      .task_id = TaskId{"b"},
      .cycle = cycle,
      .cycle_id = cycle.id(),
      .attempt = 2,
      .state = InstanceState::Running,
      .payload = RealPayload{.op = OperatorType::Spark,
                             .mirror_id = 11,
                             .args = "--conf x=1"},
      .policy = ExecutionPolicy{.queue = "etl",
                                .priority = 3,
                                .pending_timeout = std::chrono::minutes(15),
                                .running_timeout = std::chrono::minutes(90),
                                .retries = 2,
                                .retry_delay = std::chrono::minutes(5),
                                .soft_fail = true},
      .parents = {ParentLink{.parent = TaskId{"a"},
                             .condition = ConditionKind::Force,
                             .status = LinkStatus::Satisfied}},
      .created_at = at("2024-05-01T00:10"),
      .admitted_at = at("2024-05-01T00:11"),
      .started_at = at("2024-05-01T00:12"),
      .kill_requested_at = at("2024-05-01T01:42"),
  };
  Instance skipped{
      .id = make_instance_id(TaskId{"j"}, cycle.id(), 1),
      .task_id = TaskId{"j"},
      .cycle = cycle,
      .cycle_id = cycle.id(),
      .state = InstanceState::Skipped,
      .reason = FailureReason::DependencyBlocked,
      .message = "parent a ended failed",
      .payload = VirtualPayload{},
      .created_at = at("2024-05-01T00:10"),
      .finished_at = at("2024-05-01T00:30"),
  };
  return TrackerState{
      .instances = {running, skipped},
      .marks = {TriggerMark{.task = TaskId{"a"}, .cycle = cycle}},
      .saved_at = at("2024-05-01T02:00"),
  };
}

} // namespace

TEST(StateCodecTest, PreservesEveryField) {
  const auto state = sample_state();
  auto json = encode_state(state);
  ASSERT_TRUE(json);

  std::string diagnostic;
  auto decoded = decode_state(*json, &diagnostic);
  ASSERT_TRUE(decoded) << diagnostic;
  ASSERT_EQ(decoded->instances.size(), 2u);
  EXPECT_EQ(decoded->instances[0], state.instances[0]);
  EXPECT_EQ(decoded->instances[1], state.instances[1]);
  EXPECT_EQ(decoded->marks, state.marks);
  EXPECT_EQ(decoded->saved_at, state.saved_at);
}

TEST(StateCodecTest, EnumsAreWrittenAsNames) {
  auto json = encode_state(sample_state());
  ASSERT_TRUE(json);
  EXPECT_NE(json->find("\"running\""), std::string::npos);
  EXPECT_NE(json->find("\"dependency_blocked\""), std::string::npos);
  EXPECT_NE(json->find("\"virtual\""), std::string::npos);
}

TEST(StateCodecTest, RejectsUnknownVersionAndState) {
  std::string diagnostic;
  auto old = decode_state(R"({"version":99,"instances":[],"marks":[]})",
                          &diagnostic);
  ASSERT_FALSE(old);
  EXPECT_NE(diagnostic.find("version"), std::string::npos);

  auto bad_state = decode_state(
      R"({"version":1,"instances":[{"id":"a:once#1","task_id":"a",)"
      R"("period":"once","cycle_id":"once","attempt":1,"state":"exploded",)"
      R"("reason":"none","op":"sql"}],"marks":[]})",
      &diagnostic);
  ASSERT_FALSE(bad_state);
  EXPECT_EQ(bad_state.error(), make_error_code(Error::ParseError));
  EXPECT_NE(diagnostic.find("exploded"), std::string::npos);
}

TEST(StateCodecTest, MalformedJson) {
  auto r = decode_state("{not json");
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), make_error_code(Error::ParseError));
}

TEST(JsonFileStateRepositoryTest, MissingFileLoadsEmpty) {
  TempPath path("state_missing");
  JsonFileStateRepository repo(path.str());
  auto state = repo.load();
  ASSERT_TRUE(state);
  EXPECT_TRUE(state->instances.empty());
  EXPECT_TRUE(state->marks.empty());
}

TEST(JsonFileStateRepositoryTest, SaveThenLoad) {
  TempPath dir("state_dir");
  const auto file = dir.str() + "/nested/state.json";
  JsonFileStateRepository repo(file);

  const auto state = sample_state();
  ASSERT_TRUE(repo.save(state));
  EXPECT_TRUE(std::filesystem::exists(file));
  EXPECT_FALSE(std::filesystem::exists(file + ".tmp"));

  auto loaded = repo.load();
  ASSERT_TRUE(loaded);
  EXPECT_EQ(loaded->instances, state.instances);
  EXPECT_EQ(loaded->marks, state.marks);
}

TEST(JsonFileStateRepositoryTest, CorruptFileFailsLoad) {
  TempPath path("state_corrupt");
  {
    std::ofstream out(path.str());
    out << "garbage";
  }
  JsonFileStateRepository repo(path.str());
  auto r = repo.load();
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), make_error_code(Error::ParseError));
}

TEST(MemoryStateRepositoryTest, KeepsLastSave) {
  MemoryStateRepository repo;
  auto empty = repo.load();
  ASSERT_TRUE(empty);
  EXPECT_TRUE(empty->instances.empty());

  ASSERT_TRUE(repo.save(sample_state()));
  EXPECT_EQ(repo.save_count(), 1u);
  auto loaded = repo.load();
  ASSERT_TRUE(loaded);
  EXPECT_EQ(loaded->instances.size(), 2u);
}

TEST(StateFileLockTest, AcquireCreatesAndReleasesLockFile) {
  TempPath path("state_lock");
  const auto lock_path = path.str() + ".lock";
  {
    auto lock = StateFileLock::acquire(path.str());
    ASSERT_TRUE(lock) << lock.error().message();
    EXPECT_TRUE(lock->owns());
    EXPECT_EQ(lock->path(), lock_path);
    EXPECT_TRUE(std::filesystem::exists(lock_path));

    StateFileLock moved = std::move(*lock);
    EXPECT_TRUE(moved.owns());
    EXPECT_FALSE(lock->owns());
  }
  EXPECT_FALSE(std::filesystem::exists(lock_path));
}

TEST(StateFileLockTest, EmptyPathIsInvalid) {
  auto lock = StateFileLock::acquire("");
  ASSERT_FALSE(lock);
  EXPECT_EQ(lock.error(), make_error_code(Error::InvalidArgument));
}
