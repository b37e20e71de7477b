#include "datahub/executor/backend.hpp"
#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <boost/asio/io_context.hpp>

using namespace datahub;
using namespace datahub::test;

namespace {

auto request(std::string id) -> DispatchRequest {
  return DispatchRequest{.instance_id = InstanceId{std::move(id)},
                         .task_id = TaskId{"a"},
                         .cycle_id = CycleId{"once"},
                         .attempt = 1,
                         .queue = "default"};
}

} // namespace

TEST(DryRunBackendTest, ReportsSuccessAfterDuration) {
  boost::asio::io_context io;
  CompletionQueue completions;
  auto backend = create_dry_run_backend(io, completions, 1ms);

  ASSERT_TRUE(backend->submit(request("a:once#1")));
  EXPECT_EQ(completions.size(), 0u);
  io.run();

  auto reports = completions.drain();
  ASSERT_EQ(reports.size(), 1u);
  EXPECT_EQ(reports[0].instance_id, "a:once#1");
  EXPECT_EQ(reports[0].outcome, ExecutionOutcome::Success);
  EXPECT_EQ(reports[0].task_id, TaskId{"a"});
  EXPECT_GE(reports[0].finished_at, reports[0].started_at);
}

TEST(DryRunBackendTest, DuplicateSubmissionIsRejected) {
  boost::asio::io_context io;
  CompletionQueue completions;
  auto backend = create_dry_run_backend(io, completions, 1ms);

  ASSERT_TRUE(backend->submit(request("a:once#1")));
  auto dup = backend->submit(request("a:once#1"));
  ASSERT_FALSE(dup);
  EXPECT_EQ(dup.error(), make_error_code(Error::AlreadyExists));
  io.run();
  EXPECT_EQ(completions.size(), 1u);
}

TEST(DryRunBackendTest, KillReportsFailureOnce) {
  boost::asio::io_context io;
  CompletionQueue completions;
  auto backend = create_dry_run_backend(io, completions, 10s);

  ASSERT_TRUE(backend->submit(request("a:once#1")));
  backend->kill(InstanceId{"a:once#1"});
  backend->kill(InstanceId{"a:once#1"});
  io.run();

  auto reports = completions.drain();
  ASSERT_EQ(reports.size(), 1u);
  EXPECT_EQ(reports[0].outcome, ExecutionOutcome::Failure);
  EXPECT_EQ(reports[0].message, "killed");
}

TEST(DryRunBackendTest, KillUnknownIsNoop) {
  boost::asio::io_context io;
  CompletionQueue completions;
  auto backend = create_dry_run_backend(io, completions, 1ms);
  backend->kill(InstanceId{"nope"});
  EXPECT_EQ(completions.size(), 0u);
}
