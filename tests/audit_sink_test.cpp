#include "datahub/audit/audit_sink.hpp"
#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <fstream>
#include <stdexcept>

using namespace datahub;
using namespace datahub::test;

namespace {

auto failed_instance() -> Instance {
  const auto cycle =
      current_cycle(SchedulePeriod::Daily, at("2024-05-01T00:10"));
  return Instance{.id = make_instance_id(TaskId{"a"}, cycle.id(), 1),
                  .task_id = TaskId{"a"},
                  .cycle = cycle,
                  .cycle_id = cycle.id(),
                  .state = InstanceState::Failed,
                  .reason = FailureReason::PendingTimeout,
                  .message = "pending timeout after 30 min",
                  .created_at = at("2024-05-01T00:10"),
                  .finished_at = at("2024-05-01T00:40")};
}

auto read_lines(const std::string &path) -> std::vector<std::string> {
  std::ifstream in(path);
  std::vector<std::string> lines;
  for (std::string line; std::getline(in, line);) {
    lines.push_back(line);
  }
  return lines;
}

class ThrowingSink final : public IAuditSink {
public:
  auto on_instance_terminal(const Instance &) -> void override {
    throw std::runtime_error("sink down");
  }
  auto on_integrity_issue(const IntegrityIssue &) -> void override {
    throw std::runtime_error("sink down");
  }
};

} // namespace

TEST(AuditRecordTest, InstanceRecord) {
  auto record = to_audit_record(failed_instance());
  EXPECT_EQ(record.event, "instance_terminal");
  EXPECT_EQ(record.instance_id, "a:daily@2024-05-01T00:00:00Z#1");
  EXPECT_EQ(record.state, "failed");
  EXPECT_EQ(record.reason, "pending_timeout");
  EXPECT_EQ(record.finished_at, "2024-05-01T00:40:00Z");
  EXPECT_TRUE(record.started_at.empty());
}

TEST(AuditRecordTest, IntegrityRecord) {
  auto record = to_audit_record(IntegrityIssue{
      .task = TaskId{"b"}, .code = Error::CycleDetected, .detail = "b -> b"});
  EXPECT_EQ(record.event, "integrity_issue");
  EXPECT_EQ(record.task_id, "b");
  EXPECT_EQ(record.code, "cycle detected in task graph");
}

TEST(JsonLinesAuditSinkTest, AppendsOneObjectPerLine) {
  TempPath path("audit");
  {
    auto sink = JsonLinesAuditSink::open(path.str());
    ASSERT_TRUE(sink);
    (*sink)->on_instance_terminal(failed_instance());
    (*sink)->on_integrity_issue(IntegrityIssue{
        .task = TaskId{"x"}, .code = Error::DanglingParent, .detail = "p"});
  }
  {
    auto sink = JsonLinesAuditSink::open(path.str());
    ASSERT_TRUE(sink);
    (*sink)->on_instance_terminal(failed_instance());
  }

  auto lines = read_lines(path.str());
  ASSERT_EQ(lines.size(), 3u);
  EXPECT_NE(lines[0].find("\"event\":\"instance_terminal\""),
            std::string::npos);
  EXPECT_NE(lines[0].find("\"reason\":\"pending_timeout\""),
            std::string::npos);
  EXPECT_NE(lines[1].find("\"event\":\"integrity_issue\""), std::string::npos);
}

TEST(JsonLinesAuditSinkTest, UnwritablePathFails) {
  auto sink = JsonLinesAuditSink::open("/nonexistent/dir/audit.jsonl");
  ASSERT_FALSE(sink);
  EXPECT_EQ(sink.error(), make_error_code(Error::FileOpenFailed));
}

TEST(CompositeAuditSinkTest, OneFailingSinkDoesNotStopOthers) {
  CompositeAuditSink composite;
  composite.add(std::make_unique<ThrowingSink>());
  auto recording = std::make_unique<RecordingAuditSink>();
  auto *recorder = recording.get();
  composite.add(std::move(recording));
  EXPECT_EQ(composite.size(), 2u);

  composite.on_instance_terminal(failed_instance());
  composite.on_integrity_issue(
      IntegrityIssue{.task = TaskId{"x"}, .code = Error::ExcludedParent});
  EXPECT_EQ(recorder->terminal.size(), 1u);
  EXPECT_EQ(recorder->issues.size(), 1u);
}
