#pragma once

#include "datahub/core/error.hpp"
#include "datahub/dag/dependency_graph.hpp"
#include "datahub/scheduler/instance.hpp"

#include <cstdio>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace datahub {

class IAuditSink {
public:
  virtual ~IAuditSink() = default;

  virtual auto on_instance_terminal(const Instance &instance) -> void = 0;
  virtual auto on_integrity_issue(const IntegrityIssue &issue) -> void = 0;
};

class LogAuditSink final : public IAuditSink {
public:
  auto on_instance_terminal(const Instance &instance) -> void override;
  auto on_integrity_issue(const IntegrityIssue &issue) -> void override;
};

// Appends one JSON object per line.
class JsonLinesAuditSink final : public IAuditSink {
public:
  [[nodiscard]] static auto open(const std::string &path)
      -> Result<std::unique_ptr<JsonLinesAuditSink>>;

  ~JsonLinesAuditSink() override;
  JsonLinesAuditSink(const JsonLinesAuditSink &) = delete;
  auto operator=(const JsonLinesAuditSink &) -> JsonLinesAuditSink & = delete;

  auto on_instance_terminal(const Instance &instance) -> void override;
  auto on_integrity_issue(const IntegrityIssue &issue) -> void override;

private:
  explicit JsonLinesAuditSink(std::FILE *file) : file_(file) {}
  auto write_line(const std::string &line) -> void;

  std::mutex mu_;
  std::FILE *file_{nullptr};
};

class CompositeAuditSink final : public IAuditSink {
public:
  auto add(std::unique_ptr<IAuditSink> sink) -> void {
    sinks_.push_back(std::move(sink));
  }
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return sinks_.size();
  }

  auto on_instance_terminal(const Instance &instance) -> void override;
  auto on_integrity_issue(const IntegrityIssue &issue) -> void override;

private:
  std::vector<std::unique_ptr<IAuditSink>> sinks_;
};

// Serialized forms, shared with the CLI's --json output.
struct InstanceAuditRecord {
  std::string event{"instance_terminal"};
  std::string instance_id;
  std::string task_id;
  std::string cycle_id;
  int attempt{0};
  std::string state;
  std::string reason;
  std::string message;
  std::string created_at;
  std::string started_at;
  std::string finished_at;
};

struct IntegrityAuditRecord {
  std::string event{"integrity_issue"};
  std::string task_id;
  std::string code;
  std::string detail;
};

[[nodiscard]] auto to_audit_record(const Instance &instance)
    -> InstanceAuditRecord;
[[nodiscard]] auto to_audit_record(const IntegrityIssue &issue)
    -> IntegrityAuditRecord;

} // namespace datahub
