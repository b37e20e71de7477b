#include "datahub/audit/audit_sink.hpp"
#include "datahub/util/json.hpp"
#include "datahub/util/log.hpp"

#include <exception>

namespace datahub {

auto to_audit_record(const Instance &instance) -> InstanceAuditRecord {
  return InstanceAuditRecord{
      .instance_id = instance.id.str(),
      .task_id = instance.task_id.str(),
      .cycle_id = instance.cycle_id.str(),
      .attempt = instance.attempt,
      .state = enum_to_string(instance.state),
      .reason = enum_to_string(instance.reason),
      .message = instance.message,
      .created_at = util::format_iso8601(instance.created_at),
      .started_at = util::format_iso8601(instance.started_at),
      .finished_at = util::format_iso8601(instance.finished_at),
  };
}

auto to_audit_record(const IntegrityIssue &issue) -> IntegrityAuditRecord {
  return IntegrityAuditRecord{
      .task_id = issue.task.str(),
      .code = make_error_code(issue.code).message(),
      .detail = issue.detail,
  };
}

auto LogAuditSink::on_instance_terminal(const Instance &instance) -> void {
  switch (instance.state) {
  case InstanceState::Succeeded:
    log::info("{} succeeded (attempt {})", instance.id, instance.attempt);
    break;
  case InstanceState::Skipped:
    log::info("{} skipped: {}", instance.id, to_string_view(instance.reason));
    break;
  default:
    log::warn("{} ended {} ({}): {}", instance.id,
              to_string_view(instance.state), to_string_view(instance.reason),
              instance.message);
    break;
  }
}

auto LogAuditSink::on_integrity_issue(const IntegrityIssue &issue) -> void {
  log::error("Catalog integrity: task '{}' excluded: {} ({})", issue.task,
             make_error_code(issue.code).message(), issue.detail);
}

auto JsonLinesAuditSink::open(const std::string &path)
    -> Result<std::unique_ptr<JsonLinesAuditSink>> {
  std::FILE *f = std::fopen(path.c_str(), "a");
  if (f == nullptr) {
    return fail(Error::FileOpenFailed);
  }
  return ok(std::unique_ptr<JsonLinesAuditSink>(new JsonLinesAuditSink(f)));
}

JsonLinesAuditSink::~JsonLinesAuditSink() {
  if (file_ != nullptr) {
    std::fclose(file_);
  }
}

auto JsonLinesAuditSink::write_line(const std::string &line) -> void {
  std::lock_guard lock(mu_);
  std::fwrite(line.data(), 1, line.size(), file_);
  std::fputc('\n', file_);
  std::fflush(file_);
}

auto JsonLinesAuditSink::on_instance_terminal(const Instance &instance)
    -> void {
  auto json = write_json_struct(to_audit_record(instance));
  if (!json) {
    log::error("Failed to encode audit record for {}", instance.id);
    return;
  }
  write_line(*json);
}

auto JsonLinesAuditSink::on_integrity_issue(const IntegrityIssue &issue)
    -> void {
  auto json = write_json_struct(to_audit_record(issue));
  if (!json) {
    log::error("Failed to encode integrity record for {}", issue.task);
    return;
  }
  write_line(*json);
}

auto CompositeAuditSink::on_instance_terminal(const Instance &instance)
    -> void {
  for (auto &sink : sinks_) {
    try {
      sink->on_instance_terminal(instance);
    } catch (const std::exception &e) {
      log::error("Audit sink failed for {}: {}", instance.id, e.what());
    }
  }
}

auto CompositeAuditSink::on_integrity_issue(const IntegrityIssue &issue)
    -> void {
  for (auto &sink : sinks_) {
    try {
      sink->on_integrity_issue(issue);
    } catch (const std::exception &e) {
      log::error("Audit sink failed for {}: {}", issue.task, e.what());
    }
  }
}

} // namespace datahub
