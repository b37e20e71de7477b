#pragma once

#include "datahub/catalog/task.hpp"
#include "datahub/core/error.hpp"
#include "datahub/util/enum.hpp"
#include "datahub/util/id.hpp"
#include "datahub/util/time.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace datahub {

struct DispatchRequest {
  InstanceId instance_id;
  TaskId task_id;
  CycleId cycle_id;
  int attempt{1};
  OperatorType op{OperatorType::Sql};
  std::int64_t mirror_id{0};
  std::string args;
  std::string queue;
};

enum class ExecutionOutcome : std::uint8_t { Success, Failure };
BOOST_DESCRIBE_ENUM(ExecutionOutcome, Success, Failure)
DATAHUB_DEFINE_ENUM_SERDE(ExecutionOutcome, ExecutionOutcome::Failure)

struct ExecutionReport {
  InstanceId instance_id;
  TaskId task_id;
  CycleId cycle_id;
  int attempt{1};
  ExecutionOutcome outcome{ExecutionOutcome::Failure};
  TimePoint started_at{};
  TimePoint finished_at{};
  std::string message;
};

// Reports may arrive from any thread; the tracker drains them at the start of
// each tick.
class CompletionQueue {
public:
  auto push(ExecutionReport report) -> void {
    std::lock_guard lock(mu_);
    reports_.push_back(std::move(report));
  }

  [[nodiscard]] auto drain() -> std::vector<ExecutionReport> {
    std::lock_guard lock(mu_);
    std::vector<ExecutionReport> out;
    out.swap(reports_);
    return out;
  }

  [[nodiscard]] auto size() const -> std::size_t {
    std::lock_guard lock(mu_);
    return reports_.size();
  }

private:
  mutable std::mutex mu_;
  std::vector<ExecutionReport> reports_;
};

class IExecutionBackend {
public:
  virtual ~IExecutionBackend() = default;

  // Accepting a request means the backend will eventually push exactly one
  // report for it.
  [[nodiscard]] virtual auto submit(const DispatchRequest &request)
      -> Result<void> = 0;

  // Best effort. The backend may still report the original outcome.
  virtual auto kill(const InstanceId &instance_id) -> void = 0;
};

// Accepts every submission and reports success after `simulated_duration`
// on `io`. A kill before then reports failure instead.
[[nodiscard]] auto create_dry_run_backend(
    boost::asio::io_context &io, CompletionQueue &completions,
    std::chrono::milliseconds simulated_duration)
    -> std::unique_ptr<IExecutionBackend>;

} // namespace datahub
