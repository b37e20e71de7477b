#pragma once

#include "datahub/audit/audit_sink.hpp"
#include "datahub/catalog/task_catalog.hpp"
#include "datahub/config/config.hpp"
#include "datahub/core/error.hpp"
#include "datahub/executor/backend.hpp"
#include "datahub/scheduler/job_tracker.hpp"
#include "datahub/storage/file_lock.hpp"
#include "datahub/storage/state_repository.hpp"

#include <boost/asio/io_context.hpp>

#include <atomic>
#include <memory>
#include <optional>

namespace datahub {

[[nodiscard]] auto tracker_options(const SystemConfig &config)
    -> JobTracker::Options;

// Wires the configured adapters around a JobTracker and drives it from one
// io_context thread.
class Application {
public:
  explicit Application(SystemConfig config);
  ~Application();

  Application(const Application &) = delete;
  auto operator=(const Application &) -> Application & = delete;

  [[nodiscard]] auto config() const noexcept -> const SystemConfig & {
    return config_;
  }

  [[nodiscard]] auto init() -> Result<void>;

  // Blocks until SIGINT/SIGTERM or stop().
  [[nodiscard]] auto run() -> Result<void>;
  // Restores state, runs a single tick and persists.
  [[nodiscard]] auto run_once() -> Result<TickStats>;
  auto stop() noexcept -> void;

  [[nodiscard]] auto tracker() -> JobTracker & { return *tracker_; }

private:
  SystemConfig config_;
  boost::asio::io_context io_{1};
  std::atomic<bool> running_{false};

  CompletionQueue completions_;
  std::unique_ptr<ITaskCatalog> catalog_;
  std::unique_ptr<IExecutionBackend> backend_;
  CompositeAuditSink audit_;
  std::unique_ptr<IStateRepository> state_;
  std::optional<StateFileLock> state_lock_;
  std::unique_ptr<JobTracker> tracker_;
};

} // namespace datahub
