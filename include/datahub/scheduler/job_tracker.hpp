#pragma once

#include "datahub/audit/audit_sink.hpp"
#include "datahub/catalog/task_catalog.hpp"
#include "datahub/dag/dependency_graph.hpp"
#include "datahub/executor/backend.hpp"
#include "datahub/scheduler/dependency_resolver.hpp"
#include "datahub/scheduler/dispatcher.hpp"
#include "datahub/scheduler/instance_factory.hpp"
#include "datahub/scheduler/instance_store.hpp"
#include "datahub/scheduler/lifecycle_monitor.hpp"
#include "datahub/scheduler/period_trigger.hpp"
#include "datahub/storage/state_repository.hpp"

#include <ankerl/unordered_dense.h>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace datahub {

struct TickStats {
  std::size_t new_issues{0};
  std::size_t reports_applied{0};
  std::size_t fired{0};
  std::size_t resolved{0};
  MonitorStats monitor;
  DispatchStats dispatch;
  bool persisted{false};
};

struct TrackerStats {
  std::uint64_t ticks{0};
  std::size_t tasks{0};
  std::size_t excluded_tasks{0};
  std::size_t instances{0};
  std::vector<std::size_t> by_state; // indexed by InstanceState
  std::vector<QueueStats> queues;
};

// The coordinating loop. Every tick samples the clock once and runs the
// pipeline: graph refresh, completions, triggers, dependency sweep,
// timeouts and retries, dispatch, persistence. All state is owned by the
// thread that calls tick().
class JobTracker {
public:
  struct Options {
    std::chrono::milliseconds tick_interval{1000};
    std::chrono::seconds kill_grace{60};
    int default_queue_concurrency{4};
    QueueLimits queues;
  };

  // `state` may be null for an in-memory tracker.
  JobTracker(Options options, ITaskCatalog &catalog,
             IExecutionBackend &backend, CompletionQueue &completions,
             IAuditSink &audit, IStateRepository *state = nullptr);
  ~JobTracker();

  JobTracker(const JobTracker &) = delete;
  auto operator=(const JobTracker &) -> JobTracker & = delete;

  // Loads persisted instances and trigger marks and rebuilds queue
  // occupancy. Call before the first tick.
  [[nodiscard]] auto restore() -> Result<void>;

  auto tick(TimePoint now) -> TickStats;

  // Restores state and ticks every `tick_interval` on `io` until stop().
  [[nodiscard]] auto start(boost::asio::io_context &io) -> Result<void>;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }

  // Operator intervention for an instance held in Waiting.
  [[nodiscard]] auto skip(const InstanceId &id, TimePoint now) -> Result<void>;

  [[nodiscard]] auto find(const InstanceId &id) const -> const Instance * {
    return store_.find(id);
  }
  [[nodiscard]] auto instances() const -> std::vector<Instance> {
    return store_.snapshot();
  }
  [[nodiscard]] auto latest(const TaskId &task, const CycleId &cycle) const
      -> const Instance * {
    return store_.latest(task, cycle);
  }
  [[nodiscard]] auto graph() const noexcept -> const DependencyGraph & {
    return graph_;
  }
  [[nodiscard]] auto stats() const -> TrackerStats;

  [[nodiscard]] auto persist(TimePoint now) -> Result<void>;

private:
  auto refresh_graph(TickStats &stats) -> void;
  auto apply_reports(TimePoint now, TickStats &stats) -> void;
  auto apply_report(const ExecutionReport &report, TimePoint now) -> bool;
  auto fire_due_tasks(TimePoint now, TickStats &stats) -> void;
  auto handle_terminal(Instance &instance, TimePoint now) -> void;
  auto run_loop() -> boost::asio::awaitable<void>;

  Options options_;
  ITaskCatalog &catalog_;
  IExecutionBackend &backend_;
  CompletionQueue &completions_;
  IAuditSink &audit_;
  IStateRepository *state_;

  InstanceStore store_;
  InstanceFactory factory_;
  DependencyResolver resolver_;
  Dispatcher dispatcher_;
  LifecycleMonitor monitor_;
  PeriodTrigger trigger_;

  DependencyGraph graph_;
  std::optional<std::uint64_t> graph_revision_;
  ankerl::unordered_dense::set<std::string> reported_issues_;

  std::uint64_t ticks_{0};
  std::uint64_t persisted_version_{0};
  bool marks_dirty_{false};

  std::atomic<bool> running_{false};
  std::unique_ptr<boost::asio::steady_timer> timer_;
};

} // namespace datahub
