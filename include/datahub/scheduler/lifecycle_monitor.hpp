#pragma once

#include "datahub/executor/backend.hpp"
#include "datahub/scheduler/instance_factory.hpp"
#include "datahub/scheduler/instance_store.hpp"

#include <chrono>
#include <functional>

namespace datahub {

struct MonitorStats {
  std::size_t pending_timeouts{0};
  std::size_t kills_requested{0};
  std::size_t killed{0};
  std::size_t retries_promoted{0};
};

// Time-driven transitions: pending and running timeouts, kill escalation and
// retry scheduling. A timeout of zero minutes means unlimited.
class LifecycleMonitor {
public:
  using TerminalCallback =
      std::move_only_function<void(Instance &, TimePoint)>;
  using ActivatedCallback =
      std::move_only_function<void(Instance &, TimePoint)>;

  LifecycleMonitor(InstanceStore &store, InstanceFactory &factory,
                   IExecutionBackend &backend, std::chrono::seconds kill_grace)
      : store_(store), factory_(factory), backend_(backend),
        kill_grace_(kill_grace) {}

  auto set_on_terminal(TerminalCallback cb) -> void {
    on_terminal_ = std::move(cb);
  }
  // Called after a retry moved to Waiting, so it can be resolved at once.
  auto set_on_activated(ActivatedCallback cb) -> void {
    on_activated_ = std::move(cb);
  }

  auto check_pending_timeouts(TimePoint now, MonitorStats &stats) -> void;
  auto check_running_timeouts(TimePoint now, MonitorStats &stats) -> void;
  auto promote_due_retries(TimePoint now, MonitorStats &stats) -> void;

  auto run(TimePoint now) -> MonitorStats {
    MonitorStats stats;
    check_pending_timeouts(now, stats);
    check_running_timeouts(now, stats);
    promote_due_retries(now, stats);
    return stats;
  }

  // Creates the next attempt when `failed` has retries left. Returns false
  // when the failure is final.
  auto schedule_retry(const Instance &failed, TimePoint now) -> bool;

  // Final outcome of a running instance whose kill was already requested.
  auto complete_kill(Instance &instance, TimePoint now) -> bool;

private:
  InstanceStore &store_;
  InstanceFactory &factory_;
  IExecutionBackend &backend_;
  std::chrono::seconds kill_grace_;
  TerminalCallback on_terminal_;
  ActivatedCallback on_activated_;
};

} // namespace datahub
