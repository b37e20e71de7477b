#include "datahub/scheduler/lifecycle_monitor.hpp"
#include "datahub/util/log.hpp"

#include <format>

namespace datahub {

auto LifecycleMonitor::check_pending_timeouts(TimePoint now,
                                              MonitorStats &stats) -> void {
  store_.for_each_in_state(
      InstanceState::Ready, "pending timeout check", [&](Instance &inst) {
        const auto limit = inst.policy.pending_timeout;
        if (limit.count() <= 0 || !inst.admitted_at) {
          return;
        }
        if (now - *inst.admitted_at < limit) {
          return;
        }
        auto message =
            std::format("pending timeout after {} min", limit.count());
        if (!store_.transition(inst, InstanceState::Failed, now,
                               FailureReason::PendingTimeout,
                               std::move(message))) {
          return;
        }
        ++stats.pending_timeouts;
        log::warn("{} failed: {}", inst.id, inst.message);
        if (on_terminal_) {
          on_terminal_(inst, now);
        }
      });
}

auto LifecycleMonitor::complete_kill(Instance &instance, TimePoint now)
    -> bool {
  auto message = std::format(
      "running timeout after {} min", instance.policy.running_timeout.count());
  if (!store_.transition(instance, InstanceState::Killed, now,
                         FailureReason::ExecutionTimeout, std::move(message))) {
    return false;
  }
  log::warn("{} killed: {}", instance.id, instance.message);
  if (on_terminal_) {
    on_terminal_(instance, now);
  }
  return true;
}

auto LifecycleMonitor::check_running_timeouts(TimePoint now,
                                              MonitorStats &stats) -> void {
  store_.for_each_in_state(
      InstanceState::Running, "running timeout check", [&](Instance &inst) {
        if (inst.kill_requested_at) {
          if (now - *inst.kill_requested_at >= kill_grace_ &&
              complete_kill(inst, now)) {
            ++stats.killed;
          }
          return;
        }

        const auto limit = inst.policy.running_timeout;
        if (limit.count() <= 0 || !inst.started_at) {
          return;
        }
        if (now - *inst.started_at < limit) {
          return;
        }
        log::warn("{} exceeded running timeout of {} min, requesting kill",
                  inst.id, limit.count());
        inst.kill_requested_at = now;
        store_.touch();
        ++stats.kills_requested;
        backend_.kill(inst.id);

        if (kill_grace_.count() <= 0 && complete_kill(inst, now)) {
          ++stats.killed;
        }
      });
}

auto LifecycleMonitor::promote_due_retries(TimePoint now, MonitorStats &stats)
    -> void {
  store_.for_each_in_state(
      InstanceState::Pending, "retry promotion", [&](Instance &inst) {
        if (inst.not_before && now < *inst.not_before) {
          return;
        }
        if (auto r = factory_.activate(inst, now); !r) {
          log::error("Failed to activate retry {}: {}", inst.id,
                     r.error().message());
          return;
        }
        ++stats.retries_promoted;
        log::info("Retry {} is now waiting on its parents", inst.id);
        if (on_activated_) {
          on_activated_(inst, now);
        }
      });
}

auto LifecycleMonitor::schedule_retry(const Instance &failed, TimePoint now)
    -> bool {
  if (!is_failure(failed.state) || failed.attempt > failed.policy.retries) {
    return false;
  }
  auto retry = factory_.create_retry(failed, now);
  if (!retry) {
    log::error("Failed to schedule retry for {}: {}", failed.id,
               retry.error().message());
    return false;
  }
  return true;
}

} // namespace datahub
