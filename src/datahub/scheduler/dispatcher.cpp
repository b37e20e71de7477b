#include "datahub/scheduler/dispatcher.hpp"
#include "datahub/util/log.hpp"

#include <exception>
#include <format>
#include <utility>
#include <variant>

namespace datahub {

Dispatcher::Dispatcher(InstanceStore &store, IExecutionBackend &backend,
                       QueueLimits limits, int default_concurrency)
    : store_(store), backend_(backend), limits_(std::move(limits)),
      default_concurrency_(default_concurrency) {
  for (const auto &[name, limit] : limits_) {
    queues_[name].concurrency = limit;
  }
}

auto Dispatcher::key_of(const Instance &instance) -> ReadyKey {
  return ReadyKey{.priority = instance.policy.priority,
                  .created_at = instance.created_at,
                  .sequence = instance.sequence,
                  .id = instance.id};
}

auto Dispatcher::request_of(const Instance &instance) -> DispatchRequest {
  const auto &payload = std::get<RealPayload>(instance.payload);
  return DispatchRequest{.instance_id = instance.id,
                         .task_id = instance.task_id,
                         .cycle_id = instance.cycle_id,
                         .attempt = instance.attempt,
                         .op = payload.op,
                         .mirror_id = payload.mirror_id,
                         .args = payload.args,
                         .queue = instance.policy.queue};
}

auto Dispatcher::queue_for(const std::string &name) -> QueueState & {
  auto it = queues_.find(name);
  if (it != queues_.end()) {
    return it->second;
  }
  log::info("Queue '{}' is not configured, using default concurrency {}",
            name, default_concurrency_);
  auto &queue = queues_[name];
  queue.concurrency = default_concurrency_;
  return queue;
}

auto Dispatcher::enqueue(const Instance &instance) -> void {
  if (instance.state != InstanceState::Ready) {
    log::warn("Refusing to enqueue {} in state {}", instance.id,
              to_string_view(instance.state));
    return;
  }
  queue_for(instance.policy.queue).ready.insert(key_of(instance));
}

auto Dispatcher::remove(const InstanceId &id) -> bool {
  const auto *inst = store_.find(id);
  if (inst == nullptr) {
    return false;
  }
  auto it = queues_.find(inst->policy.queue);
  if (it == queues_.end()) {
    return false;
  }
  return it->second.ready.erase(key_of(*inst)) > 0;
}

auto Dispatcher::on_finished(const Instance &instance) -> void {
  auto it = queues_.find(instance.policy.queue);
  if (it == queues_.end()) {
    return;
  }
  it->second.ready.erase(key_of(instance));
  it->second.running.erase(instance.id);
}

auto Dispatcher::start(Instance &instance, QueueState &queue, TimePoint now,
                       DispatchStats &stats) -> void {
  if (instance.is_virtual()) {
    if (!store_.transition(instance, InstanceState::Running, now) ||
        !store_.transition(instance, InstanceState::Succeeded, now)) {
      return;
    }
    ++stats.virtual_completed;
    log::debug("Virtual {} succeeded", instance.id);
    if (on_terminal_) {
      on_terminal_(instance, now);
    }
    return;
  }

  const auto request = request_of(instance);
  if (auto submitted = backend_.submit(request); !submitted) {
    ++stats.rejected;
    log::warn("Backend rejected {}: {}", instance.id,
              submitted.error().message());
    if (store_.transition(instance, InstanceState::Failed, now,
                          FailureReason::BackendRejected,
                          submitted.error().message()) &&
        on_terminal_) {
      on_terminal_(instance, now);
    }
    return;
  }

  if (!store_.transition(instance, InstanceState::Running, now)) {
    return;
  }
  queue.running.insert(instance.id);
  ++stats.submitted;
  log::info("Dispatched {} to queue '{}' ({}/{})", instance.id,
            instance.policy.queue, queue.running.size(), queue.concurrency);
}

auto Dispatcher::reattach(Instance &instance, TimePoint now,
                          DispatchStats &stats) -> void {
  auto submitted = backend_.submit(request_of(instance));
  if (submitted) {
    ++stats.resubmitted;
    log::info("Resubmitted restored {}", instance.id);
    return;
  }
  if (submitted.error() == make_error_code(Error::AlreadyExists)) {
    log::debug("Backend still tracks restored {}", instance.id);
    return;
  }

  ++stats.lost;
  auto message =
      std::format("lost across restart: {}", submitted.error().message());
  log::warn("{} {}", instance.id, message);
  if (store_.transition(instance, InstanceState::Failed, now,
                        FailureReason::ExecutionFailure, std::move(message)) &&
      on_terminal_) {
    on_terminal_(instance, now);
  }
}

auto Dispatcher::dispatch(TimePoint now) -> DispatchStats {
  DispatchStats stats;
  for (const auto &id : std::exchange(restored_running_, {})) {
    auto *inst = store_.find(id);
    // A requested kill is finished by the monitor, not by the backend.
    if (inst == nullptr || inst->state != InstanceState::Running ||
        inst->kill_requested_at) {
      continue;
    }
    try {
      reattach(*inst, now, stats);
    } catch (const std::exception &e) {
      log::error("Resubmit failed for {}: {}", id, e.what());
    }
  }
  // Virtual completions can make children of any queue ready, so keep
  // passing over the queues until nothing moves.
  bool progress = true;
  while (progress) {
    progress = false;
    for (auto &[name, queue] : queues_) {
      while (queue.has_capacity() && !queue.ready.empty()) {
        auto key = *queue.ready.begin();
        queue.ready.erase(queue.ready.begin());
        progress = true;

        auto *inst = store_.find(key.id);
        if (inst == nullptr || inst->state != InstanceState::Ready) {
          continue;
        }
        try {
          start(*inst, queue, now, stats);
        } catch (const std::exception &e) {
          log::error("Dispatch failed for {}: {}", key.id, e.what());
        }
      }
    }
  }
  return stats;
}

auto Dispatcher::rebuild() -> void {
  for (auto &[name, queue] : queues_) {
    queue.ready.clear();
    queue.running.clear();
  }
  restored_running_.clear();
  for (const auto &inst : store_.all()) {
    if (inst.state == InstanceState::Ready) {
      queue_for(inst.policy.queue).ready.insert(key_of(inst));
    } else if (inst.state == InstanceState::Running && !inst.is_virtual()) {
      queue_for(inst.policy.queue).running.insert(inst.id);
      restored_running_.push_back(inst.id);
    }
  }
}

auto Dispatcher::queue_stats() const -> std::vector<QueueStats> {
  std::vector<QueueStats> out;
  out.reserve(queues_.size());
  for (const auto &[name, queue] : queues_) {
    out.push_back(QueueStats{.name = name,
                             .concurrency = queue.concurrency,
                             .ready = queue.ready.size(),
                             .running = queue.running.size()});
  }
  return out;
}

} // namespace datahub
