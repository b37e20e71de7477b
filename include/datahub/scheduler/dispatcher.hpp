#pragma once

#include "datahub/executor/backend.hpp"
#include "datahub/scheduler/instance_store.hpp"

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace datahub {

using QueueLimits = std::map<std::string, int>;

struct QueueStats {
  std::string name;
  int concurrency{0};
  std::size_t ready{0};
  std::size_t running{0};
};

struct DispatchStats {
  std::size_t submitted{0};
  std::size_t virtual_completed{0};
  std::size_t rejected{0};
  std::size_t resubmitted{0};
  std::size_t lost{0};
};

// Per-queue admission. Ready instances wait in an ordered set keyed by
// (priority, created_at, sequence); a queue hands out entries while its
// running count is below its concurrency limit.
class Dispatcher {
public:
  using TerminalCallback =
      std::move_only_function<void(Instance &, TimePoint)>;

  Dispatcher(InstanceStore &store, IExecutionBackend &backend,
             QueueLimits limits, int default_concurrency);

  auto set_on_terminal(TerminalCallback cb) -> void {
    on_terminal_ = std::move(cb);
  }

  auto enqueue(const Instance &instance) -> void;
  auto remove(const InstanceId &id) -> bool;
  // Drops the instance from its queue's ready set and running set.
  auto on_finished(const Instance &instance) -> void;

  auto dispatch(TimePoint now) -> DispatchStats;

  // Rebuilds ready sets and occupancy from the store after a restore.
  // Restored Running instances are handed to the backend again on the next
  // dispatch; one the backend cannot take back fails as ExecutionFailure.
  auto rebuild() -> void;

  // Ordered by queue name.
  [[nodiscard]] auto queue_stats() const -> std::vector<QueueStats>;

private:
  struct ReadyKey {
    int priority{0};
    TimePoint created_at{};
    std::uint64_t sequence{0};
    InstanceId id;

    auto operator<=>(const ReadyKey &) const = default;
  };

  struct QueueState {
    int concurrency{1};
    std::set<ReadyKey> ready;
    ankerl::unordered_dense::set<InstanceId> running;

    [[nodiscard]] auto has_capacity() const noexcept -> bool {
      return std::ssize(running) < concurrency;
    }
  };

  [[nodiscard]] static auto key_of(const Instance &instance) -> ReadyKey;
  [[nodiscard]] static auto request_of(const Instance &instance)
      -> DispatchRequest;
  auto queue_for(const std::string &name) -> QueueState &;
  auto start(Instance &instance, QueueState &queue, TimePoint now,
             DispatchStats &stats) -> void;
  auto reattach(Instance &instance, TimePoint now, DispatchStats &stats)
      -> void;

  InstanceStore &store_;
  IExecutionBackend &backend_;
  QueueLimits limits_;
  int default_concurrency_;
  std::map<std::string, QueueState> queues_;
  std::vector<InstanceId> restored_running_;
  TerminalCallback on_terminal_;
};

} // namespace datahub
