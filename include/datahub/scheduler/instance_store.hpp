#pragma once

#include "datahub/core/error.hpp"
#include "datahub/scheduler/instance.hpp"
#include "datahub/util/id.hpp"

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <deque>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace datahub {

// Owns every instance the tracker has created. Instances are appended and
// never erased; references stay valid for the lifetime of the store.
class InstanceStore {
public:
  InstanceStore() = default;
  InstanceStore(const InstanceStore &) = delete;
  auto operator=(const InstanceStore &) -> InstanceStore & = delete;

  // Assigns `sequence`. Fails with AlreadyExists when the id or the
  // (task, cycle, attempt) triple is already present.
  [[nodiscard]] auto insert(Instance instance) -> Result<Instance *>;

  [[nodiscard]] auto find(const InstanceId &id) -> Instance *;
  [[nodiscard]] auto find(const InstanceId &id) const -> const Instance *;

  // Highest attempt recorded for the task in the given cycle.
  [[nodiscard]] auto latest(const TaskId &task, const CycleId &cycle) const
      -> const Instance *;

  // Ordered by sequence.
  [[nodiscard]] auto ids_in_state(InstanceState state) const
      -> std::vector<InstanceId>;

  // Validated forward-only move. Entering Ready stamps admitted_at, Running
  // stamps started_at and a terminal state stamps finished_at.
  [[nodiscard]] auto transition(Instance &instance, InstanceState to,
                                TimePoint now,
                                FailureReason reason = FailureReason::None,
                                std::string message = {}) -> Result<void>;

  // Mutation outside transition() (links, kill stamps) must bump the version
  // so the tracker knows to persist.
  auto touch() noexcept -> void { ++version_; }
  [[nodiscard]] auto version() const noexcept -> std::uint64_t {
    return version_;
  }

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return instances_.size();
  }
  [[nodiscard]] auto all() const noexcept -> const std::deque<Instance> & {
    return instances_;
  }

  // Counts per state, indexed by the enum value.
  [[nodiscard]] auto state_counts() const -> std::vector<std::size_t>;

  [[nodiscard]] auto snapshot() const -> std::vector<Instance>;
  // Replaces the content. Sequences are reassigned in the given order.
  [[nodiscard]] auto restore(std::vector<Instance> instances) -> Result<void>;

  // Runs `fn` for each instance in `state`, snapshotting ids first so `fn`
  // may change states freely. An exception thrown for one instance is logged
  // and does not stop the others.
  auto for_each_in_state(InstanceState state, std::string_view stage,
                         const std::function<void(Instance &)> &fn) -> void;

private:
  [[nodiscard]] static auto lineage_key(const TaskId &task,
                                        const CycleId &cycle) -> std::string;

  std::deque<Instance> instances_;
  ankerl::unordered_dense::map<InstanceId, std::size_t> by_id_;
  ankerl::unordered_dense::map<std::string, std::size_t> latest_;
  std::uint64_t version_{0};
};

} // namespace datahub
