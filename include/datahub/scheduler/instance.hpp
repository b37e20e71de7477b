#pragma once

#include "datahub/catalog/task.hpp"
#include "datahub/scheduler/period.hpp"
#include "datahub/util/enum.hpp"
#include "datahub/util/id.hpp"
#include "datahub/util/time.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <vector>

namespace datahub {

enum class InstanceState : std::uint8_t {
  Pending,
  Waiting,
  Ready,
  Running,
  Succeeded,
  Failed,
  Killed,
  Skipped,
};
BOOST_DESCRIBE_ENUM(InstanceState, Pending, Waiting, Ready, Running, Succeeded,
                    Failed, Killed, Skipped)
DATAHUB_DEFINE_ENUM_SERDE(InstanceState, InstanceState::Pending)

[[nodiscard]] constexpr auto is_terminal(InstanceState s) noexcept -> bool {
  return s == InstanceState::Succeeded || s == InstanceState::Failed ||
         s == InstanceState::Killed || s == InstanceState::Skipped;
}

// Failed and Killed are the retryable outcomes.
[[nodiscard]] constexpr auto is_failure(InstanceState s) noexcept -> bool {
  return s == InstanceState::Failed || s == InstanceState::Killed;
}

// Forward-only lifecycle:
//   Pending -> Waiting -> Ready -> Running -> Succeeded | Failed | Killed
//   Waiting -> Skipped, Ready -> Failed
[[nodiscard]] constexpr auto can_transition(InstanceState from,
                                            InstanceState to) noexcept -> bool {
  switch (from) {
  case InstanceState::Pending:
    return to == InstanceState::Waiting;
  case InstanceState::Waiting:
    return to == InstanceState::Ready || to == InstanceState::Skipped;
  case InstanceState::Ready:
    return to == InstanceState::Running || to == InstanceState::Failed;
  case InstanceState::Running:
    return to == InstanceState::Succeeded || to == InstanceState::Failed ||
           to == InstanceState::Killed;
  case InstanceState::Succeeded:
  case InstanceState::Failed:
  case InstanceState::Killed:
  case InstanceState::Skipped:
    return false;
  }
  return false;
}

enum class FailureReason : std::uint8_t {
  None,
  PendingTimeout,
  ExecutionFailure,
  ExecutionTimeout,
  DependencyBlocked,
  BackendRejected,
  OperatorSkipped,
};
BOOST_DESCRIBE_ENUM(FailureReason, None, PendingTimeout, ExecutionFailure,
                    ExecutionTimeout, DependencyBlocked, BackendRejected,
                    OperatorSkipped)
DATAHUB_DEFINE_ENUM_SERDE(FailureReason, FailureReason::None)

enum class LinkStatus : std::uint8_t {
  Unresolved,    // parent instance exists but is not terminal yet
  Satisfied,     // condition met
  Blocked,       // condition can no longer be met
  Unsatisfiable, // parent has no instance for this cycle
};
BOOST_DESCRIBE_ENUM(LinkStatus, Unresolved, Satisfied, Blocked, Unsatisfiable)
DATAHUB_DEFINE_ENUM_SERDE(LinkStatus, LinkStatus::Unresolved)

struct ParentLink {
  TaskId parent;
  ConditionKind condition{ConditionKind::Success};
  LinkStatus status{LinkStatus::Unresolved};

  auto operator==(const ParentLink &) const -> bool = default;
};

// One attempt of a task for one firing cycle. Payload and policy are copied
// from the task at creation, so catalog edits never change an instance that
// already exists.
struct Instance {
  InstanceId id;
  TaskId task_id;
  FiringCycle cycle;
  CycleId cycle_id;
  int attempt{1};
  std::uint64_t sequence{0};

  InstanceState state{InstanceState::Pending};
  FailureReason reason{FailureReason::None};
  std::string message;

  TaskPayload payload{RealPayload{}};
  ExecutionPolicy policy;
  std::vector<ParentLink> parents;

  TimePoint created_at{};
  std::optional<TimePoint> not_before;
  std::optional<TimePoint> admitted_at;
  std::optional<TimePoint> started_at;
  std::optional<TimePoint> finished_at;
  std::optional<TimePoint> kill_requested_at;

  [[nodiscard]] auto is_virtual() const noexcept -> bool {
    return std::holds_alternative<VirtualPayload>(payload);
  }
  [[nodiscard]] auto terminal() const noexcept -> bool {
    return is_terminal(state);
  }

  auto operator==(const Instance &) const -> bool = default;
};

[[nodiscard]] inline auto make_instance_id(const TaskId &task,
                                           const CycleId &cycle, int attempt)
    -> InstanceId {
  return InstanceId{std::format("{}:{}#{}", task, cycle, attempt)};
}

} // namespace datahub
