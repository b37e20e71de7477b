#pragma once

#include "datahub/core/error.hpp"
#include "datahub/util/enum.hpp"
#include "datahub/util/id.hpp"
#include "datahub/util/time.hpp"

#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace datahub {

namespace task_defaults {
inline constexpr std::string_view kQueue{"default"};
inline constexpr std::chrono::minutes kPendingTimeout{0};
inline constexpr std::chrono::minutes kRunningTimeout{0};
inline constexpr std::chrono::minutes kRetryDelay{5};
} // namespace task_defaults

enum class SchedulePeriod : std::uint8_t { Once, Hourly, Daily, Weekly, Monthly };
BOOST_DESCRIBE_ENUM(SchedulePeriod, Once, Hourly, Daily, Weekly, Monthly)
DATAHUB_DEFINE_ENUM_SERDE(SchedulePeriod, SchedulePeriod::Daily)

enum class ConditionKind : std::uint8_t {
  Success, // parent succeeded, or failed with soft_fail set
  Force,   // parent reached any terminal state
};
BOOST_DESCRIBE_ENUM(ConditionKind, Success, Force)
DATAHUB_DEFINE_ENUM_SERDE(ConditionKind, ConditionKind::Success)

// Strict parse of a catalog condition descriptor. Empty means "success".
[[nodiscard]] auto parse_condition(std::string_view text)
    -> Result<ConditionKind>;

enum class OperatorType : std::uint8_t { Sql, MapReduce, Spark };
BOOST_DESCRIBE_ENUM(OperatorType, Sql, MapReduce, Spark)
DATAHUB_DEFINE_ENUM_SERDE(OperatorType, OperatorType::Sql)

struct RealPayload {
  OperatorType op{OperatorType::Sql};
  std::int64_t mirror_id{0};
  std::string args;

  auto operator==(const RealPayload &) const -> bool = default;
};

// Join / fan-out node: succeeds as soon as it is dispatched.
struct VirtualPayload {
  auto operator==(const VirtualPayload &) const -> bool = default;
};

using TaskPayload = std::variant<RealPayload, VirtualPayload>;

// Dependency edge as stored by the catalog. `condition` is kept verbatim and
// interpreted by the dependency graph.
struct ParentEdge {
  TaskId task;
  std::string condition{"success"};

  auto operator==(const ParentEdge &) const -> bool = default;
};

struct ExecutionPolicy {
  std::string queue{task_defaults::kQueue};
  int priority{0}; // smaller is served first
  std::chrono::minutes pending_timeout{task_defaults::kPendingTimeout};
  std::chrono::minutes running_timeout{task_defaults::kRunningTimeout};
  int retries{0};
  std::chrono::minutes retry_delay{task_defaults::kRetryDelay};
  bool soft_fail{false};

  auto operator==(const ExecutionPolicy &) const -> bool = default;
};

struct Task {
  struct Builder;
  static auto builder() -> Builder;

  TaskId id;
  std::string name;
  TaskPayload payload{RealPayload{}};
  std::vector<std::int64_t> owners;
  SchedulePeriod period{SchedulePeriod::Daily};
  bool valid{true};
  bool is_remove{false};
  std::vector<ParentEdge> parents;
  ExecutionPolicy policy;
  TimePoint created_at{};
  TimePoint updated_at{};

  [[nodiscard]] auto is_virtual() const noexcept -> bool {
    return std::holds_alternative<VirtualPayload>(payload);
  }
  [[nodiscard]] auto is_schedulable() const noexcept -> bool {
    return valid && !is_remove;
  }

  auto operator==(const Task &) const -> bool = default;
};

[[nodiscard]] auto operator_name(const TaskPayload &payload)
    -> std::string_view;

// Validates the fields every consumer relies on: a usable id, a queue name
// and non-negative retry/timeout settings.
[[nodiscard]] auto validate_task(const Task &task) -> Result<void>;

struct Task::Builder {
  auto id(std::string value) -> Builder && {
    task_.id = TaskId{std::move(value)};
    return std::move(*this);
  }

  auto name(std::string value) -> Builder && {
    task_.name = std::move(value);
    return std::move(*this);
  }

  auto sql(std::string args, std::int64_t mirror_id = 0) -> Builder && {
    task_.payload = RealPayload{
        .op = OperatorType::Sql, .mirror_id = mirror_id, .args = std::move(args)};
    return std::move(*this);
  }

  auto real(OperatorType op, std::string args, std::int64_t mirror_id = 0)
      -> Builder && {
    task_.payload =
        RealPayload{.op = op, .mirror_id = mirror_id, .args = std::move(args)};
    return std::move(*this);
  }

  auto virtual_node() -> Builder && {
    task_.payload = VirtualPayload{};
    return std::move(*this);
  }

  auto period(SchedulePeriod value) -> Builder && {
    task_.period = value;
    return std::move(*this);
  }

  auto owner(std::int64_t user_id) -> Builder && {
    task_.owners.push_back(user_id);
    return std::move(*this);
  }

  auto depends_on(std::string parent, std::string condition = "success")
      -> Builder && {
    task_.parents.push_back(
        ParentEdge{.task = TaskId{std::move(parent)},
                   .condition = std::move(condition)});
    return std::move(*this);
  }

  auto queue(std::string value) -> Builder && {
    task_.policy.queue = std::move(value);
    return std::move(*this);
  }

  auto priority(int value) -> Builder && {
    task_.policy.priority = value;
    return std::move(*this);
  }

  auto pending_timeout(std::chrono::minutes value) -> Builder && {
    task_.policy.pending_timeout = value;
    return std::move(*this);
  }

  auto running_timeout(std::chrono::minutes value) -> Builder && {
    task_.policy.running_timeout = value;
    return std::move(*this);
  }

  auto retry(int retries, std::chrono::minutes delay) -> Builder && {
    task_.policy.retries = retries;
    task_.policy.retry_delay = delay;
    return std::move(*this);
  }

  auto soft_fail(bool value = true) -> Builder && {
    task_.policy.soft_fail = value;
    return std::move(*this);
  }

  auto valid(bool value) -> Builder && {
    task_.valid = value;
    return std::move(*this);
  }

  auto removed(bool value = true) -> Builder && {
    task_.is_remove = value;
    return std::move(*this);
  }

  auto created_at(TimePoint value) -> Builder && {
    task_.created_at = value;
    task_.updated_at = value;
    return std::move(*this);
  }

  [[nodiscard]] auto build() && -> Result<Task> {
    if (task_.name.empty()) {
      task_.name = task_.id.str();
    }
    if (auto r = validate_task(task_); !r) {
      return fail(r.error());
    }
    return ok(std::move(task_));
  }

  Task task_;
};

inline auto Task::builder() -> Builder { return {}; }

} // namespace datahub
