#include "datahub/storage/state_repository.hpp"
#include "datahub/util/json.hpp"
#include "datahub/util/log.hpp"

#include <boost/filesystem.hpp>

#include <cstdint>
#include <format>
#include <fstream>
#include <iterator>
#include <string>
#include <variant>

namespace datahub {
namespace detail {

inline constexpr int kStateFormatVersion = 1;

struct ParentLinkJson {
  std::string parent;
  std::string condition;
  std::string status;
};

struct InstanceJson {
  std::string id;
  std::string task_id;
  std::string period;
  std::int64_t cycle_start{0};
  std::string cycle_id;
  int attempt{1};
  std::string state;
  std::string reason;
  std::string message;

  std::string op; // "virtual" for join nodes
  std::int64_t mirror_id{0};
  std::string args;

  std::string queue;
  int priority{0};
  std::int64_t pending_timeout_min{0};
  std::int64_t running_timeout_min{0};
  int retries{0};
  std::int64_t retry_delay_min{0};
  bool soft_fail{false};

  std::vector<ParentLinkJson> parents;

  std::int64_t created_at{0};
  std::int64_t not_before{0};
  std::int64_t admitted_at{0};
  std::int64_t started_at{0};
  std::int64_t finished_at{0};
  std::int64_t kill_requested_at{0};
};

struct TriggerMarkJson {
  std::string task;
  std::string period;
  std::int64_t cycle_start{0};
};

struct StateFileJson {
  int version{kStateFormatVersion};
  std::int64_t saved_at{0};
  std::vector<InstanceJson> instances;
  std::vector<TriggerMarkJson> marks;
};

} // namespace detail

namespace {

template <typename E>
[[nodiscard]] auto decode_enum(std::string_view field, std::string_view text,
                               std::string *diagnostic) -> Result<E> {
  auto value = util::try_parse_enum<E>(text);
  if (!value) {
    if (diagnostic) {
      *diagnostic = std::format("invalid {} '{}'", field, text);
    }
    return fail(Error::ParseError);
  }
  return ok(*value);
}

[[nodiscard]] auto encode_instance(const Instance &inst)
    -> detail::InstanceJson {
  detail::InstanceJson out{
      .id = inst.id.str(),
      .task_id = inst.task_id.str(),
      .period = enum_to_string(inst.cycle.period),
      .cycle_start = util::to_unix_millis(inst.cycle.start),
      .cycle_id = inst.cycle_id.str(),
      .attempt = inst.attempt,
      .state = enum_to_string(inst.state),
      .reason = enum_to_string(inst.reason),
      .message = inst.message,
      .queue = inst.policy.queue,
      .priority = inst.policy.priority,
      .pending_timeout_min = inst.policy.pending_timeout.count(),
      .running_timeout_min = inst.policy.running_timeout.count(),
      .retries = inst.policy.retries,
      .retry_delay_min = inst.policy.retry_delay.count(),
      .soft_fail = inst.policy.soft_fail,
      .created_at = util::to_unix_millis(inst.created_at),
      .not_before = util::to_unix_millis(inst.not_before),
      .admitted_at = util::to_unix_millis(inst.admitted_at),
      .started_at = util::to_unix_millis(inst.started_at),
      .finished_at = util::to_unix_millis(inst.finished_at),
      .kill_requested_at = util::to_unix_millis(inst.kill_requested_at),
  };

  if (const auto *real = std::get_if<RealPayload>(&inst.payload)) {
    out.op = enum_to_string(real->op);
    out.mirror_id = real->mirror_id;
    out.args = real->args;
  } else {
    out.op = "virtual";
  }

  out.parents.reserve(inst.parents.size());
  for (const auto &link : inst.parents) {
    out.parents.push_back(
        detail::ParentLinkJson{.parent = link.parent.str(),
                               .condition = enum_to_string(link.condition),
                               .status = enum_to_string(link.status)});
  }
  return out;
}

[[nodiscard]] auto decode_instance(const detail::InstanceJson &raw,
                                   std::string *diagnostic)
    -> Result<Instance> {
  auto period = decode_enum<SchedulePeriod>("period", raw.period, diagnostic);
  auto state = decode_enum<InstanceState>("state", raw.state, diagnostic);
  auto reason = decode_enum<FailureReason>("reason", raw.reason, diagnostic);
  if (!period || !state || !reason) {
    return fail(Error::ParseError);
  }
  if (!is_valid_id_text(raw.task_id) || raw.attempt < 1) {
    if (diagnostic) {
      *diagnostic = std::format("invalid instance record '{}'", raw.id);
    }
    return fail(Error::ParseError);
  }

  Instance inst{
      .id = InstanceId{raw.id},
      .task_id = TaskId{raw.task_id},
      .cycle = FiringCycle{.period = *period,
                           .start = util::from_unix_millis(raw.cycle_start)},
      .cycle_id = CycleId{raw.cycle_id},
      .attempt = raw.attempt,
      .state = *state,
      .reason = *reason,
      .message = raw.message,
      .policy =
          ExecutionPolicy{
              .queue = raw.queue,
              .priority = raw.priority,
              .pending_timeout = std::chrono::minutes(raw.pending_timeout_min),
              .running_timeout = std::chrono::minutes(raw.running_timeout_min),
              .retries = raw.retries,
              .retry_delay = std::chrono::minutes(raw.retry_delay_min),
              .soft_fail = raw.soft_fail,
          },
      .created_at = util::from_unix_millis(raw.created_at),
      .not_before = util::optional_from_unix_millis(raw.not_before),
      .admitted_at = util::optional_from_unix_millis(raw.admitted_at),
      .started_at = util::optional_from_unix_millis(raw.started_at),
      .finished_at = util::optional_from_unix_millis(raw.finished_at),
      .kill_requested_at =
          util::optional_from_unix_millis(raw.kill_requested_at),
  };
  if (inst.cycle_id.empty()) {
    inst.cycle_id = inst.cycle.id();
  }

  if (raw.op == "virtual") {
    inst.payload = VirtualPayload{};
  } else {
    auto op = decode_enum<OperatorType>("operator", raw.op, diagnostic);
    if (!op) {
      return fail(op.error());
    }
    inst.payload =
        RealPayload{.op = *op, .mirror_id = raw.mirror_id, .args = raw.args};
  }

  for (const auto &link : raw.parents) {
    auto condition =
        decode_enum<ConditionKind>("condition", link.condition, diagnostic);
    auto status = decode_enum<LinkStatus>("link status", link.status, diagnostic);
    if (!condition || !status) {
      return fail(Error::ParseError);
    }
    inst.parents.push_back(ParentLink{.parent = TaskId{link.parent},
                                      .condition = *condition,
                                      .status = *status});
  }
  return ok(std::move(inst));
}

} // namespace

auto encode_state(const TrackerState &state) -> Result<std::string> {
  detail::StateFileJson out{.saved_at = util::to_unix_millis(state.saved_at)};
  out.instances.reserve(state.instances.size());
  for (const auto &inst : state.instances) {
    out.instances.push_back(encode_instance(inst));
  }
  out.marks.reserve(state.marks.size());
  for (const auto &mark : state.marks) {
    out.marks.push_back(detail::TriggerMarkJson{
        .task = mark.task.str(),
        .period = enum_to_string(mark.cycle.period),
        .cycle_start = util::to_unix_millis(mark.cycle.start)});
  }
  return write_json_struct(out);
}

auto decode_state(std::string_view json, std::string *diagnostic)
    -> Result<TrackerState> {
  auto raw = read_json_struct<detail::StateFileJson>(json, diagnostic);
  if (!raw) {
    return fail(raw.error());
  }
  if (raw->version != detail::kStateFormatVersion) {
    if (diagnostic) {
      *diagnostic =
          std::format("unsupported state file version {}", raw->version);
    }
    return fail(Error::ParseError);
  }

  TrackerState state{.saved_at = util::from_unix_millis(raw->saved_at)};
  state.instances.reserve(raw->instances.size());
  for (const auto &inst_raw : raw->instances) {
    auto inst = decode_instance(inst_raw, diagnostic);
    if (!inst) {
      return fail(inst.error());
    }
    state.instances.push_back(std::move(*inst));
  }
  for (const auto &mark_raw : raw->marks) {
    auto period =
        decode_enum<SchedulePeriod>("period", mark_raw.period, diagnostic);
    if (!period) {
      return fail(period.error());
    }
    state.marks.push_back(TriggerMark{
        .task = TaskId{mark_raw.task},
        .cycle = FiringCycle{.period = *period,
                             .start = util::from_unix_millis(
                                 mark_raw.cycle_start)}});
  }
  return ok(std::move(state));
}

auto JsonFileStateRepository::load() -> Result<TrackerState> {
  boost::system::error_code ec;
  if (!boost::filesystem::exists(boost::filesystem::path(path_), ec)) {
    log::info("No state file at {}, starting empty", path_);
    return ok(TrackerState{});
  }

  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    return fail(Error::FileOpenFailed);
  }
  const std::string text((std::istreambuf_iterator<char>(in)),
                         std::istreambuf_iterator<char>());

  std::string diagnostic;
  auto state = decode_state(text, &diagnostic);
  if (!state) {
    log::error("Failed to load state file {}: {}", path_, diagnostic);
    return fail(state.error());
  }
  log::info("Loaded {} instance(s) and {} trigger mark(s) from {}",
            state->instances.size(), state->marks.size(), path_);
  return state;
}

auto JsonFileStateRepository::save(const TrackerState &state) -> Result<void> {
  auto json = encode_state(state);
  if (!json) {
    return fail(json.error());
  }

  const boost::filesystem::path target{path_};
  boost::system::error_code ec;
  if (const auto parent = target.parent_path(); !parent.empty()) {
    boost::filesystem::create_directories(parent, ec);
    if (ec) {
      return fail(std::error_code(ec.value(), std::system_category()));
    }
  }

  const auto tmp = path_ + ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      return fail(Error::FileOpenFailed);
    }
    out << *json;
    out.flush();
    if (!out.good()) {
      return fail(Error::FileOpenFailed);
    }
  }

  boost::filesystem::rename(boost::filesystem::path(tmp), target, ec);
  if (ec) {
    log::error("Failed to replace state file {}: {}", path_, ec.message());
    return fail(std::error_code(ec.value(), std::system_category()));
  }
  return ok();
}

auto MemoryStateRepository::load() -> Result<TrackerState> {
  std::lock_guard lock(mu_);
  return ok(state_.value_or(TrackerState{}));
}

auto MemoryStateRepository::save(const TrackerState &state) -> Result<void> {
  std::lock_guard lock(mu_);
  state_ = state;
  ++saves_;
  return ok();
}

auto MemoryStateRepository::save_count() const -> std::size_t {
  std::lock_guard lock(mu_);
  return saves_;
}

} // namespace datahub
