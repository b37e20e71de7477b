#include "datahub/config/catalog_loader.hpp"
#include "datahub/config/toml_util.hpp"

#include "datahub/util/log.hpp"

#include <glaze/toml.hpp>

#include <cstdint>
#include <format>
#include <limits>
#include <string>
#include <string_view>
#include <unordered_set>
#include <variant>

namespace datahub {
namespace detail {

inline constexpr int kUnsetInt = std::numeric_limits<int>::min();

struct ParentToml {
  std::string task;
  std::string condition{"success"};
};

struct CatalogDefaultsToml {
  std::string queue{task_defaults::kQueue};
  int priority{0};
  int pending_timeout{0};
  int running_timeout{0};
  int retries{0};
  int retry_delay{static_cast<int>(task_defaults::kRetryDelay.count())};
  std::string period{"daily"};
};

struct CatalogTaskToml {
  std::string id;
  std::string name;
  std::string operator_type;
  std::int64_t mirror_id{0};
  std::string args;
  std::string period;
  std::vector<std::int64_t> owners;
  bool valid{true};
  bool is_remove{false};
  std::string queue;
  int priority{kUnsetInt};
  int pending_timeout{kUnsetInt};
  int running_timeout{kUnsetInt};
  int retries{kUnsetInt};
  int retry_delay{kUnsetInt};
  bool soft_fail{false};
  std::string created_at;
  std::vector<std::variant<std::string, ParentToml>> parents;
};

struct CatalogFileToml {
  CatalogDefaultsToml defaults{};
  std::vector<CatalogTaskToml> tasks;
};

} // namespace detail
} // namespace datahub

namespace glz {
template <> struct meta<datahub::detail::ParentToml> {
  using T = datahub::detail::ParentToml;
  static constexpr auto value =
      object("task", &T::task, "condition", &T::condition);
};

template <> struct meta<datahub::detail::CatalogDefaultsToml> {
  using T = datahub::detail::CatalogDefaultsToml;
  static constexpr auto value =
      object("queue", &T::queue, "priority", &T::priority, "pending_timeout",
             &T::pending_timeout, "running_timeout", &T::running_timeout,
             "retries", &T::retries, "retry_delay", &T::retry_delay, "period",
             &T::period);
};

template <> struct meta<datahub::detail::CatalogTaskToml> {
  using T = datahub::detail::CatalogTaskToml;
  static constexpr auto value = object(
      "id", &T::id, "name", &T::name, "operator", &T::operator_type,
      "mirror_id", &T::mirror_id, "args", &T::args, "period", &T::period,
      "owners", &T::owners, "valid", &T::valid, "is_remove", &T::is_remove,
      "queue", &T::queue, "priority", &T::priority, "pending_timeout",
      &T::pending_timeout, "running_timeout", &T::running_timeout, "retries",
      &T::retries, "retry_delay", &T::retry_delay, "soft_fail", &T::soft_fail,
      "created_at", &T::created_at, "parents", &T::parents);
};

template <> struct meta<datahub::detail::CatalogFileToml> {
  using T = datahub::detail::CatalogFileToml;
  static constexpr auto value =
      object("defaults", &T::defaults, "tasks", &T::tasks);
};
} // namespace glz

namespace datahub {
namespace {

auto set_diagnostic(std::string *diagnostic, std::string message) -> void {
  log::error("Catalog error: {}", message);
  if (diagnostic) {
    *diagnostic = std::move(message);
  }
}

[[nodiscard]] auto parse_defaults(const detail::CatalogDefaultsToml &raw,
                                  std::string *diagnostic)
    -> Result<CatalogDefaults> {
  auto period = util::try_parse_enum<SchedulePeriod>(raw.period);
  if (!period) {
    set_diagnostic(diagnostic,
                   std::format("[defaults] unknown period '{}'", raw.period));
    return fail(Error::InvalidArgument);
  }
  return ok(CatalogDefaults{
      .queue = raw.queue.empty() ? std::string(task_defaults::kQueue)
                                 : raw.queue,
      .priority = raw.priority,
      .pending_timeout = std::chrono::minutes(raw.pending_timeout),
      .running_timeout = std::chrono::minutes(raw.running_timeout),
      .retries = raw.retries,
      .retry_delay = std::chrono::minutes(raw.retry_delay),
      .period = *period,
  });
}

[[nodiscard]] auto parse_payload(const detail::CatalogTaskToml &raw,
                                 std::string *diagnostic)
    -> Result<TaskPayload> {
  if (raw.operator_type.empty()) {
    return ok(TaskPayload{RealPayload{.op = OperatorType::Sql,
                                      .mirror_id = raw.mirror_id,
                                      .args = raw.args}});
  }
  if (util::normalize_enum_token(raw.operator_type) == "virtual") {
    return ok(TaskPayload{VirtualPayload{}});
  }
  auto op = util::try_parse_enum<OperatorType>(raw.operator_type);
  if (!op) {
    set_diagnostic(diagnostic,
                   std::format("task '{}': unknown operator '{}' (expected "
                               "sql, mapreduce, spark or virtual)",
                               raw.id, raw.operator_type));
    return fail(Error::InvalidArgument);
  }
  return ok(TaskPayload{
      RealPayload{.op = *op, .mirror_id = raw.mirror_id, .args = raw.args}});
}

[[nodiscard]] auto parse_parents(
    const std::vector<std::variant<std::string, detail::ParentToml>> &parents)
    -> std::vector<ParentEdge> {
  std::vector<ParentEdge> out;
  out.reserve(parents.size());
  for (const auto &parent : parents) {
    if (const auto *id = std::get_if<std::string>(&parent)) {
      if (!id->empty()) {
        out.push_back(ParentEdge{.task = TaskId{*id}, .condition = "success"});
      }
      continue;
    }
    const auto &p = std::get<detail::ParentToml>(parent);
    if (!p.task.empty()) {
      out.push_back(ParentEdge{.task = TaskId{p.task}, .condition = p.condition});
    }
  }
  return out;
}

[[nodiscard]] auto parse_task(const detail::CatalogTaskToml &raw,
                              const CatalogDefaults &defaults,
                              std::string *diagnostic) -> Result<Task> {
  Task task{};
  task.id = TaskId{raw.id};
  task.name = raw.name.empty() ? raw.id : raw.name;
  task.owners = raw.owners;
  task.valid = raw.valid;
  task.is_remove = raw.is_remove;

  auto payload = parse_payload(raw, diagnostic);
  if (!payload) {
    return fail(payload.error());
  }
  task.payload = std::move(*payload);

  task.period = defaults.period;
  if (!raw.period.empty()) {
    auto period = util::try_parse_enum<SchedulePeriod>(raw.period);
    if (!period) {
      set_diagnostic(diagnostic, std::format("task '{}': unknown period '{}'",
                                             raw.id, raw.period));
      return fail(Error::InvalidArgument);
    }
    task.period = *period;
  }

  auto &policy = task.policy;
  policy.queue = raw.queue.empty() ? defaults.queue : raw.queue;
  policy.priority =
      raw.priority != detail::kUnsetInt ? raw.priority : defaults.priority;
  policy.pending_timeout = raw.pending_timeout != detail::kUnsetInt
                               ? std::chrono::minutes(raw.pending_timeout)
                               : defaults.pending_timeout;
  policy.running_timeout = raw.running_timeout != detail::kUnsetInt
                               ? std::chrono::minutes(raw.running_timeout)
                               : defaults.running_timeout;
  policy.retries =
      raw.retries != detail::kUnsetInt ? raw.retries : defaults.retries;
  policy.retry_delay = raw.retry_delay != detail::kUnsetInt
                           ? std::chrono::minutes(raw.retry_delay)
                           : defaults.retry_delay;
  policy.soft_fail = raw.soft_fail;

  if (!raw.created_at.empty()) {
    auto created = util::parse_iso8601(raw.created_at);
    if (!created) {
      set_diagnostic(diagnostic,
                     std::format("task '{}': invalid created_at '{}'", raw.id,
                                 raw.created_at));
      return fail(Error::InvalidArgument);
    }
    task.created_at = *created;
    task.updated_at = *created;
  }

  task.parents = parse_parents(raw.parents);

  if (auto r = validate_task(task); !r) {
    set_diagnostic(diagnostic,
                   std::format("task '{}': invalid id, queue, retry or "
                               "timeout settings",
                               raw.id));
    return fail(r.error());
  }
  return ok(std::move(task));
}

[[nodiscard]] auto parse_catalog_text(std::string_view text,
                                      std::string *diagnostic)
    -> Result<std::vector<Task>> {
  auto raw_result =
      toml_util::parse_toml<detail::CatalogFileToml>(text, diagnostic);
  if (!raw_result) {
    return fail(raw_result.error());
  }
  auto &raw = *raw_result;

  auto defaults = parse_defaults(raw.defaults, diagnostic);
  if (!defaults) {
    return fail(defaults.error());
  }

  std::vector<Task> tasks;
  tasks.reserve(raw.tasks.size());
  std::unordered_set<std::string> seen;
  for (std::size_t i = 0; i < raw.tasks.size(); ++i) {
    const auto &task_raw = raw.tasks[i];
    if (task_raw.id.empty()) {
      set_diagnostic(diagnostic,
                     std::format("task #{} is missing required field 'id'\n"
                                 "Hint: add `id = \"task_name\"` under "
                                 "[[tasks]].",
                                 i + 1));
      return fail(Error::InvalidArgument);
    }
    if (!seen.insert(task_raw.id).second) {
      set_diagnostic(diagnostic,
                     std::format("duplicate task id '{}'", task_raw.id));
      return fail(Error::AlreadyExists);
    }
    auto task = parse_task(task_raw, *defaults, diagnostic);
    if (!task) {
      return fail(task.error());
    }
    tasks.push_back(std::move(*task));
  }
  return ok(std::move(tasks));
}

} // namespace

auto CatalogLoader::load_from_file(std::string_view path,
                                   std::string *diagnostic)
    -> Result<std::vector<Task>> {
  auto text = toml_util::read_file(path);
  if (!text) {
    if (diagnostic) {
      *diagnostic = std::format("{}: {}", path, text.error().message());
    }
    return fail(text.error());
  }
  return load_from_string(*text, diagnostic);
}

auto CatalogLoader::load_from_string(std::string_view toml_str,
                                     std::string *diagnostic)
    -> Result<std::vector<Task>> {
  try {
    return parse_catalog_text(toml_str, diagnostic);
  } catch (const std::exception &e) {
    set_diagnostic(diagnostic, e.what());
    return fail(Error::ParseError);
  }
}

} // namespace datahub
