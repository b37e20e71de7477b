#include "datahub/config/config.hpp"
#include "datahub/config/toml_util.hpp"

#include "datahub/util/log.hpp"

#include <boost/lexical_cast.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <string>
#include <string_view>
#include <unordered_set>

namespace datahub {
namespace detail {

struct TrackerToml {
  int tick_interval_ms{1000};
  int kill_grace_period_sec{60};
  int default_queue_concurrency{4};
  std::string state_file;
};

struct LogToml {
  std::string level{"info"};
  std::string file;
};

struct CatalogToml {
  std::string path{"./catalog.toml"};
};

struct AuditToml {
  std::string file;
};

struct BackendToml {
  std::string mode{"dry_run"};
  int simulated_duration_ms{0};
};

struct QueueToml {
  std::string name;
  int concurrency{1};
};

struct SystemToml {
  TrackerToml tracker{};
  LogToml log{};
  CatalogToml catalog{};
  AuditToml audit{};
  BackendToml backend{};
  std::vector<QueueToml> queues;
};

} // namespace detail
} // namespace datahub

namespace glz {
template <> struct meta<datahub::detail::TrackerToml> {
  using T = datahub::detail::TrackerToml;
  static constexpr auto value =
      object("tick_interval_ms", &T::tick_interval_ms, "kill_grace_period_sec",
             &T::kill_grace_period_sec, "default_queue_concurrency",
             &T::default_queue_concurrency, "state_file", &T::state_file);
};

template <> struct meta<datahub::detail::LogToml> {
  using T = datahub::detail::LogToml;
  static constexpr auto value = object("level", &T::level, "file", &T::file);
};

template <> struct meta<datahub::detail::CatalogToml> {
  using T = datahub::detail::CatalogToml;
  static constexpr auto value = object("path", &T::path);
};

template <> struct meta<datahub::detail::AuditToml> {
  using T = datahub::detail::AuditToml;
  static constexpr auto value = object("file", &T::file);
};

template <> struct meta<datahub::detail::BackendToml> {
  using T = datahub::detail::BackendToml;
  static constexpr auto value = object("mode", &T::mode, "simulated_duration_ms",
                                       &T::simulated_duration_ms);
};

template <> struct meta<datahub::detail::QueueToml> {
  using T = datahub::detail::QueueToml;
  static constexpr auto value =
      object("name", &T::name, "concurrency", &T::concurrency);
};

template <> struct meta<datahub::detail::SystemToml> {
  using T = datahub::detail::SystemToml;
  static constexpr auto value =
      object("tracker", &T::tracker, "log", &T::log, "catalog", &T::catalog,
             "audit", &T::audit, "backend", &T::backend, "queues", &T::queues);
};
} // namespace glz

namespace datahub {
namespace {

auto report(std::string *diagnostic, std::string message) -> void {
  log::error("Invalid configuration: {}", message);
  if (diagnostic) {
    *diagnostic = std::move(message);
  }
}

auto apply_env_overrides(SystemConfig &cfg) -> void {
  if (const char *v = std::getenv("DATAHUB_LOG_LEVEL"); v != nullptr) {
    cfg.log.level = v;
  }
  if (const char *v = std::getenv("DATAHUB_TICK_INTERVAL_MS"); v != nullptr) {
    cfg.tracker.tick_interval_ms = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("DATAHUB_CATALOG_PATH"); v != nullptr) {
    cfg.catalog.path = v;
  }
  if (const char *v = std::getenv("DATAHUB_STATE_FILE"); v != nullptr) {
    cfg.tracker.state_file = v;
  }
  if (const char *v = std::getenv("DATAHUB_AUDIT_FILE"); v != nullptr) {
    cfg.audit.file = v;
  }
}

[[nodiscard]] auto validate(const SystemConfig &cfg, std::string *diagnostic)
    -> Result<void> {
  if (cfg.tracker.tick_interval_ms <= 0) {
    report(diagnostic, "tracker.tick_interval_ms must be positive");
    return fail(Error::InvalidArgument);
  }
  if (cfg.tracker.kill_grace_period_sec < 0) {
    report(diagnostic, "tracker.kill_grace_period_sec must not be negative");
    return fail(Error::InvalidArgument);
  }
  if (cfg.tracker.default_queue_concurrency <= 0) {
    report(diagnostic, "tracker.default_queue_concurrency must be positive");
    return fail(Error::InvalidArgument);
  }
  if (cfg.backend.simulated_duration_ms < 0) {
    report(diagnostic, "backend.simulated_duration_ms must not be negative");
    return fail(Error::InvalidArgument);
  }
  if (!log::parse_level(cfg.log.level)) {
    report(diagnostic, std::format("unknown log level '{}'", cfg.log.level));
    return fail(Error::InvalidArgument);
  }

  std::unordered_set<std::string> names;
  for (const auto &queue : cfg.queues) {
    if (queue.name.empty()) {
      report(diagnostic, "queue name cannot be empty");
      return fail(Error::InvalidArgument);
    }
    if (queue.concurrency <= 0) {
      report(diagnostic, std::format("queue '{}': concurrency must be positive",
                                     queue.name));
      return fail(Error::InvalidArgument);
    }
    if (!names.insert(queue.name).second) {
      report(diagnostic, std::format("duplicate queue '{}'", queue.name));
      return fail(Error::AlreadyExists);
    }
  }
  return ok();
}

[[nodiscard]] auto convert_toml(std::string_view toml_text,
                                std::string *diagnostic)
    -> Result<SystemConfig> {
  auto raw_result =
      toml_util::parse_toml<detail::SystemToml>(toml_text, diagnostic);
  if (!raw_result) {
    return fail(raw_result.error());
  }
  auto &raw = *raw_result;

  SystemConfig cfg{};
  cfg.tracker.tick_interval_ms = raw.tracker.tick_interval_ms;
  cfg.tracker.kill_grace_period_sec = raw.tracker.kill_grace_period_sec;
  cfg.tracker.default_queue_concurrency = raw.tracker.default_queue_concurrency;
  cfg.tracker.state_file = std::move(raw.tracker.state_file);

  cfg.log.level = std::move(raw.log.level);
  cfg.log.file = std::move(raw.log.file);
  cfg.catalog.path = std::move(raw.catalog.path);
  cfg.audit.file = std::move(raw.audit.file);

  auto mode = util::try_parse_enum<BackendMode>(raw.backend.mode);
  if (!mode) {
    report(diagnostic,
           std::format("unknown backend mode '{}'", raw.backend.mode));
    return fail(Error::InvalidArgument);
  }
  cfg.backend.mode = *mode;
  cfg.backend.simulated_duration_ms = raw.backend.simulated_duration_ms;

  cfg.queues.reserve(raw.queues.size());
  for (auto &queue : raw.queues) {
    cfg.queues.push_back(
        QueueConfig{.name = std::move(queue.name),
                    .concurrency = queue.concurrency});
  }

  apply_env_overrides(cfg);

  if (auto r = validate(cfg, diagnostic); !r) {
    return fail(r.error());
  }
  return ok(std::move(cfg));
}

auto resolve_against(std::string &path, const std::filesystem::path &base)
    -> void {
  if (path.empty()) {
    return;
  }
  std::filesystem::path p{path};
  if (p.is_relative()) {
    path = (base / p).lexically_normal().string();
  }
}

} // namespace

auto ConfigLoader::load_from_file(std::string_view path,
                                  std::string *diagnostic)
    -> Result<SystemConfig> {
  auto text = toml_util::read_file(path);
  if (!text) {
    if (diagnostic) {
      *diagnostic = std::format("{}: {}", path, text.error().message());
    }
    return fail(text.error());
  }
  return load_from_string(*text, diagnostic);
}

auto ConfigLoader::load_from_string(std::string_view toml_str,
                                    std::string *diagnostic)
    -> Result<SystemConfig> {
  try {
    return convert_toml(toml_str, diagnostic);
  } catch (const boost::bad_lexical_cast &e) {
    report(diagnostic, std::format("bad environment override: {}", e.what()));
    return fail(Error::InvalidArgument);
  } catch (const std::exception &e) {
    report(diagnostic, e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::resolve_paths(SystemConfig &config,
                                 std::string_view config_path) -> void {
  std::filesystem::path cfg{std::string(config_path)};
  if (cfg.is_relative()) {
    cfg = std::filesystem::absolute(cfg);
  }
  const auto base = cfg.parent_path();
  if (base.empty()) {
    return;
  }
  resolve_against(config.catalog.path, base);
  resolve_against(config.tracker.state_file, base);
  resolve_against(config.audit.file, base);
  resolve_against(config.log.file, base);
}

} // namespace datahub
