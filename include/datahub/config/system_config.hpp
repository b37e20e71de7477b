#pragma once

#include "datahub/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace datahub {

struct TrackerConfig {
  int tick_interval_ms{1000};
  int kill_grace_period_sec{60};
  int default_queue_concurrency{4};
  std::string state_file; // empty keeps state in memory only

  auto operator==(const TrackerConfig &) const -> bool = default;
};

struct LogConfig {
  std::string level{"info"};
  std::string file;

  auto operator==(const LogConfig &) const -> bool = default;
};

struct CatalogConfig {
  std::string path{"./catalog.toml"};

  auto operator==(const CatalogConfig &) const -> bool = default;
};

struct AuditConfig {
  std::string file; // JSON lines; empty means log only

  auto operator==(const AuditConfig &) const -> bool = default;
};

enum class BackendMode : std::uint8_t { DryRun };
BOOST_DESCRIBE_ENUM(BackendMode, DryRun)
DATAHUB_DEFINE_ENUM_SERDE(BackendMode, BackendMode::DryRun)

struct BackendConfig {
  BackendMode mode{BackendMode::DryRun};
  int simulated_duration_ms{0};

  auto operator==(const BackendConfig &) const -> bool = default;
};

struct QueueConfig {
  std::string name;
  int concurrency{1};

  auto operator==(const QueueConfig &) const -> bool = default;
};

struct SystemConfig {
  TrackerConfig tracker;
  LogConfig log;
  CatalogConfig catalog;
  AuditConfig audit;
  BackendConfig backend;
  std::vector<QueueConfig> queues;

  auto operator==(const SystemConfig &) const -> bool = default;
};

} // namespace datahub
