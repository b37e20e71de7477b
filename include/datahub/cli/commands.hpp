#pragma once

#include "datahub/config/config.hpp"
#include "datahub/core/error.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace datahub::cli {

struct ServeOptions {
  std::string config_file;
  std::optional<std::string> log_file;
  std::optional<std::string> log_level;
  bool once{false};
};

struct ValidateOptions {
  std::string config_file;
  std::optional<std::string> catalog; // overrides [catalog].path
  bool json{false};
};

struct PlanOptions {
  std::string config_file;
  std::string at; // ISO-8601, empty = now
  bool json{false};
};

struct StatusOptions {
  std::string config_file;
  std::optional<std::string> state_file;
  std::string state; // optional filter, e.g. "failed"
  std::string task;  // optional filter
  bool json{false};
};

// Loads the config, prints the error to stderr on failure and resolves
// relative paths against the config file's directory.
[[nodiscard]] auto load_config_or_print(std::string_view path)
    -> Result<SystemConfig>;

[[nodiscard]] auto cmd_serve(const ServeOptions &opts) -> int;
[[nodiscard]] auto cmd_validate(const ValidateOptions &opts) -> int;
[[nodiscard]] auto cmd_plan(const PlanOptions &opts) -> int;
[[nodiscard]] auto cmd_status(const StatusOptions &opts) -> int;

} // namespace datahub::cli
