#include "datahub/app/application.hpp"
#include "datahub/cli/commands.hpp"
#include "datahub/util/log.hpp"

#include <print>
#include <string>

namespace datahub::cli {

auto cmd_serve(const ServeOptions &opts) -> int {
  auto config_res = load_config_or_print(opts.config_file);
  if (!config_res) {
    return 1;
  }
  auto config = std::move(*config_res);

  if (opts.log_level.has_value()) {
    if (!log::parse_level(*opts.log_level)) {
      std::println(stderr, "Error: unknown log level '{}'", *opts.log_level);
      return 1;
    }
    config.log.level = *opts.log_level;
  }
  const auto log_file = opts.log_file.value_or(config.log.file);
  if (!log_file.empty() && !log::set_output_file(log_file)) {
    std::println(stderr, "Error: Failed to open log file: {}", log_file);
    return 1;
  }
  log::set_level(config.log.level);
  log::start();

  Application app(std::move(config));
  if (auto r = app.init(); !r) {
    log::error("Initialization failed: {}", r.error().message());
    log::stop();
    return 1;
  }

  if (opts.once) {
    auto stats = app.run_once();
    if (!stats) {
      log::error("Tick failed: {}", stats.error().message());
      log::stop();
      return 1;
    }
    log::info("Single tick: fired={} dispatched={} resubmitted={} virtual={} "
              "reports={}",
              stats->fired, stats->dispatch.submitted,
              stats->dispatch.resubmitted, stats->dispatch.virtual_completed,
              stats->reports_applied);
    log::stop();
    return 0;
  }

  log::info("DataHub tracker starting (catalog={})", app.config().catalog.path);
  if (auto r = app.run(); !r) {
    log::error("Tracker stopped with error: {}", r.error().message());
    log::stop();
    return 1;
  }
  log::info("DataHub tracker stopped.");
  log::stop();
  return 0;
}

} // namespace datahub::cli
