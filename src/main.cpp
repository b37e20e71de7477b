#include "datahub/cli/commands.hpp"
#include "datahub/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <string>

namespace {
auto default_config() -> std::string {
  if (const char *env = std::getenv("DATAHUB_CONFIG"); env && *env) {
    return env;
  }
  return {};
}

auto add_config_option(CLI::App *cmd, std::string &target,
                       const std::string &env_config) -> CLI::Option * {
  target = env_config;
  auto *opt = cmd->add_option("-c,--config", target, "System config file")
                  ->check(CLI::ExistingFile);
  if (env_config.empty()) {
    opt->required();
  }
  return opt;
}
} // namespace

int main(int argc, char *argv[]) {
  // Keep non-serve CLI output clean by default.
  datahub::log::set_output_stderr();
  datahub::log::set_level(datahub::log::Level::Warn);

  CLI::App app{"DataHub job tracker", "datahub"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  datahub serve -c datahub.toml\n"
             "  datahub validate -c datahub.toml\n"
             "  datahub plan -c datahub.toml --at 2024-05-01T00:00:00Z\n"
             "\nTip: Set DATAHUB_CONFIG=datahub.toml to skip -c on every "
             "command.");

  const std::string env_config = default_config();

  datahub::cli::ServeOptions serve_opts;
  auto *serve = app.add_subcommand("serve", "Run the job tracker");
  add_config_option(serve, serve_opts.config_file, env_config);
  serve->add_option("--log-file", serve_opts.log_file, "Log file path");
  serve->add_option("--log-level", serve_opts.log_level,
                    "Log level override: trace|debug|info|warn|error");
  serve->add_flag("--once", serve_opts.once, "Run a single tick and exit");
  serve->callback(
      [&serve_opts]() { std::exit(datahub::cli::cmd_serve(serve_opts)); });

  datahub::cli::ValidateOptions validate_opts;
  auto *validate =
      app.add_subcommand("validate", "Check the task catalog for problems");
  auto *validate_cfg =
      add_config_option(validate, validate_opts.config_file, env_config);
  auto *validate_catalog =
      validate
          ->add_option("--catalog", validate_opts.catalog,
                       "Catalog file to check instead of the configured one")
          ->check(CLI::ExistingFile);
  if (env_config.empty()) {
    // Either source is enough.
    validate_cfg->required(false);
    validate_cfg->excludes(validate_catalog);
  }
  validate->add_flag("--json", validate_opts.json, "Output JSON");
  validate->callback([&validate_opts]() {
    std::exit(datahub::cli::cmd_validate(validate_opts));
  });

  datahub::cli::PlanOptions plan_opts;
  auto *plan = app.add_subcommand(
      "plan", "List schedulable tasks and the cycle they would fire for");
  add_config_option(plan, plan_opts.config_file, env_config);
  plan->add_option("--at", plan_opts.at,
                   "Evaluation time in ISO-8601 (default: now)");
  plan->add_flag("--json", plan_opts.json, "Output JSON");
  plan->callback(
      [&plan_opts]() { std::exit(datahub::cli::cmd_plan(plan_opts)); });

  datahub::cli::StatusOptions status_opts;
  auto *status =
      app.add_subcommand("status", "Show instances from the state file");
  auto *status_cfg =
      add_config_option(status, status_opts.config_file, env_config);
  auto *status_state_file = status->add_option(
      "--state-file", status_opts.state_file, "State file to read");
  if (env_config.empty()) {
    status_cfg->required(false);
    status_cfg->excludes(status_state_file);
  }
  status->add_option("--state", status_opts.state,
                     "Only show instances in this state");
  status->add_option("--task", status_opts.task,
                     "Only show instances of this task");
  status->add_flag("--json", status_opts.json, "Output JSON");
  status->callback([&status_opts]() {
    std::exit(datahub::cli::cmd_status(status_opts));
  });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
