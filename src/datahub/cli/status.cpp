#include "datahub/cli/commands.hpp"
#include "datahub/cli/formatting.hpp"
#include "datahub/storage/state_repository.hpp"
#include "datahub/util/json.hpp"
#include "datahub/util/log.hpp"

#include <format>
#include <optional>
#include <print>
#include <string>
#include <utility>
#include <vector>

namespace datahub::cli {

namespace {

auto instance_json(const Instance &inst) -> JsonValue {
  return JsonValue{
      {"id", inst.id.str()},
      {"task", inst.task_id.str()},
      {"cycle", inst.cycle_id.str()},
      {"attempt", static_cast<std::int64_t>(inst.attempt)},
      {"state", enum_to_string(inst.state)},
      {"reason", enum_to_string(inst.reason)},
      {"message", inst.message},
      {"created_at", util::format_iso8601(inst.created_at)},
      {"started_at", util::format_iso8601(inst.started_at)},
      {"finished_at", util::format_iso8601(inst.finished_at)},
  };
}

} // namespace

auto cmd_status(const StatusOptions &opts) -> int {
  log::set_output_stderr();

  std::string state_file;
  if (opts.state_file.has_value()) {
    state_file = *opts.state_file;
  } else {
    if (opts.config_file.empty()) {
      std::println(stderr, "Error: --config or --state-file is required");
      return 1;
    }
    auto config_res = load_config_or_print(opts.config_file);
    if (!config_res) {
      return 1;
    }
    state_file = config_res->tracker.state_file;
  }
  if (state_file.empty()) {
    std::println(stderr, "Error: no state_file configured (use --state-file)");
    return 1;
  }

  std::optional<InstanceState> filter;
  if (!opts.state.empty()) {
    filter = util::try_parse_enum<InstanceState>(opts.state);
    if (!filter) {
      std::println(stderr, "Error: unknown state '{}'", opts.state);
      return 1;
    }
  }

  JsonFileStateRepository repo(state_file);
  auto loaded = repo.load();
  if (!loaded) {
    std::println(stderr, "Error: failed to read {}: {}", state_file,
                 loaded.error().message());
    return 1;
  }

  std::vector<const Instance *> rows;
  for (const auto &inst : loaded->instances) {
    if (filter && inst.state != *filter) {
      continue;
    }
    if (!opts.task.empty() && inst.task_id != opts.task) {
      continue;
    }
    rows.push_back(&inst);
  }

  if (opts.json) {
    JsonValue arr = std::vector<JsonValue>{};
    for (const auto *inst : rows) {
      arr.get_array().emplace_back(instance_json(*inst));
    }
    JsonValue output{
        {"state_file", state_file},
        {"saved_at", util::format_iso8601(loaded->saved_at)},
        {"instances", std::move(arr)},
    };
    std::println("{}", dump_json(output));
    return 0;
  }

  if (rows.empty()) {
    std::println("No instances found.");
    return 0;
  }

  fmt::Table table({{"INSTANCE", 44},
                    {"STATE", 10},
                    {"REASON", 18},
                    {"STARTED", 19},
                    {"DURATION", 9, true}});
  table.print_header();
  for (const auto *inst : rows) {
    table.print_row({inst->id.str(), fmt::colorize_instance_state(inst->state),
                     inst->reason == FailureReason::None
                         ? std::string("-")
                         : enum_to_string(inst->reason),
                     fmt::format_timestamp(inst->started_at),
                     fmt::format_duration(inst->started_at, inst->finished_at)});
  }

  std::vector<std::size_t> counts(
      std::to_underlying(InstanceState::Skipped) + 1, 0);
  for (const auto *inst : rows) {
    ++counts[std::to_underlying(inst->state)];
  }
  std::string summary;
  for (std::size_t i = 0; i < counts.size(); ++i) {
    if (counts[i] == 0) {
      continue;
    }
    if (!summary.empty()) {
      summary += ", ";
    }
    summary += std::format("{} {}", counts[i],
                           to_string_view(static_cast<InstanceState>(i)));
  }
  std::println("\n{} instance(s): {}", rows.size(), summary);
  return 0;
}

} // namespace datahub::cli
