#include "datahub/catalog/task_catalog.hpp"
#include "datahub/cli/commands.hpp"
#include "datahub/cli/formatting.hpp"
#include "datahub/dag/dependency_graph.hpp"
#include "datahub/scheduler/period.hpp"
#include "datahub/util/json.hpp"
#include "datahub/util/log.hpp"

#include <print>
#include <string>
#include <vector>

namespace datahub::cli {

namespace {

auto join_parents(const DependencyGraph &graph, NodeIndex idx)
    -> std::string {
  std::string out;
  for (const auto &edge : graph.parents(idx)) {
    if (!out.empty()) {
      out += ", ";
    }
    out += graph.task(edge.parent).id.str();
    if (edge.condition == ConditionKind::Force) {
      out += " (force)";
    }
  }
  return out.empty() ? "-" : out;
}

auto next_fire(const FiringCycle &cycle) -> std::string {
  auto next = next_cycle_start(cycle.period, cycle.start);
  return next ? util::format_iso8601(*next) : "-";
}

} // namespace

auto cmd_plan(const PlanOptions &opts) -> int {
  log::set_output_stderr();

  auto config_res = load_config_or_print(opts.config_file);
  if (!config_res) {
    return 1;
  }

  TimePoint at = Clock::now();
  if (!opts.at.empty()) {
    auto parsed = util::parse_iso8601(opts.at);
    if (!parsed) {
      std::println(stderr, "Error: invalid --at '{}' (expected ISO-8601)",
                   opts.at);
      return 1;
    }
    at = *parsed;
  }

  TomlTaskCatalog catalog(config_res->catalog.path);
  auto snapshot = catalog.snapshot();
  if (!snapshot) {
    std::println(stderr, "Error: failed to load catalog {}: {}",
                 config_res->catalog.path, snapshot.error().message());
    return 1;
  }
  const auto graph = DependencyGraph::build(std::move(snapshot->tasks));

  if (opts.json) {
    JsonValue arr = std::vector<JsonValue>{};
    for (const auto idx : graph.topological_order()) {
      const auto &task = graph.task(idx);
      const auto cycle = current_cycle(task.period, at);
      JsonValue parents = std::vector<JsonValue>{};
      for (const auto &edge : graph.parents(idx)) {
        parents.get_array().emplace_back(JsonValue{
            {"task", graph.task(edge.parent).id.str()},
            {"condition", enum_to_string(edge.condition)},
        });
      }
      arr.get_array().emplace_back(JsonValue{
          {"task", task.id.str()},
          {"operator", std::string(operator_name(task.payload))},
          {"period", enum_to_string(task.period)},
          {"cycle", cycle.id().str()},
          {"next", next_fire(cycle)},
          {"queue", task.policy.queue},
          {"priority", static_cast<std::int64_t>(task.policy.priority)},
          {"parents", std::move(parents)},
      });
    }
    JsonValue output{
        {"at", util::format_iso8601(at)},
        {"tasks", std::move(arr)},
        {"excluded", static_cast<std::int64_t>(graph.issues().size())},
    };
    std::println("{}", dump_json(output));
    return 0;
  }

  std::println("Plan at {} ({} schedulable task(s))\n",
               util::format_iso8601(at), graph.topological_order().size());
  fmt::Table table({{"TASK", 24},
                    {"OPERATOR", 9},
                    {"CYCLE", 32},
                    {"NEXT", 21},
                    {"QUEUE", 10},
                    {"PRIO", 5, true},
                    {"PARENTS", 30}});
  table.print_header();
  for (const auto idx : graph.topological_order()) {
    const auto &task = graph.task(idx);
    const auto cycle = current_cycle(task.period, at);
    table.print_row({task.id.str(), std::string(operator_name(task.payload)),
                     cycle.id().str(), next_fire(cycle), task.policy.queue,
                     std::to_string(task.policy.priority),
                     join_parents(graph, idx)});
  }
  if (!graph.issues().empty()) {
    std::println("\n{} integrity issue(s); run `datahub validate` for details",
                 fmt::ansi::yellow(std::to_string(graph.issues().size())));
  }
  return 0;
}

} // namespace datahub::cli
