#include "datahub/cli/commands.hpp"
#include "datahub/cli/formatting.hpp"
#include "datahub/config/catalog_loader.hpp"
#include "datahub/dag/dependency_graph.hpp"
#include "datahub/util/json.hpp"
#include "datahub/util/log.hpp"

#include <algorithm>
#include <print>
#include <vector>

namespace datahub::cli {

auto cmd_validate(const ValidateOptions &opts) -> int {
  log::set_output_stderr();

  std::string catalog_path;
  if (opts.catalog.has_value()) {
    catalog_path = *opts.catalog;
  } else {
    if (opts.config_file.empty()) {
      std::println(stderr, "Error: --config or --catalog is required");
      return 1;
    }
    auto config_res = load_config_or_print(opts.config_file);
    if (!config_res) {
      return 1;
    }
    catalog_path = config_res->catalog.path;
  }

  std::string diagnostic;
  auto tasks = CatalogLoader::load_from_file(catalog_path, &diagnostic);
  if (!tasks) {
    if (opts.json) {
      JsonValue output{
          {"catalog", catalog_path},
          {"valid", false},
          {"error",
           diagnostic.empty() ? tasks.error().message() : diagnostic},
      };
      std::println("{}", dump_json(output));
    } else {
      std::println(stderr, "Error: {}",
                   diagnostic.empty() ? tasks.error().message() : diagnostic);
    }
    return 1;
  }

  const auto total = tasks->size();
  std::erase_if(*tasks, [](const Task &t) { return !t.is_schedulable(); });
  const auto graph = DependencyGraph::build(std::move(*tasks));
  const auto issues = graph.issues();

  if (opts.json) {
    JsonValue arr = std::vector<JsonValue>{};
    for (const auto &issue : issues) {
      arr.get_array().emplace_back(JsonValue{
          {"task", issue.task.str()},
          {"code", make_error_code(issue.code).message()},
          {"detail", issue.detail},
      });
    }
    JsonValue output{
        {"catalog", catalog_path},
        {"valid", issues.empty()},
        {"issues", std::move(arr)},
        {"summary",
         JsonValue{
             {"tasks", static_cast<std::int64_t>(total)},
             {"active", static_cast<std::int64_t>(graph.size())},
             {"schedulable",
              static_cast<std::int64_t>(graph.topological_order().size())},
         }},
    };
    std::println("{}", dump_json(output));
    return issues.empty() ? 0 : 1;
  }

  std::println("Validating catalog {}\n", catalog_path);
  if (issues.empty()) {
    std::println("  {} {} task(s), {} active, all schedulable",
                 fmt::ansi::green("OK"), total, graph.size());
    return 0;
  }

  fmt::Table table({{"TASK", 24}, {"PROBLEM", 28}, {"DETAIL", 40}});
  table.print_header();
  for (const auto &issue : issues) {
    table.print_row({issue.task.str(),
                     fmt::ansi::red(make_error_code(issue.code).message()),
                     issue.detail});
  }
  std::println("\n{} issue(s); {} of {} active task(s) schedulable",
               issues.size(), graph.topological_order().size(), graph.size());
  return 1;
}

} // namespace datahub::cli
