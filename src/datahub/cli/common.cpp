#include "datahub/cli/commands.hpp"

#include <print>
#include <string>

namespace datahub::cli {

auto load_config_or_print(std::string_view path) -> Result<SystemConfig> {
  std::string diagnostic;
  auto config = ConfigLoader::load_from_file(path, &diagnostic);
  if (!config) {
    std::println(stderr, "Error: {}",
                 diagnostic.empty() ? config.error().message() : diagnostic);
    return fail(config.error());
  }
  ConfigLoader::resolve_paths(*config, path);
  return config;
}

} // namespace datahub::cli
