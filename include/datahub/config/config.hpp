#pragma once

#include "datahub/config/system_config.hpp"
#include "datahub/core/error.hpp"

#include <string>
#include <string_view>

namespace datahub {

using Config = SystemConfig;

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path,
                                           std::string *diagnostic = nullptr)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str,
                                             std::string *diagnostic = nullptr)
      -> Result<SystemConfig>;

  /// Rewrites relative catalog, state and audit paths so they are taken
  /// relative to the directory holding the config file.
  static auto resolve_paths(SystemConfig &config, std::string_view config_path)
      -> void;
};

} // namespace datahub
