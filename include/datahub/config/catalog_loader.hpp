#pragma once

#include "datahub/catalog/task.hpp"
#include "datahub/core/error.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace datahub {

/// Values applied to every [[tasks]] entry that does not set them itself.
struct CatalogDefaults {
  std::string queue{task_defaults::kQueue};
  int priority{0};
  std::chrono::minutes pending_timeout{task_defaults::kPendingTimeout};
  std::chrono::minutes running_timeout{task_defaults::kRunningTimeout};
  int retries{0};
  std::chrono::minutes retry_delay{task_defaults::kRetryDelay};
  SchedulePeriod period{SchedulePeriod::Daily};
};

/// Reads a TOML task catalog. Structural problems (missing ids, unknown
/// operators or periods, duplicate ids) fail the whole file. Graph problems
/// such as dangling parents or cycles are left to DependencyGraph, which
/// reports them per task without rejecting the rest of the catalog.
class CatalogLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path,
                                           std::string *diagnostic = nullptr)
      -> Result<std::vector<Task>>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str,
                                             std::string *diagnostic = nullptr)
      -> Result<std::vector<Task>>;
};

} // namespace datahub
