#pragma once

#include "datahub/catalog/task.hpp"
#include "datahub/core/error.hpp"
#include "datahub/util/id.hpp"

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace datahub {

// Tasks that are valid and not soft-deleted, in catalog order.
struct CatalogSnapshot {
  std::vector<Task> tasks;
  std::uint64_t revision{0};
};

class ITaskCatalog {
public:
  virtual ~ITaskCatalog() = default;

  [[nodiscard]] virtual auto snapshot() -> Result<CatalogSnapshot> = 0;
};

// Thread-safe catalog for embedders whose CRUD layer edits definitions
// while the tracker is running.
class InMemoryTaskCatalog : public ITaskCatalog {
public:
  InMemoryTaskCatalog() = default;
  explicit InMemoryTaskCatalog(std::vector<Task> tasks);

  [[nodiscard]] auto upsert(Task task) -> Result<void>;
  [[nodiscard]] auto remove(const TaskId &id) -> Result<void>;
  [[nodiscard]] auto set_valid(const TaskId &id, bool valid) -> Result<void>;
  [[nodiscard]] auto find(const TaskId &id) const -> std::optional<Task>;

  [[nodiscard]] auto snapshot() -> Result<CatalogSnapshot> override;

private:
  mutable std::mutex mutex_;
  std::vector<Task> tasks_;
  ankerl::unordered_dense::map<TaskId, std::size_t> index_;
  std::uint64_t revision_{0};
};

// Catalog backed by a TOML file. The file is re-read when its modification
// time changes; a broken edit keeps the last good snapshot in service.
class TomlTaskCatalog : public ITaskCatalog {
public:
  explicit TomlTaskCatalog(std::string path);

  [[nodiscard]] auto snapshot() -> Result<CatalogSnapshot> override;
  [[nodiscard]] auto path() const noexcept -> const std::string & {
    return path_;
  }

private:
  std::string path_;
  std::optional<std::filesystem::file_time_type> loaded_mtime_;
  std::optional<CatalogSnapshot> last_good_;
  std::uint64_t revision_{0};
};

} // namespace datahub
