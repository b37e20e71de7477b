#include "datahub/catalog/task_catalog.hpp"

#include "datahub/config/catalog_loader.hpp"
#include "datahub/util/log.hpp"

#include <algorithm>
#include <iterator>
#include <system_error>
#include <utility>

namespace datahub {
namespace {

[[nodiscard]] auto schedulable_only(const std::vector<Task> &tasks)
    -> std::vector<Task> {
  std::vector<Task> out;
  out.reserve(tasks.size());
  std::ranges::copy_if(tasks, std::back_inserter(out),
                       [](const Task &t) { return t.is_schedulable(); });
  return out;
}

} // namespace

InMemoryTaskCatalog::InMemoryTaskCatalog(std::vector<Task> tasks) {
  for (auto &task : tasks) {
    if (auto r = upsert(std::move(task)); !r) {
      log::warn("Ignoring invalid task definition: {}", r.error().message());
    }
  }
}

auto InMemoryTaskCatalog::upsert(Task task) -> Result<void> {
  if (auto r = validate_task(task); !r) {
    return r;
  }
  std::scoped_lock lock(mutex_);
  ++revision_;
  if (auto it = index_.find(task.id); it != index_.end()) {
    tasks_[it->second] = std::move(task);
    return ok();
  }
  index_.emplace(task.id, tasks_.size());
  tasks_.push_back(std::move(task));
  return ok();
}

auto InMemoryTaskCatalog::remove(const TaskId &id) -> Result<void> {
  std::scoped_lock lock(mutex_);
  auto it = index_.find(id);
  if (it == index_.end()) {
    return fail(Error::NotFound);
  }
  tasks_[it->second].is_remove = true;
  ++revision_;
  return ok();
}

auto InMemoryTaskCatalog::set_valid(const TaskId &id, bool valid)
    -> Result<void> {
  std::scoped_lock lock(mutex_);
  auto it = index_.find(id);
  if (it == index_.end()) {
    return fail(Error::NotFound);
  }
  tasks_[it->second].valid = valid;
  ++revision_;
  return ok();
}

auto InMemoryTaskCatalog::find(const TaskId &id) const -> std::optional<Task> {
  std::scoped_lock lock(mutex_);
  auto it = index_.find(id);
  if (it == index_.end()) {
    return std::nullopt;
  }
  return tasks_[it->second];
}

auto InMemoryTaskCatalog::snapshot() -> Result<CatalogSnapshot> {
  std::scoped_lock lock(mutex_);
  return ok(CatalogSnapshot{.tasks = schedulable_only(tasks_),
                            .revision = revision_});
}

TomlTaskCatalog::TomlTaskCatalog(std::string path) : path_(std::move(path)) {}

auto TomlTaskCatalog::snapshot() -> Result<CatalogSnapshot> {
  std::error_code ec;
  const auto mtime = std::filesystem::last_write_time(path_, ec);
  if (ec) {
    if (last_good_) {
      log::warn("Catalog file {} unavailable ({}), keeping revision {}", path_,
                ec.message(), last_good_->revision);
      return ok(*last_good_);
    }
    return fail(Error::FileNotFound);
  }

  if (last_good_ && loaded_mtime_ == mtime) {
    return ok(*last_good_);
  }

  std::string diagnostic;
  auto tasks = CatalogLoader::load_from_file(path_, &diagnostic);
  loaded_mtime_ = mtime;
  if (!tasks) {
    if (last_good_) {
      log::warn("Catalog reload of {} failed, keeping revision {}: {}", path_,
                last_good_->revision, diagnostic);
      return ok(*last_good_);
    }
    return fail(tasks.error());
  }

  ++revision_;
  last_good_ = CatalogSnapshot{.tasks = schedulable_only(*tasks),
                               .revision = revision_};
  log::info("Loaded catalog {} revision {} ({} schedulable tasks)", path_,
            revision_, last_good_->tasks.size());
  return ok(*last_good_);
}

} // namespace datahub
