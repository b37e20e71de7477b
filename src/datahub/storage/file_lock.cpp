#include "datahub/storage/file_lock.hpp"
#include "datahub/util/log.hpp"

#include <boost/filesystem.hpp>
#include <boost/interprocess/exceptions.hpp>
#include <boost/interprocess/sync/file_lock.hpp>

#include <fstream>
#include <utility>

namespace datahub {

namespace {
auto delete_file_lock(void *ptr) -> void {
  delete static_cast<boost::interprocess::file_lock *>(ptr);
}
} // namespace

StateFileLock::StateFileLock(
    std::string path, std::unique_ptr<void, void (*)(void *)> lock) noexcept
    : path_(std::move(path)), lock_(std::move(lock)), owns_(true) {}

StateFileLock::~StateFileLock() { release(); }

StateFileLock::StateFileLock(StateFileLock &&other) noexcept
    : path_(std::move(other.path_)), lock_(std::move(other.lock_)),
      owns_(other.owns_) {
  other.owns_ = false;
}

auto StateFileLock::operator=(StateFileLock &&other) noexcept
    -> StateFileLock & {
  if (this == &other) {
    return *this;
  }
  release();
  path_ = std::move(other.path_);
  lock_ = std::move(other.lock_);
  owns_ = other.owns_;
  other.owns_ = false;
  return *this;
}

auto StateFileLock::acquire(std::string_view state_path)
    -> Result<StateFileLock> {
  if (state_path.empty()) {
    return fail(Error::InvalidArgument);
  }
  auto path = std::string(state_path) + ".lock";

  boost::system::error_code ec;
  const auto parent = boost::filesystem::path(path).parent_path();
  if (!parent.empty()) {
    boost::filesystem::create_directories(parent, ec);
    if (ec) {
      return fail(std::error_code(ec.value(), std::system_category()));
    }
  }
  {
    std::ofstream touch(path, std::ios::app);
    if (!touch.is_open()) {
      return fail(Error::FileOpenFailed);
    }
  }

  try {
    auto *raw_lock = new boost::interprocess::file_lock(path.c_str());
    std::unique_ptr<void, void (*)(void *)> lock(raw_lock, delete_file_lock);
    if (!raw_lock->try_lock()) {
      return fail(Error::Locked);
    }
    return ok(StateFileLock(std::move(path), std::move(lock)));
  } catch (const boost::interprocess::interprocess_exception &e) {
    log::error("Cannot lock {}: {}", path, e.what());
    return fail(Error::FileOpenFailed);
  }
}

auto StateFileLock::release() noexcept -> void {
  if (!owns_) {
    return;
  }
  owns_ = false;
  if (lock_) {
    static_cast<boost::interprocess::file_lock *>(lock_.get())->unlock();
  }
  lock_.reset();

  boost::system::error_code ec;
  boost::filesystem::remove(boost::filesystem::path(path_), ec);
}

} // namespace datahub
