#pragma once

#include "datahub/core/error.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace datahub {

// Advisory lock on "<state file>.lock" so two trackers never share one state
// file. Released on destruction.
class StateFileLock {
public:
  StateFileLock() = default;
  ~StateFileLock();

  StateFileLock(const StateFileLock &) = delete;
  auto operator=(const StateFileLock &) -> StateFileLock & = delete;
  StateFileLock(StateFileLock &&other) noexcept;
  auto operator=(StateFileLock &&other) noexcept -> StateFileLock &;

  // Fails with Locked when another process holds the lock.
  [[nodiscard]] static auto acquire(std::string_view state_path)
      -> Result<StateFileLock>;

  [[nodiscard]] auto owns() const noexcept -> bool { return owns_; }
  [[nodiscard]] auto path() const noexcept -> const std::string & {
    return path_;
  }

private:
  StateFileLock(std::string path,
                std::unique_ptr<void, void (*)(void *)> lock) noexcept;
  auto release() noexcept -> void;

  std::string path_;
  std::unique_ptr<void, void (*)(void *)> lock_{nullptr, nullptr};
  bool owns_{false};
};

} // namespace datahub
