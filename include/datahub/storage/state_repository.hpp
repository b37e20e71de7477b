#pragma once

#include "datahub/core/error.hpp"
#include "datahub/scheduler/instance.hpp"
#include "datahub/scheduler/period_trigger.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace datahub {

// Everything needed to resume after a restart: the instance archive and the
// last fired cycle of every task.
struct TrackerState {
  std::vector<Instance> instances;
  std::vector<TriggerMark> marks;
  TimePoint saved_at{};
};

class IStateRepository {
public:
  virtual ~IStateRepository() = default;

  [[nodiscard]] virtual auto load() -> Result<TrackerState> = 0;
  [[nodiscard]] virtual auto save(const TrackerState &state)
      -> Result<void> = 0;
};

// State file in JSON. A missing file loads as an empty state. Saves go to a
// sibling temp file which is then renamed over the target.
class JsonFileStateRepository final : public IStateRepository {
public:
  explicit JsonFileStateRepository(std::string path) : path_(std::move(path)) {}

  [[nodiscard]] auto load() -> Result<TrackerState> override;
  [[nodiscard]] auto save(const TrackerState &state) -> Result<void> override;

  [[nodiscard]] auto path() const noexcept -> const std::string & {
    return path_;
  }

private:
  std::string path_;
};

class MemoryStateRepository final : public IStateRepository {
public:
  [[nodiscard]] auto load() -> Result<TrackerState> override;
  [[nodiscard]] auto save(const TrackerState &state) -> Result<void> override;

  [[nodiscard]] auto save_count() const -> std::size_t;

private:
  mutable std::mutex mu_;
  std::optional<TrackerState> state_;
  std::size_t saves_{0};
};

[[nodiscard]] auto encode_state(const TrackerState &state)
    -> Result<std::string>;
[[nodiscard]] auto decode_state(std::string_view json,
                                std::string *diagnostic = nullptr)
    -> Result<TrackerState>;

} // namespace datahub
