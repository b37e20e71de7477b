#pragma once

#include <algorithm>
#include <cctype>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace datahub {

[[nodiscard]] inline auto has_control_chars(std::string_view value) noexcept
    -> bool {
  return std::any_of(value.begin(), value.end(),
                     [](unsigned char ch) { return std::iscntrl(ch) != 0; });
}

[[nodiscard]] inline auto is_valid_id_text(std::string_view value) noexcept
    -> bool {
  return !value.empty() && !has_control_chars(value);
}

struct TaskTag {};
struct CycleTag {};
struct InstanceTag {};

// Phantom-typed string identifier. Different tags do not convert into each
// other, so a cycle id can never be passed where a task id is expected.
template <typename Tag> class TypedId {
public:
  TypedId() = default;
  explicit TypedId(std::string value) : value_(std::move(value)) {}
  explicit TypedId(std::string_view value) : value_(value) {}
  explicit TypedId(const char *value) : value_(value ? value : "") {}

  [[nodiscard]] auto value() const noexcept -> std::string_view {
    return value_;
  }
  [[nodiscard]] auto str() const noexcept -> const std::string & {
    return value_;
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return value_.empty(); }

  [[nodiscard]] friend auto operator<=>(const TypedId &lhs,
                                        const TypedId &rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId &lhs, const TypedId &rhs)
      -> bool = default;

  [[nodiscard]] friend auto operator==(const TypedId &lhs,
                                       std::string_view rhs) noexcept -> bool {
    return lhs.value_ == rhs;
  }

private:
  std::string value_;
};

using TaskId = TypedId<TaskTag>;
using CycleId = TypedId<CycleTag>;
using InstanceId = TypedId<InstanceTag>;

template <typename Tag>
inline auto operator<<(std::ostream &os, const TypedId<Tag> &id)
    -> std::ostream & {
  return os << id.value();
}

} // namespace datahub

// `is_avalanching` lets ankerl::unordered_dense use this hash directly
// instead of re-hashing the string object's bytes.
template <typename Tag> struct std::hash<datahub::TypedId<Tag>> {
  using is_avalanching = void;
  auto operator()(const datahub::TypedId<Tag> &id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<datahub::TypedId<Tag>>
    : std::formatter<std::string_view> {
  auto format(const datahub::TypedId<Tag> &id, auto &ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
