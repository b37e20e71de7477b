#pragma once

#include "datahub/core/error.hpp"

#include <glaze/json.hpp>

#include <string>
#include <string_view>

namespace datahub {

using JsonValue = glz::generic_json<glz::num_mode::i64>;

[[nodiscard]] inline auto dump_json(const JsonValue &value) -> std::string {
  auto out = glz::write_json(value);
  return out ? *out : "null";
}

template <typename T>
[[nodiscard]] auto write_json_struct(const T &value) -> Result<std::string> {
  auto out = glz::write_json(value);
  if (!out) {
    return fail(Error::ParseError);
  }
  return ok(std::move(*out));
}

template <typename T>
[[nodiscard]] auto read_json_struct(std::string_view input,
                                    std::string *diagnostic = nullptr)
    -> Result<T> {
  T value{};
  constexpr auto kOpts =
      glz::opts{.null_terminated = false, .error_on_unknown_keys = false};
  if (auto ec = glz::read<kOpts>(value, input); ec) {
    if (diagnostic) {
      *diagnostic = glz::format_error(ec, input);
    }
    return fail(Error::ParseError);
  }
  return ok(std::move(value));
}

} // namespace datahub
