#pragma once

#include "datahub/core/error.hpp"
#include "datahub/util/log.hpp"

#include <glaze/toml.hpp>

#include <fstream>
#include <iterator>
#include <string>
#include <string_view>

namespace datahub::toml_util {

[[nodiscard]] inline auto read_file(std::string_view path)
    -> Result<std::string> {
  std::ifstream in(std::string(path), std::ios::binary);
  if (!in) {
    return fail(Error::FileNotFound);
  }
  return ok(std::string((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>()));
}

/// Parse TOML text into a glaze-described struct. Unknown keys are ignored so
/// newer files still load with older binaries.
template <typename T>
[[nodiscard]] auto parse_toml(std::string_view text,
                              std::string *diagnostic = nullptr) -> Result<T> {
  T raw{};
  constexpr auto kOpts =
      glz::opts{.format = glz::TOML, .error_on_unknown_keys = false};
  if (auto ec = glz::read<kOpts>(raw, text); ec) {
    auto detail = glz::format_error(ec, text);
    log::error("TOML parse error: {}", detail);
    if (diagnostic) {
      *diagnostic = std::move(detail);
    }
    return fail(Error::ParseError);
  }
  return ok(std::move(raw));
}

} // namespace datahub::toml_util
