#pragma once

#include "matrixforge/core/error.hpp"
#include "matrixforge/util/log.hpp"

#include <glaze/toml.hpp>

#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>

namespace matrixforge::toml_util {

/// Whole file as text. On failure `diagnostic` names the path.
[[nodiscard]] inline auto read_file(const std::filesystem::path &path,
                                   std::string *diagnostic = nullptr)
    -> Result<std::string> {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    if (diagnostic) {
      *diagnostic = std::format("{}: cannot open file", path.string());
    }
    return fail(Error::FileNotFound);
  }
  return ok(std::string((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>()));
}

/// Parses TOML into the raw mirror struct T. Keys T does not declare are
/// ignored; type mismatches fail with ParseError and a glaze excerpt.
template <typename T>
[[nodiscard]] auto parse_toml(std::string_view text,
                              std::string *diagnostic = nullptr) -> Result<T> {
  T raw{};
  constexpr auto kOpts =
      glz::opts{.format = glz::TOML, .error_on_unknown_keys = false};
  if (auto ec = glz::read<kOpts>(raw, text); ec) {
    auto detail = glz::format_error(ec, text);
    log::debug("TOML parse error: {}", detail);
    if (diagnostic) {
      *diagnostic = std::move(detail);
    }
    return fail(Error::ParseError);
  }
  return ok(std::move(raw));
}

} // namespace matrixforge::toml_util
