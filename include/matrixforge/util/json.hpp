#pragma once

#include "matrixforge/core/error.hpp"
#include "matrixforge/util/log.hpp"

#include <glaze/json.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace matrixforge {

// Untyped JSON, used for CLI reports.
using JsonValue = glz::generic_json<glz::num_mode::i64>;

[[nodiscard]] inline auto dump_json(const JsonValue &value) -> std::string {
  auto out = glz::write_json(value);
  return out ? *out : "null";
}

[[nodiscard]] inline auto parse_json(std::string_view input)
    -> Result<JsonValue> {
  JsonValue value{};
  constexpr auto kOpts = glz::opts{.null_terminated = false};
  if (auto ec = glz::read<kOpts>(value, input); ec) {
    return fail(Error::ParseError);
  }
  return ok(std::move(value));
}

namespace json_file {

[[nodiscard]] inline auto read_text(const std::filesystem::path &path)
    -> Result<std::string> {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return fail(Error::FileNotFound);
  }
  return ok(std::string((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>()));
}

/// Writes `<path>.tmp` and renames it over `path`, so readers see either
/// the old record or the new one. Parent directories are created.
[[nodiscard]] inline auto write_atomically(const std::filesystem::path &path,
                                           std::string_view text)
    -> Result<void> {
  namespace fs = std::filesystem;
  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);
  if (ec) {
    log::error("Cannot create {}: {}", path.parent_path().string(),
               ec.message());
    return fail(Error::IoError);
  }
  auto tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      return fail(Error::FileOpenFailed);
    }
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!out.flush()) {
      return fail(Error::IoError);
    }
  }
  fs::rename(tmp, path, ec);
  if (ec) {
    log::error("Cannot replace {}: {}", path.string(), ec.message());
    return fail(Error::IoError);
  }
  return ok();
}

template <typename T>
[[nodiscard]] auto write(const std::filesystem::path &path, const T &value)
    -> Result<void> {
  auto out = glz::write_json(value);
  if (!out) {
    return fail(Error::IoError);
  }
  return write_atomically(path, *out);
}

/// Unknown keys are ignored so older binaries can read newer records.
template <typename T>
[[nodiscard]] auto read(const std::filesystem::path &path) -> Result<T> {
  auto text = read_text(path);
  if (!text) {
    return fail(text.error());
  }
  T value{};
  constexpr auto kOpts =
      glz::opts{.null_terminated = false, .error_on_unknown_keys = false};
  if (auto ec = glz::read<kOpts>(value, *text); ec) {
    log::warn("Corrupt record {}: {}", path.string(),
              glz::format_error(ec, *text));
    return fail(Error::ParseError);
  }
  return ok(std::move(value));
}

} // namespace json_file

} // namespace matrixforge
