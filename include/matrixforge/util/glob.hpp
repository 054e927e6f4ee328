#pragma once

#include "matrixforge/core/error.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace matrixforge::util {

/// Ant-style path pattern match: `**` spans directories, `*` and `?` stay
/// within one path segment. Paths use '/' separators.
[[nodiscard]] auto glob_match(std::string_view pattern, std::string_view path)
    -> bool;

/// Splits "a/**, b/*.txt" on commas and whitespace.
[[nodiscard]] auto split_patterns(std::string_view list)
    -> std::vector<std::string>;

[[nodiscard]] auto matches_any(const std::vector<std::string> &patterns,
                               std::string_view path) -> bool;

/// Copies every regular file under `from` whose relative path matches
/// `includes` and none of `excludes` to the same relative path under `to`.
/// Returns the copied relative paths. A directory excluded as `<dir>/**` is
/// not descended into.
[[nodiscard]] auto copy_matching(const std::filesystem::path &from,
                                 const std::filesystem::path &to,
                                 const std::vector<std::string> &includes,
                                 const std::vector<std::string> &excludes)
    -> Result<std::vector<std::string>>;

} // namespace matrixforge::util
