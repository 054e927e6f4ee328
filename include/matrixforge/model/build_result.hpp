#pragma once

#include "matrixforge/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <span>
#include <utility>

namespace matrixforge {

// Declared in severity order; combining keeps the worst.
enum class BuildResult : std::uint8_t {
  Success,
  Unstable,
  Failure,
  NotBuilt,
  Aborted,
};
BOOST_DESCRIBE_ENUM(BuildResult, Success, Unstable, Failure, NotBuilt, Aborted)
MATRIXFORGE_DEFINE_ENUM_SERDE(BuildResult, BuildResult::Failure)

[[nodiscard]] constexpr auto combine(BuildResult a, BuildResult b) noexcept
    -> BuildResult {
  return std::to_underlying(a) >= std::to_underlying(b) ? a : b;
}

[[nodiscard]] constexpr auto is_better_or_equal(BuildResult result,
                                                BuildResult threshold) noexcept
    -> bool {
  return std::to_underlying(result) <= std::to_underlying(threshold);
}

/// Worst of `results`; a missing result counts as Aborted.
[[nodiscard]] constexpr auto
aggregate_results(std::span<const std::optional<BuildResult>> results) noexcept
    -> BuildResult {
  auto worst = BuildResult::Success;
  for (const auto &r : results) {
    worst = combine(worst, r.value_or(BuildResult::Aborted));
  }
  return worst;
}

} // namespace matrixforge
