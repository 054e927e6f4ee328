#pragma once

#include "matrixforge/core/error.hpp"
#include "matrixforge/util/hash.hpp"

#include <compare>
#include <filesystem>
#include <format>
#include <functional>
#include <initializer_list>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <vector>

namespace matrixforge {

/// Labels of a promotion's environment constraint, in declaration order.
using EnvironmentConstraint = std::vector<std::string>;

// Immutable, canonical set of component labels naming one point of the build
// matrix. Labels are kept sorted and unique, so equality and ordering follow
// the sorted label sequence.
class EnvironmentSet {
public:
  /// The default environment (no labels).
  EnvironmentSet() = default;

  /// Rejects empty labels, labels containing ',' or control characters, and
  /// the single label "default", whose canonical name is reserved.
  [[nodiscard]] static auto from_labels(std::vector<std::string> labels)
      -> Result<EnvironmentSet>;

  template <std::ranges::input_range R>
    requires std::convertible_to<std::ranges::range_reference_t<R>,
                                 std::string_view>
  [[nodiscard]] static auto from_range(R &&labels) -> Result<EnvironmentSet> {
    std::vector<std::string> copy;
    for (std::string_view label : labels) {
      copy.emplace_back(label);
    }
    return from_labels(std::move(copy));
  }

  [[nodiscard]] static auto of(std::initializer_list<std::string_view> labels)
      -> Result<EnvironmentSet> {
    return from_range(labels);
  }

  /// Inverse of canonical_name(). Only canonical (sorted, duplicate free)
  /// names are accepted; anything else is MalformedIdentifier.
  [[nodiscard]] static auto parse(std::string_view name)
      -> Result<EnvironmentSet>;

  [[nodiscard]] auto canonical_name() const -> std::string;
  [[nodiscard]] auto labels() const noexcept
      -> const std::vector<std::string> & {
    return labels_;
  }
  [[nodiscard]] auto is_default() const noexcept -> bool {
    return labels_.empty();
  }
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return labels_.size();
  }
  [[nodiscard]] auto contains(std::string_view label) const -> bool;
  [[nodiscard]] auto is_subset_of(const EnvironmentSet &other) const -> bool;

  /// True when any component appears in `constraint`. The default set has
  /// no components and matches the token "default" instead.
  [[nodiscard]] auto matches(const EnvironmentConstraint &constraint) const
      -> bool;

  /// Relative storage directory: env-<c1>/env-<c2>/..., components
  /// percent-encoded; the default set maps to "env-".
  [[nodiscard]] auto directory_key() const -> std::filesystem::path;

  friend auto operator==(const EnvironmentSet &, const EnvironmentSet &)
      -> bool = default;
  friend auto operator<=>(const EnvironmentSet &, const EnvironmentSet &)
      = default;

private:
  explicit EnvironmentSet(std::vector<std::string> sorted_labels)
      : labels_(std::move(sorted_labels)) {}

  std::vector<std::string> labels_;
};

inline constexpr std::string_view kDefaultEnvironmentName = "default";

/// Whitespace or comma separated tokens; '"', '\'' and '`' quote, '\'
/// escapes. Returns nullopt when no non-empty token is present.
[[nodiscard]] auto parse_environment_constraint(std::string_view text)
    -> std::optional<EnvironmentConstraint>;

/// Space-joined tokens, quoting those that would not survive a re-parse.
/// Returns nullopt when every token is empty.
[[nodiscard]] auto
format_environment_constraint(const EnvironmentConstraint &constraint)
    -> std::optional<std::string>;

} // namespace matrixforge

template <> struct std::hash<matrixforge::EnvironmentSet> {
  auto operator()(const matrixforge::EnvironmentSet &env) const noexcept
      -> std::size_t {
    std::size_t seed = env.size();
    for (const auto &label : env.labels()) {
      matrixforge::util::mix_into(seed, label);
    }
    return seed;
  }
};

template <>
struct std::formatter<matrixforge::EnvironmentSet>
    : std::formatter<std::string_view> {
  auto format(const matrixforge::EnvironmentSet &env, auto &ctx) const {
    return std::formatter<std::string_view>::format(env.canonical_name(), ctx);
  }
};
