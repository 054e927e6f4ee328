#pragma once

#include "matrixforge/model/build_result.hpp"
#include "matrixforge/model/parameters.hpp"
#include "matrixforge/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace matrixforge {

/// Target finished with a qualifying result.
struct SelfPromotionBadge {
  BuildResult result{BuildResult::Success};

  auto operator==(const SelfPromotionBadge &) const -> bool = default;
};

/// A user approved the promotion, possibly supplying parameter values.
struct ManualApprovalBadge {
  std::string user;
  std::vector<ParameterValue> values;

  auto operator==(const ManualApprovalBadge &) const -> bool = default;
};

/// Other promotions of the same target succeeded (process, attempt number).
struct UpstreamPromotionBadge {
  std::vector<std::pair<std::string, int>> promotions;

  auto operator==(const UpstreamPromotionBadge &) const -> bool = default;
};

/// Qualification was skipped by an explicit force request.
struct ManualPromotionBadge {
  std::string user;

  auto operator==(const ManualPromotionBadge &) const -> bool = default;
};

/// Evidence produced by a registered custom condition.
struct CustomBadge {
  std::string kind;
  Parameters values;

  auto operator==(const CustomBadge &) const -> bool = default;
};

using PromotionBadge =
    std::variant<SelfPromotionBadge, ManualApprovalBadge,
                 UpstreamPromotionBadge, ManualPromotionBadge, CustomBadge>;

enum class BadgeKind : std::uint8_t {
  SelfPromotion,
  ManualApproval,
  UpstreamPromotion,
  ManualPromotion,
  Custom,
};
BOOST_DESCRIBE_ENUM(BadgeKind, SelfPromotion, ManualApproval, UpstreamPromotion,
                    ManualPromotion, Custom)
MATRIXFORGE_DEFINE_ENUM_SERDE(BadgeKind, BadgeKind::Custom)

[[nodiscard]] auto badge_kind(const PromotionBadge &badge)
    -> BadgeKind;

/// One-line description for consoles and status output.
[[nodiscard]] auto describe_badge(const PromotionBadge &badge) -> std::string;

/// Environment variables a badge exposes to the promotion command body.
auto contribute_env(const PromotionBadge &badge,
                    std::map<std::string, std::string> &env) -> void;

} // namespace matrixforge
