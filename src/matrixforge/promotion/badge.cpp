#include "matrixforge/promotion/badge.hpp"

#include "matrixforge/executor/executor_utils.hpp"

#include <format>

namespace matrixforge {

namespace {

template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};

} // namespace

auto badge_kind(const PromotionBadge &badge) -> BadgeKind {
  return std::visit(
      overloaded{
          [](const SelfPromotionBadge &) { return BadgeKind::SelfPromotion; },
          [](const ManualApprovalBadge &) { return BadgeKind::ManualApproval; },
          [](const UpstreamPromotionBadge &) {
            return BadgeKind::UpstreamPromotion;
          },
          [](const ManualPromotionBadge &) {
            return BadgeKind::ManualPromotion;
          },
          [](const CustomBadge &) { return BadgeKind::Custom; },
      },
      badge);
}

auto describe_badge(const PromotionBadge &badge) -> std::string {
  return std::visit(
      overloaded{
          [](const SelfPromotionBadge &b) {
            return std::format("target finished {}", to_string_view(b.result));
          },
          [](const ManualApprovalBadge &b) {
            return std::format("approved by {}", b.user);
          },
          [](const UpstreamPromotionBadge &b) {
            std::string out = "after";
            for (const auto &[process, number] : b.promotions) {
              out += std::format(" {} #{}", process, number);
            }
            return out;
          },
          [](const ManualPromotionBadge &b) {
            return std::format("forced by {}", b.user);
          },
          [](const CustomBadge &b) { return b.kind; },
      },
      badge);
}

auto contribute_env(const PromotionBadge &badge,
                    std::map<std::string, std::string> &env) -> void {
  std::visit(overloaded{
                 [&](const SelfPromotionBadge &) {
                   env["PROMOTION_SELF"] = "true";
                 },
                 [&](const ManualApprovalBadge &b) {
                   env["PROMOTION_APPROVER"] = b.user;
                   for (const auto &v : b.values) {
                     env[to_env_key(v.name)] = v.value;
                   }
                 },
                 [](const UpstreamPromotionBadge &) {},
                 [&](const ManualPromotionBadge &b) {
                   env["PROMOTION_FORCED_BY"] = b.user;
                 },
                 [&](const CustomBadge &b) {
                   for (const auto &[k, v] : b.values) {
                     env[to_env_key(k)] = v;
                   }
                 },
             },
             badge);
}

} // namespace matrixforge
