#pragma once

#include "matrixforge/model/parameters.hpp"
#include "matrixforge/promotion/badge.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace matrixforge {

class BranchBuild;
struct PromotionProcessDefinition;

// Capability every condition provides: look at the target build and either
// abstain (nullopt) or hand back the evidence that it is satisfied.
class IPromotionCondition {
public:
  virtual ~IPromotionCondition() = default;

  [[nodiscard]] virtual auto kind() const -> std::string_view = 0;
  [[nodiscard]] virtual auto evaluate(const PromotionProcessDefinition &process,
                                      const BranchBuild &target) const
      -> std::optional<PromotionBadge> = 0;
};

/// Qualifies once the target has finished with SUCCESS (or UNSTABLE when
/// `even_if_unstable`).
class SelfPromotionCondition final : public IPromotionCondition {
public:
  explicit SelfPromotionCondition(bool even_if_unstable = false)
      : even_if_unstable_(even_if_unstable) {}

  [[nodiscard]] auto kind() const -> std::string_view override {
    return "self";
  }
  [[nodiscard]] auto evaluate(const PromotionProcessDefinition &process,
                              const BranchBuild &target) const
      -> std::optional<PromotionBadge> override;

  [[nodiscard]] auto even_if_unstable() const noexcept -> bool {
    return even_if_unstable_;
  }

private:
  bool even_if_unstable_;
};

class ManualApprovalCondition final : public IPromotionCondition {
public:
  ManualApprovalCondition(std::vector<std::string> users,
                          std::vector<ParameterDefinition> parameters)
      : users_(std::move(users)), parameters_(std::move(parameters)) {}

  [[nodiscard]] auto kind() const -> std::string_view override {
    return "manual";
  }
  [[nodiscard]] auto evaluate(const PromotionProcessDefinition &process,
                              const BranchBuild &target) const
      -> std::optional<PromotionBadge> override;

  /// An empty user list lets anyone approve.
  [[nodiscard]] auto is_allowed(std::string_view user) const -> bool;

  /// Configured definitions merged with the parameters the target's task
  /// declares for this process; configured ones come first.
  [[nodiscard]] auto effective_parameters(
      const PromotionProcessDefinition &process,
      const BranchBuild &target) const -> std::vector<ParameterDefinition>;

  [[nodiscard]] auto users() const noexcept
      -> const std::vector<std::string> & {
    return users_;
  }
  [[nodiscard]] auto parameters() const noexcept
      -> const std::vector<ParameterDefinition> & {
    return parameters_;
  }

private:
  std::vector<std::string> users_;
  std::vector<ParameterDefinition> parameters_;
};

/// Qualifies when every listed process has been promoted for the same target.
class UpstreamPromotionCondition final : public IPromotionCondition {
public:
  explicit UpstreamPromotionCondition(std::vector<std::string> processes)
      : processes_(std::move(processes)) {}

  [[nodiscard]] auto kind() const -> std::string_view override {
    return "upstream";
  }
  [[nodiscard]] auto evaluate(const PromotionProcessDefinition &process,
                              const BranchBuild &target) const
      -> std::optional<PromotionBadge> override;

  [[nodiscard]] auto processes() const noexcept
      -> const std::vector<std::string> & {
    return processes_;
  }

private:
  std::vector<std::string> processes_;
};

/// Adapter for conditions supplied as a callable.
class CustomCondition final : public IPromotionCondition {
public:
  using Predicate = std::function<std::optional<PromotionBadge>(
      const PromotionProcessDefinition &, const BranchBuild &)>;

  CustomCondition(std::string kind, Predicate predicate)
      : kind_(std::move(kind)), predicate_(std::move(predicate)) {}

  [[nodiscard]] auto kind() const -> std::string_view override {
    return kind_;
  }
  [[nodiscard]] auto evaluate(const PromotionProcessDefinition &process,
                              const BranchBuild &target) const
      -> std::optional<PromotionBadge> override {
    return predicate_ ? predicate_(process, target) : std::nullopt;
  }

private:
  std::string kind_;
  Predicate predicate_;
};

} // namespace matrixforge
