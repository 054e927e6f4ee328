#include "matrixforge/promotion/condition.hpp"

#include "matrixforge/promotion/catalog.hpp"
#include "matrixforge/record/branch_build.hpp"

#include <boost/algorithm/string/predicate.hpp>

#include <algorithm>

namespace matrixforge {

auto SelfPromotionCondition::evaluate(const PromotionProcessDefinition &,
                                      const BranchBuild &target) const
    -> std::optional<PromotionBadge> {
  if (target.is_building()) {
    return std::nullopt;
  }
  auto result = target.result();
  if (!result) {
    return std::nullopt;
  }
  if (*result == BuildResult::Success ||
      (even_if_unstable_ && *result == BuildResult::Unstable)) {
    return SelfPromotionBadge{.result = *result};
  }
  return std::nullopt;
}

auto ManualApprovalCondition::evaluate(const PromotionProcessDefinition &process,
                                       const BranchBuild &target) const
    -> std::optional<PromotionBadge> {
  if (auto badge = target.approval_for(process.name)) {
    return *std::move(badge);
  }
  return std::nullopt;
}

auto ManualApprovalCondition::is_allowed(std::string_view user) const -> bool {
  return users_.empty() || std::ranges::contains(users_, user);
}

auto ManualApprovalCondition::effective_parameters(
    const PromotionProcessDefinition &process, const BranchBuild &target) const
    -> std::vector<ParameterDefinition> {
  auto model = target.model();
  auto task = model ? model->task_command(process.name) : std::nullopt;
  if (!task || task->parameters.empty()) {
    return parameters_;
  }

  std::vector<ParameterDefinition> out;
  for (const auto &def : parameters_) {
    auto it = std::ranges::find(task->parameters, def.name,
                                &ParameterDefinition::name);
    if (it != task->parameters.end() && def.default_value.empty()) {
      auto merged = def;
      merged.default_value = it->default_value;
      out.push_back(std::move(merged));
    } else {
      out.push_back(def);
    }
  }
  for (const auto &declared : task->parameters) {
    if (!std::ranges::contains(parameters_, declared.name,
                               &ParameterDefinition::name)) {
      out.push_back(declared);
    }
  }
  return out;
}

auto UpstreamPromotionCondition::evaluate(const PromotionProcessDefinition &,
                                          const BranchBuild &target) const
    -> std::optional<PromotionBadge> {
  UpstreamPromotionBadge badge;
  for (const auto &name : processes_) {
    auto status = target.promotions().find(name);
    auto successful = status ? status->successful_attempt() : std::nullopt;
    if (!successful) {
      return std::nullopt;
    }
    badge.promotions.emplace_back(status->name(), *successful);
  }
  return badge;
}

auto PromotionCatalog::find(std::string_view name) const
    -> const PromotionProcessDefinition * {
  auto idx = index_of(name);
  return idx ? &processes_[*idx] : nullptr;
}

auto PromotionCatalog::index_of(std::string_view name) const
    -> std::optional<std::size_t> {
  for (std::size_t i = 0; i < processes_.size(); ++i) {
    if (boost::algorithm::iequals(processes_[i].name, name)) {
      return i;
    }
  }
  return std::nullopt;
}

} // namespace matrixforge
