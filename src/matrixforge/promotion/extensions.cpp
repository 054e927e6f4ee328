#include "matrixforge/promotion/extensions.hpp"

#include "matrixforge/util/log.hpp"

#include <ranges>

namespace matrixforge {

auto PromotionExtensions::with_builtins() -> PromotionExtensions {
  PromotionExtensions ext;
  ext.conditions_.emplace(
      "self",
      [](const ConditionSpec &spec)
          -> Result<std::shared_ptr<const IPromotionCondition>> {
        return std::make_shared<SelfPromotionCondition>(spec.even_if_unstable);
      });
  ext.conditions_.emplace(
      "manual",
      [](const ConditionSpec &spec)
          -> Result<std::shared_ptr<const IPromotionCondition>> {
        return std::make_shared<ManualApprovalCondition>(spec.users,
                                                         spec.parameters);
      });
  ext.conditions_.emplace(
      "upstream",
      [](const ConditionSpec &spec)
          -> Result<std::shared_ptr<const IPromotionCondition>> {
        if (spec.processes.empty()) {
          return fail(Error::InvalidArgument);
        }
        return std::make_shared<UpstreamPromotionCondition>(spec.processes);
      });
  ext.setups_.emplace(
      "restore_archived_files",
      [](const SetupSpec &spec)
          -> Result<std::shared_ptr<const IPromotionSetup>> {
        return std::make_shared<RestoreArchivedFiles>(
            spec.includes, spec.excludes,
            parse_environment_constraint(spec.environments));
      });
  return ext;
}

auto PromotionExtensions::register_condition(std::string type,
                                             ConditionFactory factory)
    -> Result<void> {
  if (type.empty() || !factory) {
    return fail(Error::InvalidArgument);
  }
  if (!conditions_.emplace(std::move(type), std::move(factory)).second) {
    return fail(Error::AlreadyExists);
  }
  return ok();
}

auto PromotionExtensions::register_setup(std::string type, SetupFactory factory)
    -> Result<void> {
  if (type.empty() || !factory) {
    return fail(Error::InvalidArgument);
  }
  if (!setups_.emplace(std::move(type), std::move(factory)).second) {
    return fail(Error::AlreadyExists);
  }
  return ok();
}

auto PromotionExtensions::make_condition(const ConditionSpec &spec) const
    -> Result<std::shared_ptr<const IPromotionCondition>> {
  auto it = conditions_.find(spec.type);
  if (it == conditions_.end()) {
    log::warn("Unknown promotion condition type '{}'", spec.type);
    return fail(Error::NotFound);
  }
  return it->second(spec);
}

auto PromotionExtensions::make_setup(const SetupSpec &spec) const
    -> Result<std::shared_ptr<const IPromotionSetup>> {
  auto it = setups_.find(spec.type);
  if (it == setups_.end()) {
    log::warn("Unknown promotion setup type '{}'", spec.type);
    return fail(Error::NotFound);
  }
  return it->second(spec);
}

auto PromotionExtensions::condition_types() const -> std::vector<std::string> {
  return conditions_ | std::views::keys | std::ranges::to<std::vector>();
}

auto PromotionExtensions::setup_types() const -> std::vector<std::string> {
  return setups_ | std::views::keys | std::ranges::to<std::vector>();
}

} // namespace matrixforge
