#pragma once

#include "matrixforge/environment/environment_set.hpp"
#include "matrixforge/promotion/condition.hpp"
#include "matrixforge/promotion/setup_step.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace matrixforge {

struct PromotionProcessDefinition {
  std::string name;
  std::string display_name;
  std::optional<EnvironmentConstraint> environment;
  std::vector<std::shared_ptr<const IPromotionSetup>> setups;
  std::vector<std::shared_ptr<const IPromotionCondition>> conditions;

  [[nodiscard]] auto display() const -> const std::string & {
    return display_name.empty() ? name : display_name;
  }

  template <typename C> [[nodiscard]] auto find_condition() const -> const C * {
    for (const auto &c : conditions) {
      if (const auto *typed = dynamic_cast<const C *>(c.get())) {
        return typed;
      }
    }
    return nullptr;
  }
};

// Ordered promotion processes of one branch. Names compare case-insensitively;
// declaration order is the display order.
class PromotionCatalog {
public:
  PromotionCatalog() = default;
  explicit PromotionCatalog(std::vector<PromotionProcessDefinition> processes)
      : processes_(std::move(processes)) {}

  [[nodiscard]] auto find(std::string_view name) const
      -> const PromotionProcessDefinition *;
  [[nodiscard]] auto index_of(std::string_view name) const
      -> std::optional<std::size_t>;
  [[nodiscard]] auto processes() const noexcept
      -> const std::vector<PromotionProcessDefinition> & {
    return processes_;
  }
  [[nodiscard]] auto empty() const noexcept -> bool {
    return processes_.empty();
  }

private:
  std::vector<PromotionProcessDefinition> processes_;
};

} // namespace matrixforge
