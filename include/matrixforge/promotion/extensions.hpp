#pragma once

#include "matrixforge/core/error.hpp"
#include "matrixforge/model/parameters.hpp"
#include "matrixforge/promotion/condition.hpp"
#include "matrixforge/promotion/setup_step.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace matrixforge {

/// Declarative form of a condition, as read from branch configuration.
struct ConditionSpec {
  std::string type;
  bool even_if_unstable{false};
  std::vector<std::string> users;
  std::vector<ParameterDefinition> parameters;
  std::vector<std::string> processes;
  Parameters options;
};

struct SetupSpec {
  std::string type;
  std::string includes;
  std::string excludes;
  std::string environments;
  Parameters options;
};

// Condition and setup-step factories known to this process. Built once at
// startup and handed to whoever loads branch configuration.
class PromotionExtensions {
public:
  using ConditionFactory =
      std::function<Result<std::shared_ptr<const IPromotionCondition>>(
          const ConditionSpec &)>;
  using SetupFactory =
      std::function<Result<std::shared_ptr<const IPromotionSetup>>(
          const SetupSpec &)>;

  /// self, manual, upstream and restore_archived_files.
  [[nodiscard]] static auto with_builtins() -> PromotionExtensions;

  [[nodiscard]] auto register_condition(std::string type,
                                        ConditionFactory factory)
      -> Result<void>;
  [[nodiscard]] auto register_setup(std::string type, SetupFactory factory)
      -> Result<void>;

  [[nodiscard]] auto make_condition(const ConditionSpec &spec) const
      -> Result<std::shared_ptr<const IPromotionCondition>>;
  [[nodiscard]] auto make_setup(const SetupSpec &spec) const
      -> Result<std::shared_ptr<const IPromotionSetup>>;

  [[nodiscard]] auto condition_types() const -> std::vector<std::string>;
  [[nodiscard]] auto setup_types() const -> std::vector<std::string>;

private:
  std::map<std::string, ConditionFactory, std::less<>> conditions_;
  std::map<std::string, SetupFactory, std::less<>> setups_;
};

} // namespace matrixforge
