#pragma once

#include <algorithm>
#include <map>
#include <string>
#include <vector>

namespace matrixforge {

using Parameters = std::map<std::string, std::string>;

struct ParameterDefinition {
  std::string name;
  std::string default_value;
  std::string description;
  std::vector<std::string> choices;

  [[nodiscard]] auto accepts(const std::string &value) const -> bool {
    return choices.empty() || std::ranges::contains(choices, value);
  }

  auto operator==(const ParameterDefinition &) const -> bool = default;
};

struct ParameterValue {
  std::string name;
  std::string value;

  auto operator==(const ParameterValue &) const -> bool = default;
};

/// Adds every definition's default that `params` does not already carry.
inline auto apply_parameter_defaults(Parameters &params,
                                     const std::vector<ParameterDefinition> &defs)
    -> void {
  for (const auto &def : defs) {
    params.try_emplace(def.name, def.default_value);
  }
}

} // namespace matrixforge
