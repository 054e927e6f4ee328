#pragma once

#include "matrixforge/core/error.hpp"
#include "matrixforge/model/parameters.hpp"

#include <glaze/toml.hpp>

#include <format>
#include <set>
#include <string>
#include <vector>

namespace matrixforge::detail {

/// `[[parameter]]` table shared by build descriptions and branch files.
struct ParameterToml {
  std::string name;
  std::string default_value;
  std::string description;
  std::vector<std::string> choices;
};

/// Rejects empty or duplicate names and defaults outside the choices.
[[nodiscard]] inline auto
convert_parameters(std::vector<ParameterToml> raw, std::string *diagnostic)
    -> Result<std::vector<ParameterDefinition>> {
  std::vector<ParameterDefinition> out;
  std::set<std::string> seen;
  for (auto &p : raw) {
    if (p.name.empty() || !seen.insert(p.name).second) {
      if (diagnostic) {
        *diagnostic =
            std::format("invalid or duplicate parameter name '{}'", p.name);
      }
      return fail(Error::ParseError);
    }
    ParameterDefinition def{.name = std::move(p.name),
                            .default_value = std::move(p.default_value),
                            .description = std::move(p.description),
                            .choices = std::move(p.choices)};
    if (!def.default_value.empty() && !def.accepts(def.default_value)) {
      if (diagnostic) {
        *diagnostic =
            std::format("default of '{}' is not one of its choices", def.name);
      }
      return fail(Error::ParseError);
    }
    out.push_back(std::move(def));
  }
  return ok(std::move(out));
}

} // namespace matrixforge::detail

template <> struct glz::meta<matrixforge::detail::ParameterToml> {
  using T = matrixforge::detail::ParameterToml;
  static constexpr auto value =
      object("name", &T::name, "default", &T::default_value, "description",
             &T::description, "choices", &T::choices);
};
