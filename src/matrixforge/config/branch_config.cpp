#include "matrixforge/config/branch_config.hpp"
#include "matrixforge/config/parameter_toml.hpp"
#include "matrixforge/config/toml_util.hpp"

#include "matrixforge/util/log.hpp"

#include <boost/algorithm/string/case_conv.hpp>

#include <format>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace matrixforge {
namespace detail {

struct BranchToml {
  std::string name;
  std::string repository{"."};
  std::string marker{kDefaultMarkerFile};
  std::string environment_filter;
  std::map<std::string, std::string> scm;
};

struct ConditionToml {
  std::string type;
  bool even_if_unstable{false};
  std::vector<std::string> users;
  std::vector<std::string> processes;
  std::vector<ParameterToml> parameter;
  std::map<std::string, std::string> options;
};

struct SetupToml {
  std::string type;
  std::string includes;
  std::string excludes;
  std::string environments;
  std::map<std::string, std::string> options;
};

struct PromotionToml {
  std::string name;
  std::string display_name;
  std::string environment;
  std::vector<ConditionToml> condition;
  std::vector<SetupToml> setup;
};

struct PostBuildToml {
  std::string type{"shell"};
  std::vector<std::string> commands;
};

struct BranchFileToml {
  BranchToml branch{};
  std::vector<ParameterToml> parameter;
  std::vector<PromotionToml> promotion;
  std::vector<PostBuildToml> post_build;
};

} // namespace detail
} // namespace matrixforge

namespace glz {
template <> struct meta<matrixforge::detail::BranchToml> {
  using T = matrixforge::detail::BranchToml;
  static constexpr auto value =
      object("name", &T::name, "repository", &T::repository, "marker",
             &T::marker, "environment_filter", &T::environment_filter, "scm",
             &T::scm);
};

template <> struct meta<matrixforge::detail::ConditionToml> {
  using T = matrixforge::detail::ConditionToml;
  static constexpr auto value =
      object("type", &T::type, "even_if_unstable", &T::even_if_unstable,
             "users", &T::users, "processes", &T::processes, "parameter",
             &T::parameter, "options", &T::options);
};

template <> struct meta<matrixforge::detail::SetupToml> {
  using T = matrixforge::detail::SetupToml;
  static constexpr auto value =
      object("type", &T::type, "includes", &T::includes, "excludes",
             &T::excludes, "environments", &T::environments, "options",
             &T::options);
};

template <> struct meta<matrixforge::detail::PromotionToml> {
  using T = matrixforge::detail::PromotionToml;
  static constexpr auto value =
      object("name", &T::name, "display_name", &T::display_name,
             "environment", &T::environment, "condition", &T::condition,
             "setup", &T::setup);
};

template <> struct meta<matrixforge::detail::PostBuildToml> {
  using T = matrixforge::detail::PostBuildToml;
  static constexpr auto value =
      object("type", &T::type, "commands", &T::commands);
};

template <> struct meta<matrixforge::detail::BranchFileToml> {
  using T = matrixforge::detail::BranchFileToml;
  static constexpr auto value =
      object("branch", &T::branch, "parameter", &T::parameter, "promotion",
             &T::promotion, "post_build", &T::post_build);
};
} // namespace glz

namespace matrixforge {
namespace {

auto report(std::string *diagnostic, std::string message) -> Error {
  log::warn("Invalid branch configuration: {}", message);
  if (diagnostic) {
    *diagnostic = std::move(message);
  }
  return Error::ParseError;
}

auto convert_promotion(const PromotionExtensions &extensions,
                       detail::PromotionToml raw, std::string *diagnostic)
    -> Result<PromotionProcessDefinition> {
  PromotionProcessDefinition def{.name = std::move(raw.name),
                                 .display_name = std::move(raw.display_name),
                                 .environment = std::nullopt,
                                 .setups = {},
                                 .conditions = {}};
  if (!raw.environment.empty()) {
    def.environment = parse_environment_constraint(raw.environment);
  }

  for (auto &c : raw.condition) {
    auto parameters =
        detail::convert_parameters(std::move(c.parameter), diagnostic);
    if (!parameters) {
      return fail(parameters.error());
    }
    ConditionSpec spec{.type = c.type,
                       .even_if_unstable = c.even_if_unstable,
                       .users = std::move(c.users),
                       .parameters = std::move(*parameters),
                       .processes = std::move(c.processes),
                       .options = std::move(c.options)};
    auto condition = extensions.make_condition(spec);
    if (!condition) {
      return fail(report(diagnostic,
                         std::format("promotion '{}': condition '{}': {}",
                                     def.name, c.type,
                                     condition.error().message())));
    }
    def.conditions.push_back(std::move(*condition));
  }

  for (auto &s : raw.setup) {
    SetupSpec spec{.type = s.type,
                   .includes = std::move(s.includes),
                   .excludes = std::move(s.excludes),
                   .environments = std::move(s.environments),
                   .options = std::move(s.options)};
    auto setup = extensions.make_setup(spec);
    if (!setup) {
      return fail(report(diagnostic,
                         std::format("promotion '{}': setup '{}': {}",
                                     def.name, s.type,
                                     setup.error().message())));
    }
    def.setups.push_back(std::move(*setup));
  }
  return ok(std::move(def));
}

} // namespace

auto BranchConfigLoader::load_from_file(const std::filesystem::path &path,
                                        std::string *diagnostic) const
    -> Result<BranchConfig> {
  auto text = toml_util::read_file(path, diagnostic);
  if (!text) {
    return fail(text.error());
  }
  auto base = path.parent_path();
  if (base.empty()) {
    base = std::filesystem::path(".");
  }
  return load_from_string(*text, base, diagnostic);
}

auto BranchConfigLoader::load_from_string(std::string_view toml_str,
                                          const std::filesystem::path &base_dir,
                                          std::string *diagnostic) const
    -> Result<BranchConfig> {
  auto raw = toml_util::parse_toml<detail::BranchFileToml>(toml_str, diagnostic);
  if (!raw) {
    return fail(raw.error());
  }

  auto &branch = raw->branch;
  if (!is_valid_id_text(branch.name)) {
    return fail(report(diagnostic, "[branch] name is missing or invalid"));
  }
  if (branch.marker.empty()) {
    return fail(report(diagnostic, "[branch] marker must not be empty"));
  }

  BranchSettings settings;
  std::filesystem::path repository(branch.repository);
  settings.repository = repository.is_relative() && !base_dir.empty()
                            ? (base_dir / repository).lexically_normal()
                            : repository;
  settings.marker = std::move(branch.marker);
  settings.scm = std::move(branch.scm);
  if (!branch.environment_filter.empty()) {
    settings.environment_filter =
        parse_environment_constraint(branch.environment_filter);
  }

  auto parameters = detail::convert_parameters(std::move(raw->parameter),
                                               diagnostic);
  if (!parameters) {
    return fail(parameters.error());
  }
  settings.parameters = std::move(*parameters);

  std::vector<PromotionProcessDefinition> processes;
  std::set<std::string> seen;
  for (auto &p : raw->promotion) {
    if (!is_valid_id_text(p.name) || p.name.contains('/')) {
      return fail(report(diagnostic,
                         std::format("invalid promotion name '{}'", p.name)));
    }
    if (!seen.insert(boost::algorithm::to_lower_copy(p.name)).second) {
      return fail(report(diagnostic,
                         std::format("duplicate promotion '{}'", p.name)));
    }
    auto def = convert_promotion(*extensions_, std::move(p), diagnostic);
    if (!def) {
      return fail(def.error());
    }
    processes.push_back(std::move(*def));
  }
  settings.catalog =
      std::make_shared<const PromotionCatalog>(std::move(processes));

  for (auto &step : raw->post_build) {
    if (step.type != "shell") {
      return fail(report(diagnostic,
                         std::format("unknown post_build type '{}'", step.type)));
    }
    if (step.commands.empty()) {
      return fail(report(diagnostic, "[[post_build]] declares no commands"));
    }
    settings.post_build.push_back(
        std::make_shared<const ShellPostBuildStep>(std::move(step.commands)));
  }

  return ok(BranchConfig{.name = JobName{std::move(branch.name)},
                         .settings = std::move(settings)});
}

} // namespace matrixforge
