#include "matrixforge/model/project_model.hpp"
#include "matrixforge/config/parameter_toml.hpp"
#include "matrixforge/config/toml_util.hpp"
#include "matrixforge/util/log.hpp"

#include <boost/algorithm/string/predicate.hpp>

#include <algorithm>
#include <ranges>

namespace matrixforge {
namespace detail {

struct BuildToml {
  std::vector<std::string> environment;
  std::vector<std::string> commands;
};

struct TaskToml {
  std::string id;
  std::vector<std::string> commands;
  std::vector<ParameterToml> parameter;
};

struct ProjectToml {
  std::vector<std::vector<std::string>> environments;
  std::vector<std::string> artifacts;
  std::vector<ParameterToml> parameter;
  std::vector<BuildToml> build;
  std::vector<TaskToml> task;
};

} // namespace detail
} // namespace matrixforge

namespace glz {
template <> struct meta<matrixforge::detail::BuildToml> {
  using T = matrixforge::detail::BuildToml;
  static constexpr auto value =
      object("environment", &T::environment, "commands", &T::commands);
};

template <> struct meta<matrixforge::detail::TaskToml> {
  using T = matrixforge::detail::TaskToml;
  static constexpr auto value = object("id", &T::id, "commands", &T::commands,
                                       "parameter", &T::parameter);
};

template <> struct meta<matrixforge::detail::ProjectToml> {
  using T = matrixforge::detail::ProjectToml;
  static constexpr auto value =
      object("environments", &T::environments, "artifacts", &T::artifacts,
             "parameter", &T::parameter, "build", &T::build, "task", &T::task);
};
} // namespace glz

namespace matrixforge {

ProjectModel::ProjectModel(std::vector<EnvironmentCommands> builds,
                           std::vector<TaskCommand> tasks,
                           std::vector<ParameterDefinition> parameters,
                           std::vector<std::string> artifacts,
                           std::vector<EnvironmentSet> environments)
    : builds_(std::move(builds)), tasks_(std::move(tasks)),
      parameters_(std::move(parameters)), artifacts_(std::move(artifacts)),
      declared_(std::move(environments)) {}

auto ProjectModel::environments() const -> std::vector<EnvironmentSet> {
  if (!declared_.empty()) {
    return declared_;
  }
  std::vector<EnvironmentSet> out;
  for (const auto &b : builds_) {
    if (!std::ranges::contains(out, b.environment)) {
      out.push_back(b.environment);
    }
  }
  return out;
}

auto ProjectModel::build_command_for(const EnvironmentSet &env) const
    -> std::optional<std::vector<std::string>> {
  const EnvironmentCommands *best = nullptr;
  for (const auto &b : builds_) {
    if (b.environment == env) {
      return b.commands;
    }
    if (b.environment.is_subset_of(env) &&
        (best == nullptr || b.environment.size() > best->environment.size())) {
      best = &b;
    }
  }
  if (best == nullptr) {
    return std::nullopt;
  }
  return best->commands;
}

auto ProjectModel::task_command(std::string_view process) const
    -> std::optional<TaskCommand> {
  auto it = std::ranges::find_if(tasks_, [&](const TaskCommand &t) {
    return boost::algorithm::iequals(t.id, process);
  });
  if (it == tasks_.end()) {
    return std::nullopt;
  }
  return *it;
}

auto parse_project_model(std::string_view toml_text, std::string *diagnostic)
    -> Result<ProjectModel> {
  auto raw = toml_util::parse_toml<detail::ProjectToml>(toml_text, diagnostic);
  if (!raw) {
    return fail(raw.error());
  }

  auto parameters = detail::convert_parameters(std::move(raw->parameter), diagnostic);
  if (!parameters) {
    return fail(parameters.error());
  }

  std::vector<EnvironmentSet> declared;
  for (auto &labels : raw->environments) {
    auto env = EnvironmentSet::from_labels(std::move(labels));
    if (!env) {
      if (diagnostic) {
        *diagnostic = std::format("invalid entry #{} in environments: {}",
                                  declared.size() + 1, env.error().message());
      }
      return fail(Error::ParseError);
    }
    if (std::ranges::contains(declared, *env)) {
      if (diagnostic) {
        *diagnostic = std::format("environment '{}' declared twice", *env);
      }
      return fail(Error::ParseError);
    }
    declared.push_back(std::move(*env));
  }

  std::vector<EnvironmentCommands> builds;
  for (auto &b : raw->build) {
    auto env = EnvironmentSet::from_labels(std::move(b.environment));
    if (!env) {
      if (diagnostic) {
        *diagnostic = std::format("invalid environment in [[build]] #{}: {}",
                                  builds.size() + 1, env.error().message());
      }
      return fail(Error::ParseError);
    }
    if (b.commands.empty()) {
      if (diagnostic) {
        *diagnostic =
            std::format("[[build]] for '{}' declares no commands", *env);
      }
      return fail(Error::ParseError);
    }
    builds.push_back({.environment = std::move(*env),
                      .commands = std::move(b.commands)});
  }

  std::vector<TaskCommand> tasks;
  for (auto &t : raw->task) {
    if (t.id.empty()) {
      if (diagnostic) {
        *diagnostic = "[[task]] without id";
      }
      return fail(Error::ParseError);
    }
    auto task_params = detail::convert_parameters(std::move(t.parameter), diagnostic);
    if (!task_params) {
      return fail(task_params.error());
    }
    tasks.push_back({.id = std::move(t.id),
                     .commands = std::move(t.commands),
                     .parameters = std::move(*task_params)});
  }

  return ok(ProjectModel(std::move(builds), std::move(tasks),
                         std::move(*parameters), std::move(raw->artifacts),
                         std::move(declared)));
}

auto TomlModelSource::resolve(const std::filesystem::path &repository,
                              const ModelRequest &request,
                              std::string *diagnostic) const
    -> Result<std::shared_ptr<const ProjectModel>> {
  const auto path = repository / request.marker;
  auto text = toml_util::read_file(path, diagnostic);
  if (!text) {
    return fail(Error::ModelBuildError);
  }

  std::string detail;
  auto model = parse_project_model(*text, &detail);
  if (!model) {
    log::warn("Cannot parse {}: {}", path.string(), detail);
    if (diagnostic) {
      *diagnostic = std::format("{}: {}", path.string(), detail);
    }
    return fail(Error::ModelBuildError);
  }
  return ok(std::make_shared<const ProjectModel>(std::move(*model)));
}

} // namespace matrixforge
