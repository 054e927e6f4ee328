#pragma once

#include "matrixforge/core/error.hpp"
#include "matrixforge/environment/environment_set.hpp"
#include "matrixforge/model/parameters.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace matrixforge {

inline constexpr std::string_view kDefaultMarkerFile = ".matrixforge.toml";

struct EnvironmentCommands {
  EnvironmentSet environment;
  std::vector<std::string> commands;
};

struct TaskCommand {
  std::string id;
  std::vector<std::string> commands;
  std::vector<ParameterDefinition> parameters;
};

// Structured build description of one repository revision.
class ProjectModel {
public:
  ProjectModel() = default;
  ProjectModel(std::vector<EnvironmentCommands> builds,
               std::vector<TaskCommand> tasks,
               std::vector<ParameterDefinition> parameters = {},
               std::vector<std::string> artifacts = {},
               std::vector<EnvironmentSet> environments = {});

  /// The explicit `environments` list when present, otherwise the
  /// environments of the [[build]] entries in declaration order, without
  /// duplicates.
  [[nodiscard]] auto environments() const -> std::vector<EnvironmentSet>;

  /// Exact match first, otherwise the most specific declared entry whose
  /// labels are a subset of `env`.
  [[nodiscard]] auto build_command_for(const EnvironmentSet &env) const
      -> std::optional<std::vector<std::string>>;

  /// Task commands for a promotion process (case-insensitive id match).
  [[nodiscard]] auto task_command(std::string_view process) const
      -> std::optional<TaskCommand>;

  [[nodiscard]] auto parameters() const noexcept
      -> const std::vector<ParameterDefinition> & {
    return parameters_;
  }
  [[nodiscard]] auto artifacts() const noexcept
      -> const std::vector<std::string> & {
    return artifacts_;
  }
  [[nodiscard]] auto builds() const noexcept
      -> const std::vector<EnvironmentCommands> & {
    return builds_;
  }
  [[nodiscard]] auto tasks() const noexcept -> const std::vector<TaskCommand> & {
    return tasks_;
  }

private:
  std::vector<EnvironmentCommands> builds_;
  std::vector<TaskCommand> tasks_;
  std::vector<ParameterDefinition> parameters_;
  std::vector<std::string> artifacts_;
  std::vector<EnvironmentSet> declared_;
};

struct ModelRequest {
  std::string marker{kDefaultMarkerFile};
};

class IModelSource {
public:
  virtual ~IModelSource() = default;

  /// Fails with ModelBuildError; `diagnostic` receives the reason.
  [[nodiscard]] virtual auto resolve(const std::filesystem::path &repository,
                                     const ModelRequest &request,
                                     std::string *diagnostic = nullptr) const
      -> Result<std::shared_ptr<const ProjectModel>> = 0;
};

// Reads <repository>/<marker> as TOML:
//
//   environments = [["linux"], ["gcc", "linux"]]    optional
//   artifacts = ["out/**"]
//   [[parameter]]          name, default, description, choices
//   [[build]]              environment = ["linux"], commands = [...]
//   [[task]]               id, commands, [[task.parameter]]
class TomlModelSource final : public IModelSource {
public:
  [[nodiscard]] auto resolve(const std::filesystem::path &repository,
                             const ModelRequest &request,
                             std::string *diagnostic = nullptr) const
      -> Result<std::shared_ptr<const ProjectModel>> override;
};

[[nodiscard]] auto parse_project_model(std::string_view toml_text,
                                       std::string *diagnostic = nullptr)
    -> Result<ProjectModel>;

} // namespace matrixforge
