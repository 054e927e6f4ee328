#pragma once

#include "matrixforge/environment/environment_set.hpp"
#include "matrixforge/record/build_record.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace matrixforge {

// Build of one environment. Shares its number with the branch build that
// scheduled it.
class EnvironmentBuild final : public BuildRecord {
public:
  EnvironmentBuild(BuildRef ref, EnvironmentSet environment,
                   std::optional<BuildRef> parent)
      : BuildRecord(std::move(ref)), environment_(std::move(environment)),
        parent_(std::move(parent)) {}

  [[nodiscard]] auto environment() const noexcept -> const EnvironmentSet & {
    return environment_;
  }
  [[nodiscard]] auto parent() const noexcept -> const std::optional<BuildRef> & {
    return parent_;
  }

  /// Private copy of the repository the build commands ran in.
  auto set_workspace(std::filesystem::path dir) -> void {
    std::scoped_lock lock(mutex_);
    workspace_ = std::move(dir);
  }
  [[nodiscard]] auto workspace() const -> std::filesystem::path {
    std::scoped_lock lock(mutex_);
    return workspace_;
  }

  /// Directory holding the archived files of this build.
  auto set_archive_dir(std::filesystem::path dir) -> void {
    std::scoped_lock lock(mutex_);
    archive_dir_ = std::move(dir);
  }
  [[nodiscard]] auto archive_dir() const -> std::filesystem::path {
    std::scoped_lock lock(mutex_);
    return archive_dir_;
  }

  auto set_artifacts(std::vector<std::string> relative_paths) -> void {
    std::scoped_lock lock(mutex_);
    artifacts_ = std::move(relative_paths);
  }
  [[nodiscard]] auto artifacts() const -> std::vector<std::string> {
    std::scoped_lock lock(mutex_);
    return artifacts_;
  }

private:
  EnvironmentSet environment_;
  std::optional<BuildRef> parent_;

  mutable std::mutex mutex_;
  std::filesystem::path workspace_;
  std::filesystem::path archive_dir_;
  std::vector<std::string> artifacts_;
};

} // namespace matrixforge
