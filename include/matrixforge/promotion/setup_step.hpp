#pragma once

#include "matrixforge/core/error.hpp"
#include "matrixforge/environment/environment_set.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace matrixforge {

class BranchBuild;
class EnvironmentBuild;
class PromotionBuild;

struct SetupContext {
  PromotionBuild &build;
  const BranchBuild &target;
  /// Environment builds of the target that still resolve.
  std::vector<std::shared_ptr<const EnvironmentBuild>> environment_builds;
  std::filesystem::path workspace;
};

// Runs before the promotion command body. A failure skips the remaining
// steps and fails the promotion; steps must be safe to run again.
class IPromotionSetup {
public:
  virtual ~IPromotionSetup() = default;

  [[nodiscard]] virtual auto kind() const -> std::string_view = 0;
  [[nodiscard]] virtual auto setup(SetupContext &ctx) const -> Result<void> = 0;
};

/// Copies files archived by the target's environment builds into the
/// promotion workspace.
class RestoreArchivedFiles final : public IPromotionSetup {
public:
  RestoreArchivedFiles(std::string includes, std::string excludes,
                       std::optional<EnvironmentConstraint> environments);

  [[nodiscard]] auto kind() const -> std::string_view override {
    return "restore_archived_files";
  }
  [[nodiscard]] auto setup(SetupContext &ctx) const -> Result<void> override;

  [[nodiscard]] auto includes() const noexcept -> const std::string & {
    return includes_;
  }
  [[nodiscard]] auto excludes() const noexcept -> const std::string & {
    return excludes_;
  }
  [[nodiscard]] auto environments() const noexcept
      -> const std::optional<EnvironmentConstraint> & {
    return environments_;
  }

private:
  std::string includes_;
  std::string excludes_;
  std::optional<EnvironmentConstraint> environments_;
};

} // namespace matrixforge
