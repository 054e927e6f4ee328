#pragma once

#include "matrixforge/environment/environment_set.hpp"
#include "matrixforge/model/project_model.hpp"
#include "matrixforge/promotion/badge.hpp"
#include "matrixforge/promotion/promotion_status.hpp"
#include "matrixforge/record/build_record.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace matrixforge {

struct ManualApproval {
  std::string process;
  ManualApprovalBadge badge;
};

// One build of a branch. Owns the environment list selected for this build
// number and the promotion statuses of every process that qualified.
class BranchBuild final : public BuildRecord {
public:
  explicit BranchBuild(BuildRef ref);

  /// Set once; a second call fails with InvalidState.
  [[nodiscard]] auto set_environments(std::vector<EnvironmentSet> envs)
      -> Result<void>;
  [[nodiscard]] auto environments() const -> std::vector<EnvironmentSet>;
  [[nodiscard]] auto has_environments() const -> bool;

  auto set_model(std::shared_ptr<const ProjectModel> model) -> void;
  [[nodiscard]] auto model() const -> std::shared_ptr<const ProjectModel>;

  auto set_scm_vars(std::map<std::string, std::string> vars) -> void;
  [[nodiscard]] auto scm_vars() const -> std::map<std::string, std::string>;

  [[nodiscard]] auto promotions() noexcept -> PromotionStatusList & {
    return promotions_;
  }
  [[nodiscard]] auto promotions() const noexcept
      -> const PromotionStatusList & {
    return promotions_;
  }

  /// Fails with AlreadyExists when `process` was approved before.
  [[nodiscard]] auto add_approval(ManualApproval approval) -> Result<void>;
  [[nodiscard]] auto approval_for(std::string_view process) const
      -> std::optional<ManualApprovalBadge>;
  [[nodiscard]] auto approvals() const -> std::vector<ManualApproval>;

private:
  mutable std::mutex mutex_;
  std::optional<std::vector<EnvironmentSet>> environments_;
  std::shared_ptr<const ProjectModel> model_;
  std::map<std::string, std::string> scm_vars_;
  std::vector<ManualApproval> approvals_;
  PromotionStatusList promotions_;
};

} // namespace matrixforge
