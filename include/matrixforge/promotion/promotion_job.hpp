#pragma once

#include "matrixforge/promotion/catalog.hpp"
#include "matrixforge/record/branch_build.hpp"
#include "matrixforge/record/promotion_build.hpp"
#include "matrixforge/scheduler/job.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace matrixforge {

class BranchJob;

// Runs one promotion process of a branch. Each build targets one branch
// build, referenced by job name and number.
class PromotionJob final : public IJob {
public:
  PromotionJob(BranchJob &branch, std::string process);

  /// "<branch>/promotion/<process>"
  [[nodiscard]] static auto job_name(const JobName &branch,
                                     std::string_view process) -> JobName;

  [[nodiscard]] auto name() const -> const JobName & override { return name_; }
  [[nodiscard]] auto process() const noexcept -> const std::string & {
    return process_;
  }

  /// Adds builds loaded from storage; the number counter moves past them.
  auto restore(std::vector<std::shared_ptr<PromotionBuild>> builds,
               int next_number) -> void;

  [[nodiscard]] auto find_build(int number) const
      -> std::shared_ptr<PromotionBuild>;
  [[nodiscard]] auto builds() const
      -> std::vector<std::shared_ptr<PromotionBuild>>;

  [[nodiscard]] auto create_build(const QueueItem &item)
      -> Result<std::shared_ptr<BuildRecord>> override;
  [[nodiscard]] auto perform(std::shared_ptr<BuildRecord> build)
      -> task<BuildResult> override;
  auto on_completed(const std::shared_ptr<BuildRecord> &build) -> void override;

private:
  [[nodiscard]] auto promotion_env(const BranchBuild &target,
                                   const PromotionProcessDefinition &process,
                                   const PromotionBuild &build) const
      -> std::map<std::string, std::string>;

  BranchJob *branch_;
  std::string process_;
  JobName name_;

  mutable std::mutex mutex_;
  std::map<int, std::shared_ptr<PromotionBuild>> builds_;
  int next_number_{1};
};

} // namespace matrixforge
