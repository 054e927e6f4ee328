#pragma once

#include "matrixforge/executor/executor.hpp"
#include "matrixforge/orchestrator/child_job.hpp"
#include "matrixforge/record/branch_build.hpp"
#include "matrixforge/record/environment_build.hpp"
#include "matrixforge/storage/build_store.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace matrixforge {

struct EnvironmentJobSettings {
  /// Copied into a fresh workspace per build. Version control metadata and
  /// a build store nested inside it are left out.
  std::filesystem::path repository;
  std::chrono::seconds timeout{3600};
};

// Builds one environment of a branch. Commands, parameters and SCM variables
// come from the parent branch build with the same number.
class EnvironmentJob final : public IChildJob {
public:
  using ParentLookup =
      std::function<std::shared_ptr<const BranchBuild>(int number)>;

  EnvironmentJob(JobName branch, EnvironmentSet environment,
                 ParentLookup parent_lookup, IExecutor &executor,
                 BuildStore &store);

  /// "<branch>/<canonical name>"
  [[nodiscard]] static auto job_name(const JobName &branch,
                                     const EnvironmentSet &env) -> JobName;

  [[nodiscard]] auto name() const -> const JobName & override { return name_; }
  [[nodiscard]] auto environment() const -> const EnvironmentSet & override {
    return environment_;
  }
  [[nodiscard]] auto branch() const noexcept -> const JobName & {
    return branch_;
  }

  auto configure(EnvironmentJobSettings settings) -> void;
  [[nodiscard]] auto settings() const -> EnvironmentJobSettings;

  /// Adds builds loaded from storage.
  auto restore(std::vector<std::shared_ptr<EnvironmentBuild>> builds) -> void;

  [[nodiscard]] auto build_by_number(int number) const
      -> std::shared_ptr<BuildRecord> override;
  [[nodiscard]] auto find_build(int number) const
      -> std::shared_ptr<EnvironmentBuild>;
  [[nodiscard]] auto builds() const
      -> std::vector<std::shared_ptr<EnvironmentBuild>>;

  [[nodiscard]] auto create_build(const QueueItem &item)
      -> Result<std::shared_ptr<BuildRecord>> override;
  [[nodiscard]] auto perform(std::shared_ptr<BuildRecord> build)
      -> task<BuildResult> override;
  auto on_completed(const std::shared_ptr<BuildRecord> &build) -> void override;

private:
  [[nodiscard]] auto prepare_workspace(EnvironmentBuild &build,
                                       const std::filesystem::path &repository)
      -> Result<std::filesystem::path>;
  auto archive(EnvironmentBuild &build, const std::vector<std::string> &patterns,
               const std::filesystem::path &from) -> void;

  JobName branch_;
  EnvironmentSet environment_;
  JobName name_;
  ParentLookup parent_lookup_;
  IExecutor *executor_;
  BuildStore *store_;

  mutable std::mutex mutex_;
  EnvironmentJobSettings settings_;
  std::map<int, std::shared_ptr<EnvironmentBuild>> builds_;
};

} // namespace matrixforge
