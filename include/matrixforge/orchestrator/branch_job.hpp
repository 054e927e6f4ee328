#pragma once

#include "matrixforge/environment/environment_registry.hpp"
#include "matrixforge/executor/executor.hpp"
#include "matrixforge/model/project_model.hpp"
#include "matrixforge/orchestrator/environment_job.hpp"
#include "matrixforge/orchestrator/fan_out.hpp"
#include "matrixforge/orchestrator/post_build.hpp"
#include "matrixforge/promotion/catalog.hpp"
#include "matrixforge/promotion/promotion_job.hpp"
#include "matrixforge/record/branch_build.hpp"
#include "matrixforge/scheduler/job.hpp"
#include "matrixforge/scheduler/job_scheduler.hpp"
#include "matrixforge/storage/build_store.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace matrixforge {

class PromotionEngine;

/// Everything about a branch that configuration reload may replace.
struct BranchSettings {
  std::filesystem::path repository;
  std::string marker{kDefaultMarkerFile};
  std::map<std::string, std::string> scm;
  std::optional<EnvironmentConstraint> environment_filter;
  std::vector<ParameterDefinition> parameters;
  std::shared_ptr<const PromotionCatalog> catalog{
      std::make_shared<const PromotionCatalog>()};
  std::vector<std::shared_ptr<const IPostBuildStep>> post_build;
};

/// Process-wide collaborators shared by every branch.
struct BranchServices {
  JobScheduler &scheduler;
  IExecutor &executor;
  BuildStore &store;
  const IModelSource &model_source;
  PromotionEngine &engine;
  FanOutOptions fan_out;
  std::chrono::seconds command_timeout{3600};
};

// Coordinator of one branch: resolves the build description, fans out one
// environment build per declared environment and hands the finished build to
// the promotion engine.
class BranchJob final : public IJob,
                        public std::enable_shared_from_this<BranchJob> {
public:
  BranchJob(JobName name, BranchSettings settings, BranchServices services);

  BranchJob(const BranchJob &) = delete;
  BranchJob &operator=(const BranchJob &) = delete;

  [[nodiscard]] auto name() const -> const JobName & override { return name_; }
  [[nodiscard]] auto is_flyweight() const noexcept -> bool override {
    return true;
  }

  /// Readers keep the snapshot they got; configure() swaps in a new one.
  [[nodiscard]] auto settings() const -> std::shared_ptr<const BranchSettings>;
  auto configure(BranchSettings settings) -> void;

  [[nodiscard]] auto catalog() const -> std::shared_ptr<const PromotionCatalog> {
    return settings()->catalog;
  }

  /// Reads builds, environments and promotion builds from the store.
  [[nodiscard]] auto load() -> Result<void>;

  [[nodiscard]] auto find_build(int number) const
      -> std::shared_ptr<BranchBuild>;
  [[nodiscard]] auto builds() const -> std::vector<std::shared_ptr<BranchBuild>>;
  [[nodiscard]] auto last_build() const -> std::shared_ptr<BranchBuild>;
  [[nodiscard]] auto next_build_number() const -> int;

  [[nodiscard]] auto environments() const
      -> const EnvironmentRegistry<EnvironmentJob> & {
    return environments_;
  }
  /// Environment builds of branch build `number`, in the build's own
  /// environment order; environments without a build are skipped.
  [[nodiscard]] auto environment_builds(int number) const
      -> std::vector<std::shared_ptr<const EnvironmentBuild>>;

  /// Job of a catalog process, created on first use. nullptr when the
  /// catalog has no such process.
  [[nodiscard]] auto promotion_job(std::string_view process)
      -> std::shared_ptr<PromotionJob>;

  [[nodiscard]] auto services() noexcept -> BranchServices & {
    return services_;
  }

  [[nodiscard]] auto create_build(const QueueItem &item)
      -> Result<std::shared_ptr<BuildRecord>> override;
  [[nodiscard]] auto perform(std::shared_ptr<BuildRecord> build)
      -> task<BuildResult> override;
  auto on_completed(const std::shared_ptr<BuildRecord> &build) -> void override;

private:
  [[nodiscard]] auto make_environment_job(const EnvironmentSet &env)
      -> std::shared_ptr<EnvironmentJob>;
  [[nodiscard]] auto environment_settings(const BranchSettings &settings) const
      -> EnvironmentJobSettings;
  auto persist_environments() -> void;
  [[nodiscard]] auto run_post_build(BranchBuild &build,
                                    const BranchSettings &settings,
                                    const Parameters &parameters)
      -> task<BuildResult>;

  JobName name_;
  BranchServices services_;

  std::mutex settings_mutex_;
  std::atomic<std::shared_ptr<const BranchSettings>> settings_;

  EnvironmentRegistry<EnvironmentJob> environments_;

  mutable std::mutex mutex_;
  std::map<int, std::shared_ptr<BranchBuild>> builds_;
  std::map<std::string, std::shared_ptr<PromotionJob>> promotion_jobs_;
  int next_build_number_{1};
};

} // namespace matrixforge
