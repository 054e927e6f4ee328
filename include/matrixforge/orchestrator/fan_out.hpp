#pragma once

#include "matrixforge/core/coroutine.hpp"
#include "matrixforge/core/error.hpp"
#include "matrixforge/environment/environment_set.hpp"
#include "matrixforge/model/build_result.hpp"
#include "matrixforge/model/parameters.hpp"
#include "matrixforge/model/project_model.hpp"
#include "matrixforge/orchestrator/child_job.hpp"
#include "matrixforge/scheduler/job_scheduler.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace matrixforge {

struct FanOutOptions {
  std::chrono::milliseconds poll_interval{1000};
  /// Consecutive polls a child must be missing from both the queue and the
  /// running builds before it is taken as cancelled.
  int cancel_debounce{5};
  /// Start reporting why a child is still queued after this long.
  std::chrono::milliseconds queue_report_after{5000};
};

// Runs one child build per environment for a coordinating build and folds
// their results into one.
class FanOutOrchestrator {
public:
  FanOutOrchestrator(JobScheduler &scheduler, FanOutOptions options = {})
      : scheduler_(&scheduler), options_(options) {}

  /// Environments of `model` that survive `filter`, after checking each has
  /// a build command. Fails with ModelBuildError when nothing is left and
  /// NoBuildForEnvironment when any environment lacks a command; nothing is
  /// scheduled in either case.
  [[nodiscard]] static auto
  prepare(const ProjectModel &model,
          const std::optional<EnvironmentConstraint> &filter,
          BuildConsole &console) -> Result<std::vector<EnvironmentSet>>;

  /// Schedules every child with `parent` as its parent, waits for all of
  /// them and returns the worst result (a child that vanished counts as
  /// Aborted). When `parent` is interrupted the children still queued are
  /// cancelled and the running ones interrupted.
  [[nodiscard]] auto run(BuildRecord &parent,
                         std::span<const std::shared_ptr<IChildJob>> children,
                         Parameters parameters) -> task<BuildResult>;

  [[nodiscard]] auto options() const noexcept -> const FanOutOptions & {
    return options_;
  }

private:
  [[nodiscard]] auto wait_for(BuildRecord &parent, IChildJob &child)
      -> task<std::optional<BuildResult>>;
  auto cancel_outstanding(
      BuildRecord &parent,
      std::span<const std::shared_ptr<IChildJob>> children) -> void;
  [[nodiscard]] auto queued_for(const BuildRecord &parent,
                                const IChildJob &child) const
      -> std::vector<QueueItem>;

  JobScheduler *scheduler_;
  FanOutOptions options_;
};

} // namespace matrixforge
