#pragma once

#include "matrixforge/core/error.hpp"
#include "matrixforge/model/parameters.hpp"
#include "matrixforge/promotion/catalog.hpp"
#include "matrixforge/promotion/promotion_status.hpp"
#include "matrixforge/record/branch_build.hpp"
#include "matrixforge/record/promotion_build.hpp"
#include "matrixforge/scheduler/job_scheduler.hpp"
#include "matrixforge/storage/build_store.hpp"
#include "matrixforge/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace matrixforge {

class BranchJob;

enum class ConsiderOutcome : std::uint8_t {
  /// A status existed already; nothing happened.
  AlreadyQualified,
  /// At least one condition abstained.
  NotQualified,
  Scheduled,
  /// Qualified, but the attempt could not be queued; the next consider()
  /// retries.
  ScheduleFailed,
};
BOOST_DESCRIBE_ENUM(ConsiderOutcome, AlreadyQualified, NotQualified, Scheduled,
                    ScheduleFailed)
MATRIXFORGE_DEFINE_ENUM_SERDE(ConsiderOutcome, ConsiderOutcome::NotQualified)

struct PromotionStatusView {
  std::string process;
  std::string display_name;
  PromotionProgress progress{PromotionProgress::NotAttempted};
  /// nullptr until the process qualified.
  std::shared_ptr<const PromotionStatus> status;
  std::shared_ptr<const PromotionBuild> last;
  std::shared_ptr<const PromotionBuild> last_successful;
  std::shared_ptr<const PromotionBuild> last_failed;
};

// Qualification state machine for promotion processes. Every trigger
// (target completion, approval, cascade) ends in consider(), which
// qualifies a process at most once per target and schedules its attempt.
class PromotionEngine {
public:
  PromotionEngine(JobScheduler &scheduler, BuildStore &store)
      : scheduler_(&scheduler), store_(&store) {}

  PromotionEngine(const PromotionEngine &) = delete;
  PromotionEngine &operator=(const PromotionEngine &) = delete;

  [[nodiscard]] auto consider(BranchJob &branch, BranchBuild &target,
                              const PromotionProcessDefinition &process)
      -> ConsiderOutcome;
  /// NotFound for a process the catalog does not define.
  [[nodiscard]] auto consider(BranchJob &branch, BranchBuild &target,
                              std::string_view process)
      -> Result<ConsiderOutcome>;

  auto consider_all(BranchJob &branch, BranchBuild &target) -> void;
  /// Re-evaluates every process of `target` that has not been promoted.
  auto consider_pending(BranchJob &branch, BranchBuild &target) -> void;

  /// Records a manual approval and re-evaluates the process. Fails with
  /// NotFound (process), InvalidArgument (no manual condition, unknown
  /// parameter or value outside its choices), Unauthorized or AlreadyExists.
  [[nodiscard]] auto approve(BranchJob &branch, BranchBuild &target,
                             std::string_view process, std::string_view user,
                             std::vector<ParameterValue> values)
      -> Result<ConsiderOutcome>;

  /// Qualifies without evaluating conditions. On an already qualified
  /// process this schedules another attempt.
  [[nodiscard]] auto force_promotion(BranchJob &branch, BranchBuild &target,
                                     std::string_view process,
                                     std::string_view user)
      -> Result<ConsiderOutcome>;

  /// Another attempt for a qualified process. NotFound for an unknown
  /// process, InvalidState when it never qualified.
  [[nodiscard]] auto rebuild(BranchJob &branch, BranchBuild &target,
                             std::string_view process) -> Result<void>;

  auto on_build_completed(BranchJob &branch, BranchBuild &target) -> void;
  /// Records the attempt on the target before the promotion body runs.
  auto on_promotion_started(BranchBuild &target, const PromotionBuild &build)
      -> void;
  auto on_promotion_completed(BranchJob &branch, const PromotionBuild &build)
      -> void;

  [[nodiscard]] auto progress(BranchJob &branch, const BranchBuild &target,
                              std::string_view process) const
      -> PromotionProgress;
  /// One view per catalog process, in catalog order.
  [[nodiscard]] auto status_views(BranchJob &branch,
                                  const BranchBuild &target) const
      -> std::vector<PromotionStatusView>;

private:
  [[nodiscard]] auto schedule_attempt(BranchJob &branch, BranchBuild &target,
                                      const PromotionProcessDefinition &process,
                                      PromotionStatus &status,
                                      std::string cause) -> ConsiderOutcome;
  auto save(BranchBuild &target) -> void;

  JobScheduler *scheduler_;
  BuildStore *store_;
};

} // namespace matrixforge
