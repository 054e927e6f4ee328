#pragma once

#include "matrixforge/orchestrator/branch_job.hpp"
#include "matrixforge/util/id.hpp"

#include <ankerl/unordered_dense.h>

#include <memory>
#include <mutex>
#include <vector>

namespace matrixforge {

// Branches known to this process. Constructed once at startup and passed to
// whoever needs to resolve a branch or one of its builds by name.
class JobRegistry {
public:
  explicit JobRegistry(BranchServices services) : services_(services) {}

  JobRegistry(const JobRegistry &) = delete;
  JobRegistry &operator=(const JobRegistry &) = delete;

  /// AlreadyExists when `name` is registered; InvalidArgument for an empty
  /// or control-character name.
  [[nodiscard]] auto add_branch(JobName name, BranchSettings settings)
      -> Result<std::shared_ptr<BranchJob>>;

  [[nodiscard]] auto find_branch(const JobName &name) const
      -> std::shared_ptr<BranchJob>;
  [[nodiscard]] auto branches() const
      -> std::vector<std::shared_ptr<BranchJob>>;

  /// nullptr when the branch or the build is gone.
  [[nodiscard]] auto find_branch_build(const BuildRef &ref) const
      -> std::shared_ptr<BranchBuild>;

private:
  BranchServices services_;

  mutable std::mutex mutex_;
  ankerl::unordered_dense::map<JobName, std::shared_ptr<BranchJob>> branches_;
};

} // namespace matrixforge
