#pragma once

#include "matrixforge/core/error.hpp"
#include "matrixforge/environment/environment_set.hpp"
#include "matrixforge/record/branch_build.hpp"
#include "matrixforge/record/environment_build.hpp"
#include "matrixforge/record/promotion_build.hpp"
#include "matrixforge/util/id.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <string_view>
#include <utility>
#include <vector>

namespace matrixforge {

struct EnvironmentEntry {
  EnvironmentSet environment;
  bool active{true};
};

// JSON persistence of build records under one root directory:
//
//   branches/<branch>/job.json
//   branches/<branch>/builds/<n>/build.json
//   branches/<branch>/environments/<env dir>/environment.json
//   branches/<branch>/environments/<env dir>/builds/<n>/build.json
//   branches/<branch>/promotions/<process>/builds/<n>/build.json
//
// Names are percent-encoded into single path components. Files are replaced
// atomically (write to a temporary, then rename).
class BuildStore {
public:
  explicit BuildStore(std::filesystem::path root);

  [[nodiscard]] auto root() const noexcept -> const std::filesystem::path & {
    return root_;
  }

  [[nodiscard]] auto branch_dir(const JobName &branch) const
      -> std::filesystem::path;
  [[nodiscard]] auto environment_dir(const JobName &branch,
                                     const EnvironmentSet &env) const
      -> std::filesystem::path;
  [[nodiscard]] auto environment_build_dir(const JobName &branch,
                                           const EnvironmentSet &env,
                                           int number) const
      -> std::filesystem::path;
  [[nodiscard]] auto promotion_dir(const JobName &branch,
                                   std::string_view process) const
      -> std::filesystem::path;
  [[nodiscard]] auto promotion_build_dir(const JobName &branch,
                                         std::string_view process,
                                         int number) const
      -> std::filesystem::path;

  [[nodiscard]] auto save(const BranchBuild &build) -> Result<void>;
  [[nodiscard]] auto save(const JobName &branch, const EnvironmentBuild &build)
      -> Result<void>;
  [[nodiscard]] auto save(const JobName &branch, const PromotionBuild &build)
      -> Result<void>;

  [[nodiscard]] auto save_next_build_number(const std::filesystem::path &dir,
                                            int next) -> Result<void>;
  /// 1 when nothing was saved yet.
  [[nodiscard]] auto load_next_build_number(const std::filesystem::path &dir)
      -> Result<int>;

  [[nodiscard]] auto save_environment_entry(const JobName &branch,
                                            const EnvironmentEntry &entry)
      -> Result<void>;
  [[nodiscard]] auto load_environment_entries(const JobName &branch)
      -> Result<std::vector<EnvironmentEntry>>;

  /// Builds still running when saved come back Completed/Aborted. Promotion
  /// statuses are relinked to the loaded build.
  [[nodiscard]] auto load_branch_builds(const JobName &branch)
      -> Result<std::vector<std::shared_ptr<BranchBuild>>>;
  [[nodiscard]] auto load_environment_builds(const JobName &branch,
                                             const JobName &job,
                                             const EnvironmentSet &env)
      -> Result<std::vector<std::shared_ptr<EnvironmentBuild>>>;
  [[nodiscard]] auto load_promotion_builds(const JobName &branch,
                                           const JobName &job,
                                           std::string_view process)
      -> Result<std::vector<std::shared_ptr<PromotionBuild>>>;

private:
  std::filesystem::path root_;
  std::mutex write_mutex_;
};

} // namespace matrixforge
