#pragma once

#include "matrixforge/core/error.hpp"
#include "matrixforge/orchestrator/branch_job.hpp"
#include "matrixforge/promotion/extensions.hpp"
#include "matrixforge/util/id.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace matrixforge {

struct BranchConfig {
  JobName name;
  BranchSettings settings;
};

// Reads a branch definition:
//
//   [branch]               name, repository, marker, environment_filter, scm
//   [[parameter]]          name, default, description, choices
//   [[promotion]]          name, display_name, environment
//   [[promotion.condition]] type, even_if_unstable, users, processes,
//                          [[promotion.condition.parameter]], options
//   [[promotion.setup]]    type, includes, excludes, environments, options
//   [[post_build]]         type, commands
//
// Conditions and setup steps are built through `extensions`.
class BranchConfigLoader {
public:
  explicit BranchConfigLoader(const PromotionExtensions &extensions)
      : extensions_(&extensions) {}

  /// A relative repository path is taken relative to the file's directory.
  [[nodiscard]] auto load_from_file(const std::filesystem::path &path,
                                    std::string *diagnostic = nullptr) const
      -> Result<BranchConfig>;
  [[nodiscard]] auto load_from_string(std::string_view toml_str,
                                      const std::filesystem::path &base_dir = {},
                                      std::string *diagnostic = nullptr) const
      -> Result<BranchConfig>;

private:
  const PromotionExtensions *extensions_;
};

} // namespace matrixforge
