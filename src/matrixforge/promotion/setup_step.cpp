#include "matrixforge/promotion/setup_step.hpp"

#include "matrixforge/record/branch_build.hpp"
#include "matrixforge/record/environment_build.hpp"
#include "matrixforge/record/promotion_build.hpp"
#include "matrixforge/util/glob.hpp"

#include <system_error>

namespace matrixforge {

namespace fs = std::filesystem;

RestoreArchivedFiles::RestoreArchivedFiles(
    std::string includes, std::string excludes,
    std::optional<EnvironmentConstraint> environments)
    : includes_(std::move(includes)), excludes_(std::move(excludes)),
      environments_(std::move(environments)) {}

auto RestoreArchivedFiles::setup(SetupContext &ctx) const -> Result<void> {
  auto &console = ctx.build.console();
  console.println("Restoring archived files from {}", ctx.target.ref());

  auto includes = util::split_patterns(includes_);
  if (includes.empty()) {
    includes.emplace_back("**/*");
  }
  const auto excludes = util::split_patterns(excludes_);

  for (const auto &env_build : ctx.environment_builds) {
    const auto &env = env_build->environment();
    if (environments_ && !env.matches(*environments_)) {
      console.println("Ignoring archived files from {}", env_build->ref());
      continue;
    }
    const auto dir = env_build->archive_dir();
    std::error_code ec;
    if (dir.empty() || !fs::exists(dir, ec)) {
      console.println("No archived files in {}", env_build->ref());
      continue;
    }
    console.println("Copying archived files from {}", env_build->ref());
    auto copied = util::copy_matching(dir, ctx.workspace, includes, excludes);
    if (!copied) {
      console.error("Failed to copy archived files from {}: {}",
                    env_build->ref(), copied.error().message());
      return fail(Error::SetupStepFailure);
    }
    console.println("Copied {} archived files from {}", copied->size(),
                    env_build->ref());
  }
  return ok();
}

} // namespace matrixforge
