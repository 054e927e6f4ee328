#include "matrixforge/orchestrator/post_build.hpp"

#include "matrixforge/executor/build_steps.hpp"
#include "matrixforge/record/branch_build.hpp"

namespace matrixforge {

auto ShellPostBuildStep::perform(PostBuildContext &ctx) const
    -> task<BuildResult> {
  co_return co_await run_build_steps(ctx.executor, ctx.build, commands_,
                                     ctx.base);
}

} // namespace matrixforge
