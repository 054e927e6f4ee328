#pragma once

#include "matrixforge/core/coroutine.hpp"
#include "matrixforge/executor/executor.hpp"
#include "matrixforge/model/build_result.hpp"
#include "matrixforge/record/build_record.hpp"

#include <string>
#include <vector>

namespace matrixforge {

/// Runs `commands` one after another through `executor`, streaming output
/// into the build console. Stops at the first non-zero exit (Failure) or
/// when the build is interrupted (Aborted); the running process is killed on
/// interruption.
[[nodiscard]] auto run_build_steps(IExecutor &executor, BuildRecord &build,
                                   const std::vector<std::string> &commands,
                                   ShellCommand base) -> task<BuildResult>;

} // namespace matrixforge
