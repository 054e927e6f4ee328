#pragma once

#include "matrixforge/core/coroutine.hpp"
#include "matrixforge/executor/executor.hpp"
#include "matrixforge/model/build_result.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace matrixforge {

class BranchBuild;

struct PostBuildContext {
  BranchBuild &build;
  IExecutor &executor;
  /// Working directory, timeout and environment for any command the step
  /// runs.
  ShellCommand base;
};

// Step run on the branch build after every environment has finished. A
// result worse than Success makes the branch build fail.
class IPostBuildStep {
public:
  virtual ~IPostBuildStep() = default;

  [[nodiscard]] virtual auto kind() const -> std::string_view = 0;
  [[nodiscard]] virtual auto perform(PostBuildContext &ctx) const
      -> task<BuildResult> = 0;
};

class ShellPostBuildStep final : public IPostBuildStep {
public:
  explicit ShellPostBuildStep(std::vector<std::string> commands)
      : commands_(std::move(commands)) {}

  [[nodiscard]] auto kind() const -> std::string_view override {
    return "shell";
  }
  [[nodiscard]] auto perform(PostBuildContext &ctx) const
      -> task<BuildResult> override;

  [[nodiscard]] auto commands() const noexcept
      -> const std::vector<std::string> & {
    return commands_;
  }

private:
  std::vector<std::string> commands_;
};

} // namespace matrixforge
