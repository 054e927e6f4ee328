#pragma once

#include "matrixforge/record/build_record.hpp"

#include <filesystem>
#include <string>

namespace matrixforge {

// One execution of a promotion process. The target is held by reference
// (job, number) and may no longer resolve.
class PromotionBuild final : public BuildRecord {
public:
  PromotionBuild(BuildRef ref, std::string process, BuildRef target)
      : BuildRecord(std::move(ref)), process_(std::move(process)),
        target_(std::move(target)) {}

  [[nodiscard]] auto process() const noexcept -> const std::string & {
    return process_;
  }
  [[nodiscard]] auto target() const noexcept -> const BuildRef & {
    return target_;
  }

  auto set_workspace(std::filesystem::path dir) -> void {
    std::scoped_lock lock(mutex_);
    workspace_ = std::move(dir);
  }
  [[nodiscard]] auto workspace() const -> std::filesystem::path {
    std::scoped_lock lock(mutex_);
    return workspace_;
  }

private:
  std::string process_;
  BuildRef target_;

  mutable std::mutex mutex_;
  std::filesystem::path workspace_;
};

} // namespace matrixforge
