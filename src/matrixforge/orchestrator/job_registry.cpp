#include "matrixforge/orchestrator/job_registry.hpp"

#include "matrixforge/util/log.hpp"

#include <algorithm>
#include <ranges>

namespace matrixforge {

auto JobRegistry::add_branch(JobName name, BranchSettings settings)
    -> Result<std::shared_ptr<BranchJob>> {
  if (!is_valid_id_text(name.value())) {
    return fail(Error::InvalidArgument);
  }
  std::scoped_lock lock(mutex_);
  if (branches_.contains(name)) {
    log::warn("Branch {} is already registered", name);
    return fail(Error::AlreadyExists);
  }
  auto job = std::make_shared<BranchJob>(name, std::move(settings), services_);
  branches_.emplace(std::move(name), job);
  return ok(std::move(job));
}

auto JobRegistry::find_branch(const JobName &name) const
    -> std::shared_ptr<BranchJob> {
  std::scoped_lock lock(mutex_);
  auto it = branches_.find(name);
  return it == branches_.end() ? nullptr : it->second;
}

auto JobRegistry::branches() const -> std::vector<std::shared_ptr<BranchJob>> {
  std::scoped_lock lock(mutex_);
  auto out = branches_ | std::views::values | std::ranges::to<std::vector>();
  std::ranges::sort(out, {}, [](const auto &b) { return b->name(); });
  return out;
}

auto JobRegistry::find_branch_build(const BuildRef &ref) const
    -> std::shared_ptr<BranchBuild> {
  auto branch = find_branch(ref.job);
  return branch ? branch->find_build(ref.number) : nullptr;
}

} // namespace matrixforge
