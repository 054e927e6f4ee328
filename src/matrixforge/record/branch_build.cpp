#include "matrixforge/record/branch_build.hpp"

#include <boost/algorithm/string/predicate.hpp>

#include <algorithm>

namespace matrixforge {

BranchBuild::BranchBuild(BuildRef ref) : BuildRecord(std::move(ref)) {
  promotions_.relink(this);
}

auto BranchBuild::set_environments(std::vector<EnvironmentSet> envs)
    -> Result<void> {
  std::scoped_lock lock(mutex_);
  if (environments_) {
    return fail(Error::InvalidState);
  }
  environments_ = std::move(envs);
  return ok();
}

auto BranchBuild::environments() const -> std::vector<EnvironmentSet> {
  std::scoped_lock lock(mutex_);
  return environments_.value_or(std::vector<EnvironmentSet>{});
}

auto BranchBuild::has_environments() const -> bool {
  std::scoped_lock lock(mutex_);
  return environments_.has_value();
}

auto BranchBuild::set_model(std::shared_ptr<const ProjectModel> model)
    -> void {
  std::scoped_lock lock(mutex_);
  model_ = std::move(model);
}

auto BranchBuild::model() const -> std::shared_ptr<const ProjectModel> {
  std::scoped_lock lock(mutex_);
  return model_;
}

auto BranchBuild::set_scm_vars(std::map<std::string, std::string> vars)
    -> void {
  std::scoped_lock lock(mutex_);
  scm_vars_ = std::move(vars);
}

auto BranchBuild::scm_vars() const -> std::map<std::string, std::string> {
  std::scoped_lock lock(mutex_);
  return scm_vars_;
}

auto BranchBuild::add_approval(ManualApproval approval) -> Result<void> {
  std::scoped_lock lock(mutex_);
  const bool exists = std::ranges::any_of(approvals_, [&](const auto &a) {
    return boost::algorithm::iequals(a.process, approval.process);
  });
  if (exists) {
    return fail(Error::AlreadyExists);
  }
  approvals_.push_back(std::move(approval));
  return ok();
}

auto BranchBuild::approval_for(std::string_view process) const
    -> std::optional<ManualApprovalBadge> {
  std::scoped_lock lock(mutex_);
  auto it = std::ranges::find_if(approvals_, [&](const auto &a) {
    return boost::algorithm::iequals(a.process, process);
  });
  if (it == approvals_.end()) {
    return std::nullopt;
  }
  return it->badge;
}

auto BranchBuild::approvals() const -> std::vector<ManualApproval> {
  std::scoped_lock lock(mutex_);
  return approvals_;
}

} // namespace matrixforge
