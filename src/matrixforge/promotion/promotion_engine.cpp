#include "matrixforge/promotion/promotion_engine.hpp"

#include "matrixforge/orchestrator/branch_job.hpp"
#include "matrixforge/util/log.hpp"

#include <algorithm>
#include <format>
#include <ranges>

namespace matrixforge {

auto PromotionEngine::consider(BranchJob &branch, BranchBuild &target,
                               const PromotionProcessDefinition &process)
    -> ConsiderOutcome {
  if (auto existing = target.promotions().find(process.name)) {
    if (existing->claim_schedule()) {
      return schedule_attempt(branch, target, process, *existing,
                              std::format("Promotion of {}", target.ref()));
    }
    return ConsiderOutcome::AlreadyQualified;
  }

  // Every condition is evaluated, even after one abstained.
  std::vector<PromotionBadge> badges;
  bool qualified = true;
  for (const auto &condition : process.conditions) {
    if (auto badge = condition->evaluate(process, target)) {
      badges.push_back(std::move(*badge));
    } else {
      qualified = false;
    }
  }
  if (!qualified) {
    log::debug("{}: {} does not qualify yet", target.ref(), process.name);
    return ConsiderOutcome::NotQualified;
  }

  auto [status, inserted] = target.promotions().add_if_absent(
      std::make_shared<PromotionStatus>(process.name, std::move(badges)));
  if (!inserted) {
    return ConsiderOutcome::AlreadyQualified;
  }
  log::info("{} qualified for {}", target.ref(), process.display());
  save(target);

  if (!status->claim_schedule()) {
    return ConsiderOutcome::AlreadyQualified;
  }
  return schedule_attempt(branch, target, process, *status,
                          std::format("Promotion of {}", target.ref()));
}

auto PromotionEngine::consider(BranchJob &branch, BranchBuild &target,
                               std::string_view process)
    -> Result<ConsiderOutcome> {
  auto catalog = branch.catalog();
  const auto *def = catalog->find(process);
  if (def == nullptr) {
    return fail(Error::NotFound);
  }
  return ok(consider(branch, target, *def));
}

auto PromotionEngine::consider_all(BranchJob &branch, BranchBuild &target)
    -> void {
  auto catalog = branch.catalog();
  for (const auto &def : catalog->processes()) {
    auto outcome = consider(branch, target, def);
    log::debug("{}: consider {} -> {}", target.ref(), def.name,
               to_string_view(outcome));
  }
}

auto PromotionEngine::consider_pending(BranchJob &branch, BranchBuild &target)
    -> void {
  auto catalog = branch.catalog();
  for (const auto &def : catalog->processes()) {
    auto status = target.promotions().find(def.name);
    if (status && status->is_promotion_successful()) {
      continue;
    }
    auto outcome = consider(branch, target, def);
    log::debug("{}: cascade {} -> {}", target.ref(), def.name,
               to_string_view(outcome));
  }
}

auto PromotionEngine::approve(BranchJob &branch, BranchBuild &target,
                              std::string_view process, std::string_view user,
                              std::vector<ParameterValue> values)
    -> Result<ConsiderOutcome> {
  auto catalog = branch.catalog();
  const auto *def = catalog->find(process);
  if (def == nullptr) {
    return fail(Error::NotFound);
  }
  const auto *manual = def->find_condition<ManualApprovalCondition>();
  if (manual == nullptr) {
    log::warn("{} has no manual approval condition", def->name);
    return fail(Error::InvalidArgument);
  }
  if (!manual->is_allowed(user)) {
    log::warn("{} may not approve {} for {}", user, def->name, target.ref());
    return fail(Error::Unauthorized);
  }

  const auto definitions = manual->effective_parameters(*def, target);
  for (const auto &v : values) {
    auto it = std::ranges::find(definitions, v.name, &ParameterDefinition::name);
    if (it == definitions.end()) {
      log::warn("Unknown parameter '{}' for {}", v.name, def->name);
      return fail(Error::InvalidArgument);
    }
    if (!it->accepts(v.value)) {
      log::warn("'{}' is not a valid value of {}", v.value, v.name);
      return fail(Error::InvalidArgument);
    }
  }
  for (const auto &d : definitions) {
    if (!std::ranges::contains(values, d.name, &ParameterValue::name)) {
      values.push_back({.name = d.name, .value = d.default_value});
    }
  }

  auto added = target.add_approval(
      {.process = def->name,
       .badge = ManualApprovalBadge{.user = std::string(user),
                                    .values = std::move(values)}});
  if (!added) {
    return fail(added.error());
  }
  log::info("{} approved {} for {}", user, def->name, target.ref());
  save(target);
  return ok(consider(branch, target, *def));
}

auto PromotionEngine::force_promotion(BranchJob &branch, BranchBuild &target,
                                      std::string_view process,
                                      std::string_view user)
    -> Result<ConsiderOutcome> {
  auto catalog = branch.catalog();
  const auto *def = catalog->find(process);
  if (def == nullptr) {
    return fail(Error::NotFound);
  }

  auto [status, inserted] =
      target.promotions().add_if_absent(std::make_shared<PromotionStatus>(
          def->name, std::vector<PromotionBadge>{
                         ManualPromotionBadge{.user = std::string(user)}}));
  if (inserted) {
    log::info("{} forced {} for {}", user, def->name, target.ref());
    save(target);
    (void)status->claim_schedule();
  }
  return ok(schedule_attempt(
      branch, target, *def, *status,
      std::format("Promotion of {} forced by {}", target.ref(), user)));
}

auto PromotionEngine::rebuild(BranchJob &branch, BranchBuild &target,
                              std::string_view process) -> Result<void> {
  auto catalog = branch.catalog();
  const auto *def = catalog->find(process);
  if (def == nullptr) {
    return fail(Error::NotFound);
  }
  auto status = target.promotions().find(def->name);
  if (!status) {
    return fail(Error::InvalidState);
  }
  auto outcome = schedule_attempt(branch, target, *def, *status,
                                  std::format("Re-run of {}", def->name));
  if (outcome != ConsiderOutcome::Scheduled) {
    return fail(Error::SchedulingFailure);
  }
  return ok();
}

auto PromotionEngine::schedule_attempt(
    BranchJob &branch, BranchBuild &target,
    const PromotionProcessDefinition &process, PromotionStatus &status,
    std::string cause) -> ConsiderOutcome {
  auto job = branch.promotion_job(process.name);
  if (!job) {
    status.request_schedule();
    return ConsiderOutcome::ScheduleFailed;
  }

  auto parameters = target.parameters();
  for (const auto &badge : status.badges()) {
    if (const auto *approval = std::get_if<ManualApprovalBadge>(&badge)) {
      for (const auto &v : approval->values) {
        parameters.insert_or_assign(v.name, v.value);
      }
    }
  }

  auto handle = scheduler_->schedule(
      job, ScheduleRequest{.cause = std::move(cause),
                           .parent = std::nullopt,
                           .target = target.ref(),
                           .parameters = std::move(parameters)});
  if (!handle) {
    status.request_schedule();
    log::warn("{}: {} of {}", target.ref(),
              make_error_code(Error::SchedulingFailure).message(),
              process.name);
    return ConsiderOutcome::ScheduleFailed;
  }
  return ConsiderOutcome::Scheduled;
}

auto PromotionEngine::on_build_completed(BranchJob &branch, BranchBuild &target)
    -> void {
  consider_all(branch, target);
}

auto PromotionEngine::on_promotion_started(BranchBuild &target,
                                           const PromotionBuild &build)
    -> void {
  auto status = target.promotions().find(build.process());
  if (!status) {
    log::warn("{} started without a qualification record on {}", build.ref(),
              target.ref());
    return;
  }
  status->add_attempt(build.number());
  save(target);
}

auto PromotionEngine::on_promotion_completed(BranchJob &branch,
                                             const PromotionBuild &build)
    -> void {
  if (build.result() != BuildResult::Success) {
    return;
  }
  auto target = branch.find_build(build.target().number);
  if (!target) {
    return;
  }
  auto status = target->promotions().find(build.process());
  if (!status || !status->mark_successful(build.number())) {
    return;
  }
  log::info("{} promoted by {}", target->ref(), build.ref());
  save(*target);
  consider_pending(branch, *target);
}

auto PromotionEngine::progress(BranchJob &branch, const BranchBuild &target,
                               std::string_view process) const
    -> PromotionProgress {
  auto status = target.promotions().find(process);
  if (!status) {
    return PromotionProgress::NotAttempted;
  }
  if (status->is_promotion_successful()) {
    return PromotionProgress::Promoted;
  }
  auto job = branch.promotion_job(process);
  if (job) {
    auto items = scheduler_->items_for(job->name());
    if (std::ranges::any_of(items, [&](const QueueItem &item) {
          return item.request.target == target.ref();
        })) {
      return PromotionProgress::Queued;
    }
  }
  auto attempts = status->attempts();
  if (attempts.empty()) {
    return PromotionProgress::NotAttempted;
  }
  auto last = job ? job->find_build(attempts.back()) : nullptr;
  if (last && last->is_building()) {
    return PromotionProgress::Building;
  }
  return PromotionProgress::Failed;
}

auto PromotionEngine::status_views(BranchJob &branch,
                                   const BranchBuild &target) const
    -> std::vector<PromotionStatusView> {
  std::vector<PromotionStatusView> out;
  auto catalog = branch.catalog();
  for (const auto &def : catalog->processes()) {
    PromotionStatusView view{.process = def.name,
                             .display_name = def.display(),
                             .progress = progress(branch, target, def.name)};
    view.status = target.promotions().find(def.name);
    if (view.status) {
      auto job = branch.promotion_job(def.name);
      for (int number : view.status->attempts()) {
        auto build = job ? job->find_build(number) : nullptr;
        if (!build) {
          continue;
        }
        view.last = build;
        if (build->is_building()) {
          continue;
        }
        if (build->result() == BuildResult::Success) {
          view.last_successful = build;
        } else {
          view.last_failed = build;
        }
      }
    }
    out.push_back(std::move(view));
  }
  return out;
}

auto PromotionEngine::save(BranchBuild &target) -> void {
  if (auto r = store_->save(target); !r) {
    log::error("Failed to save {}: {}", target.ref(), r.error().message());
  }
}

} // namespace matrixforge
