#include "matrixforge/promotion/promotion_job.hpp"

#include "matrixforge/executor/build_steps.hpp"
#include "matrixforge/executor/executor_utils.hpp"
#include "matrixforge/orchestrator/branch_job.hpp"
#include "matrixforge/promotion/promotion_engine.hpp"
#include "matrixforge/promotion/setup_step.hpp"
#include "matrixforge/util/log.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <system_error>

namespace matrixforge {

PromotionJob::PromotionJob(BranchJob &branch, std::string process)
    : branch_(&branch), process_(std::move(process)),
      name_(job_name(branch.name(), process_)) {}

auto PromotionJob::job_name(const JobName &branch, std::string_view process)
    -> JobName {
  return JobName{std::format("{}/promotion/{}", branch, process)};
}

auto PromotionJob::restore(std::vector<std::shared_ptr<PromotionBuild>> builds,
                           int next_number) -> void {
  std::scoped_lock lock(mutex_);
  for (auto &b : builds) {
    next_number_ = std::max(next_number_, b->number() + 1);
    builds_.insert_or_assign(b->number(), std::move(b));
  }
  next_number_ = std::max(next_number_, next_number);
}

auto PromotionJob::find_build(int number) const
    -> std::shared_ptr<PromotionBuild> {
  std::scoped_lock lock(mutex_);
  auto it = builds_.find(number);
  return it == builds_.end() ? nullptr : it->second;
}

auto PromotionJob::builds() const
    -> std::vector<std::shared_ptr<PromotionBuild>> {
  std::scoped_lock lock(mutex_);
  return builds_ | std::views::values | std::ranges::to<std::vector>();
}

auto PromotionJob::create_build(const QueueItem &item)
    -> Result<std::shared_ptr<BuildRecord>> {
  if (!item.request.target) {
    log::error("{}: promotion builds need a target", name_);
    return fail(Error::InvalidArgument);
  }

  std::shared_ptr<PromotionBuild> build;
  int next = 0;
  {
    std::scoped_lock lock(mutex_);
    const int number = next_number_++;
    next = next_number_;
    build = std::make_shared<PromotionBuild>(
        BuildRef{.job = name_, .number = number}, process_,
        *item.request.target);
    build->set_parameters(item.request.parameters);
    build->console().println("{}", item.request.cause);
    builds_.emplace(number, build);
  }

  auto &store = branch_->services().store;
  if (auto r = store.save_next_build_number(
          store.promotion_dir(branch_->name(), process_), next);
      !r) {
    log::warn("Failed to persist next build number of {}: {}", name_,
              r.error().message());
  }
  return ok(std::static_pointer_cast<BuildRecord>(std::move(build)));
}

auto PromotionJob::perform(std::shared_ptr<BuildRecord> record)
    -> task<BuildResult> {
  auto build = std::dynamic_pointer_cast<PromotionBuild>(record);
  if (!build) {
    co_return BuildResult::Failure;
  }
  auto &console = build->console();
  auto &services = branch_->services();

  auto target = build->target().job == branch_->name()
                    ? branch_->find_build(build->target().number)
                    : nullptr;
  if (!target) {
    console.error("{}: {}", build->target(),
                  make_error_code(Error::TargetMissing).message());
    build->set_error(make_error_code(Error::TargetMissing));
    co_return BuildResult::Failure;
  }

  auto catalog = branch_->catalog();
  const auto *def = catalog->find(process_);
  if (def == nullptr) {
    console.error("Promotion process {} is no longer defined", process_);
    co_return BuildResult::Failure;
  }

  services.engine.on_promotion_started(*target, *build);

  auto model = target->model();
  if (!model) {
    console.error("{} has no build description", target->ref());
    co_return BuildResult::Failure;
  }
  auto task_cmd = model->task_command(def->name);
  if (!task_cmd || task_cmd->commands.empty()) {
    console.println("{} does not specify any tasks for the {} ({}) promotion",
                    target->ref(), def->display(), def->name);
    co_return BuildResult::NotBuilt;
  }

  console.println("Promoting {}", target->ref());

  auto workspace =
      services.store.promotion_build_dir(branch_->name(), process_,
                                         build->number()) /
      "workspace";
  std::error_code ec;
  std::filesystem::create_directories(workspace, ec);
  if (ec) {
    console.error("Cannot create workspace {}: {}", workspace.string(),
                  ec.message());
    co_return BuildResult::Failure;
  }
  build->set_workspace(workspace);

  SetupContext ctx{.build = *build,
                   .target = *target,
                   .environment_builds =
                       branch_->environment_builds(target->number()),
                   .workspace = workspace};
  for (const auto &setup : def->setups) {
    if (build->is_interrupted()) {
      co_return BuildResult::Aborted;
    }
    if (auto r = setup->setup(ctx); !r) {
      console.error("{} failed setup: {}", setup->kind(), r.error().message());
      build->set_error(make_error_code(Error::SetupStepFailure));
      co_return BuildResult::Failure;
    }
  }

  ShellCommand base{.command = {},
                    .working_dir = workspace.string(),
                    .timeout = services.command_timeout,
                    .env = promotion_env(*target, *def, *build)};
  co_return co_await run_build_steps(services.executor, *build,
                                     task_cmd->commands, std::move(base));
}

auto PromotionJob::promotion_env(const BranchBuild &target,
                                 const PromotionProcessDefinition &process,
                                 const PromotionBuild &build) const
    -> std::map<std::string, std::string> {
  std::map<std::string, std::string> env;
  export_env(env, build.parameters());

  const auto full_name = target.job().str();
  const auto slash = full_name.rfind('/');
  env.insert_or_assign("PROMOTED_JOB_NAME", slash == std::string::npos
                                                ? full_name
                                                : full_name.substr(slash + 1));
  env.insert_or_assign("PROMOTED_JOB_FULL_NAME", full_name);
  env.insert_or_assign("PROMOTED_NUMBER", std::to_string(target.number()));
  env.insert_or_assign("PROMOTED_ID", target.id());
  export_env(env, target.scm_vars(), "PROMOTED_");

  if (auto status = target.promotions().find(process.name)) {
    status->contribute_env(env);
  }
  env.insert_or_assign("PROMOTION_NAME", process.name);
  if (process.environment) {
    if (auto text = format_environment_constraint(*process.environment)) {
      env.insert_or_assign("PROMOTION_ENVIRONMENT", *text);
    }
  }
  env.insert_or_assign("BUILD_NUMBER", std::to_string(build.number()));
  env.insert_or_assign("JOB_NAME", name_.str());
  return env;
}

auto PromotionJob::on_completed(const std::shared_ptr<BuildRecord> &record)
    -> void {
  auto build = std::dynamic_pointer_cast<PromotionBuild>(record);
  if (!build) {
    return;
  }
  auto &services = branch_->services();
  if (auto r = services.store.save(branch_->name(), *build); !r) {
    log::error("Failed to save {}: {}", build->ref(), r.error().message());
  }
  services.engine.on_promotion_completed(*branch_, *build);
}

} // namespace matrixforge
