#include "matrixforge/orchestrator/branch_job.hpp"

#include "matrixforge/executor/executor_utils.hpp"
#include "matrixforge/promotion/promotion_engine.hpp"
#include "matrixforge/util/log.hpp"

#include <boost/algorithm/string/case_conv.hpp>

#include <algorithm>
#include <format>
#include <ranges>

namespace matrixforge {

BranchJob::BranchJob(JobName name, BranchSettings settings,
                     BranchServices services)
    : name_(std::move(name)), services_(services),
      settings_(std::make_shared<const BranchSettings>(std::move(settings))) {}

auto BranchJob::settings() const -> std::shared_ptr<const BranchSettings> {
  return settings_.load(std::memory_order_acquire);
}

auto BranchJob::configure(BranchSettings settings) -> void {
  std::scoped_lock lock(settings_mutex_);
  auto next = std::make_shared<const BranchSettings>(std::move(settings));
  const auto env_settings = environment_settings(*next);
  settings_.store(next, std::memory_order_release);
  for (const auto &env : environments_.active_sets()) {
    if (auto job = environments_.find(env)) {
      job->configure(env_settings);
    }
  }
  log::info("Reconfigured {}", name_);
}

auto BranchJob::load() -> Result<void> {
  auto &store = services_.store;

  auto next = store.load_next_build_number(store.branch_dir(name_));
  if (!next) {
    return fail(next.error());
  }
  auto loaded = store.load_branch_builds(name_);
  if (!loaded) {
    return fail(loaded.error());
  }
  const auto loaded_count = loaded->size();
  {
    std::scoped_lock lock(mutex_);
    next_build_number_ = std::max(next_build_number_, *next);
    for (auto &build : *loaded) {
      next_build_number_ = std::max(next_build_number_, build->number() + 1);
      builds_.insert_or_assign(build->number(), std::move(build));
    }
  }

  auto entries = store.load_environment_entries(name_);
  if (!entries) {
    return fail(entries.error());
  }
  const auto env_settings = environment_settings(*settings());
  for (const auto &entry : *entries) {
    auto job = make_environment_job(entry.environment);
    job->configure(env_settings);
    auto env_builds =
        store.load_environment_builds(name_, job->name(), entry.environment);
    if (!env_builds) {
      return fail(env_builds.error());
    }
    job->restore(std::move(*env_builds));
    if (!environments_.restore(entry.environment, std::move(job),
                               entry.active)) {
      log::warn("{}: duplicate environment entry {}", name_,
                entry.environment);
    }
  }

  for (const auto &def : catalog()->processes()) {
    auto job = promotion_job(def.name);
    auto promotion_builds = store.load_promotion_builds(name_, job->name(),
                                                        def.name);
    if (!promotion_builds) {
      return fail(promotion_builds.error());
    }
    auto promotion_next =
        store.load_next_build_number(store.promotion_dir(name_, def.name));
    if (!promotion_next) {
      return fail(promotion_next.error());
    }
    job->restore(std::move(*promotion_builds), *promotion_next);
  }

  log::info("Loaded {}: {} builds, {} environments", name_, loaded_count,
            environments_.size());
  return ok();
}

auto BranchJob::find_build(int number) const -> std::shared_ptr<BranchBuild> {
  std::scoped_lock lock(mutex_);
  auto it = builds_.find(number);
  return it == builds_.end() ? nullptr : it->second;
}

auto BranchJob::builds() const -> std::vector<std::shared_ptr<BranchBuild>> {
  std::scoped_lock lock(mutex_);
  return builds_ | std::views::values | std::ranges::to<std::vector>();
}

auto BranchJob::last_build() const -> std::shared_ptr<BranchBuild> {
  std::scoped_lock lock(mutex_);
  return builds_.empty() ? nullptr : builds_.rbegin()->second;
}

auto BranchJob::next_build_number() const -> int {
  std::scoped_lock lock(mutex_);
  return next_build_number_;
}

auto BranchJob::environment_builds(int number) const
    -> std::vector<std::shared_ptr<const EnvironmentBuild>> {
  std::vector<std::shared_ptr<const EnvironmentBuild>> out;
  auto build = find_build(number);
  if (!build || !build->has_environments()) {
    return out;
  }
  for (const auto &env : build->environments()) {
    auto job = environments_.find(env);
    if (!job) {
      continue;
    }
    if (auto env_build = job->find_build(number)) {
      out.push_back(std::move(env_build));
    }
  }
  return out;
}

auto BranchJob::promotion_job(std::string_view process)
    -> std::shared_ptr<PromotionJob> {
  auto cat = catalog();
  const auto *def = cat->find(process);
  if (def == nullptr) {
    return nullptr;
  }
  auto key = boost::algorithm::to_lower_copy(def->name);
  std::scoped_lock lock(mutex_);
  auto [it, inserted] = promotion_jobs_.try_emplace(std::move(key));
  if (inserted) {
    it->second = std::make_shared<PromotionJob>(*this, def->name);
  }
  return it->second;
}

auto BranchJob::create_build(const QueueItem &item)
    -> Result<std::shared_ptr<BuildRecord>> {
  auto cfg = settings();
  std::shared_ptr<BranchBuild> build;
  int next = 0;
  {
    std::scoped_lock lock(mutex_);
    const int number = next_build_number_++;
    next = next_build_number_;
    build = std::make_shared<BranchBuild>(
        BuildRef{.job = name_, .number = number});
    builds_.emplace(number, build);
  }
  build->set_parameters(item.request.parameters);
  build->set_scm_vars(cfg->scm);
  build->console().println("{}", item.request.cause);

  if (auto r = services_.store.save_next_build_number(
          services_.store.branch_dir(name_), next);
      !r) {
    log::warn("Failed to persist next build number of {}: {}", name_,
              r.error().message());
  }
  return ok(std::static_pointer_cast<BuildRecord>(std::move(build)));
}

auto BranchJob::perform(std::shared_ptr<BuildRecord> record)
    -> task<BuildResult> {
  auto build = std::dynamic_pointer_cast<BranchBuild>(record);
  if (!build) {
    co_return BuildResult::Failure;
  }
  auto &console = build->console();
  const auto cfg = settings();

  console.println("Parsing build description...");
  std::string diagnostic;
  auto model = services_.model_source.resolve(
      cfg->repository, ModelRequest{.marker = cfg->marker}, &diagnostic);
  if (!model) {
    console.error("{}", diagnostic);
    build->set_error(model.error());
    co_return BuildResult::Failure;
  }
  build->set_model(*model);

  auto parameters = build->parameters();
  apply_parameter_defaults(parameters, cfg->parameters);
  apply_parameter_defaults(parameters, (*model)->parameters());
  build->set_parameters(parameters);

  auto envs =
      FanOutOrchestrator::prepare(**model, cfg->environment_filter, console);
  if (!envs) {
    build->set_error(envs.error());
    co_return BuildResult::Failure;
  }
  if (auto r = build->set_environments(*envs); !r) {
    build->set_error(r.error());
    co_return BuildResult::Failure;
  }
  if (auto r = services_.store.save(*build); !r) {
    log::warn("Failed to save {}: {}", build->ref(), r.error().message());
  }

  const auto env_settings = environment_settings(*cfg);
  auto jobs = environments_.reconcile(
      *envs,
      [this](const EnvironmentSet &env) { return make_environment_job(env); },
      [&env_settings](EnvironmentJob &job) { job.configure(env_settings); });
  persist_environments();

  std::vector<std::shared_ptr<IChildJob>> children(jobs.begin(), jobs.end());
  FanOutOrchestrator fan_out(services_.scheduler, services_.fan_out);
  auto result = co_await fan_out.run(*build, children, parameters);

  if (!cfg->post_build.empty() && !build->is_interrupted()) {
    result = combine(result, co_await run_post_build(*build, *cfg, parameters));
  }
  co_return result;
}

auto BranchJob::run_post_build(BranchBuild &build,
                               const BranchSettings &settings,
                               const Parameters &parameters)
    -> task<BuildResult> {
  ShellCommand base{.command = {},
                    .working_dir = settings.repository.string(),
                    .timeout = services_.command_timeout,
                    .env = {}};
  export_env(base.env, settings.scm);
  export_env(base.env, parameters);
  base.env.insert_or_assign("BUILD_NUMBER", std::to_string(build.number()));
  base.env.insert_or_assign("BUILD_ID", build.id());
  base.env.insert_or_assign("JOB_NAME", name_.str());

  PostBuildContext ctx{.build = build,
                       .executor = services_.executor,
                       .base = std::move(base)};
  for (const auto &step : settings.post_build) {
    build.console().println("Running post-build step: {}", step->kind());
    auto result = co_await step->perform(ctx);
    if (result != BuildResult::Success) {
      build.console().error("Post-build step {} failed", step->kind());
      co_return BuildResult::Failure;
    }
  }
  co_return BuildResult::Success;
}

auto BranchJob::on_completed(const std::shared_ptr<BuildRecord> &record)
    -> void {
  auto build = std::dynamic_pointer_cast<BranchBuild>(record);
  if (!build) {
    return;
  }
  if (auto r = services_.store.save(*build); !r) {
    log::error("Failed to save {}: {}", build->ref(), r.error().message());
  }
  services_.engine.on_build_completed(*this, *build);
}

auto BranchJob::make_environment_job(const EnvironmentSet &env)
    -> std::shared_ptr<EnvironmentJob> {
  return std::make_shared<EnvironmentJob>(
      name_, env,
      [this](int number) -> std::shared_ptr<const BranchBuild> {
        return find_build(number);
      },
      services_.executor, services_.store);
}

auto BranchJob::environment_settings(const BranchSettings &settings) const
    -> EnvironmentJobSettings {
  return EnvironmentJobSettings{.repository = settings.repository,
                                .timeout = services_.command_timeout};
}

auto BranchJob::persist_environments() -> void {
  for (const auto &[env, entry] : *environments_.snapshot()) {
    if (auto r = services_.store.save_environment_entry(
            name_, EnvironmentEntry{.environment = env, .active = entry.active});
        !r) {
      log::warn("Failed to save environment {} of {}: {}", env, name_,
                r.error().message());
    }
  }
}

} // namespace matrixforge
