#include "matrixforge/orchestrator/environment_job.hpp"

#include "matrixforge/executor/build_steps.hpp"
#include "matrixforge/executor/executor_utils.hpp"
#include "matrixforge/util/glob.hpp"
#include "matrixforge/util/log.hpp"

#include <format>
#include <ranges>

namespace matrixforge {

EnvironmentJob::EnvironmentJob(JobName branch, EnvironmentSet environment,
                               ParentLookup parent_lookup, IExecutor &executor,
                               BuildStore &store)
    : branch_(std::move(branch)), environment_(std::move(environment)),
      name_(job_name(branch_, environment_)),
      parent_lookup_(std::move(parent_lookup)), executor_(&executor),
      store_(&store) {}

auto EnvironmentJob::job_name(const JobName &branch, const EnvironmentSet &env)
    -> JobName {
  return JobName{std::format("{}/{}", branch, env)};
}

auto EnvironmentJob::configure(EnvironmentJobSettings settings) -> void {
  std::scoped_lock lock(mutex_);
  settings_ = std::move(settings);
}

auto EnvironmentJob::settings() const -> EnvironmentJobSettings {
  std::scoped_lock lock(mutex_);
  return settings_;
}

auto EnvironmentJob::restore(
    std::vector<std::shared_ptr<EnvironmentBuild>> builds) -> void {
  std::scoped_lock lock(mutex_);
  for (auto &b : builds) {
    builds_.insert_or_assign(b->number(), std::move(b));
  }
}

auto EnvironmentJob::build_by_number(int number) const
    -> std::shared_ptr<BuildRecord> {
  return find_build(number);
}

auto EnvironmentJob::find_build(int number) const
    -> std::shared_ptr<EnvironmentBuild> {
  std::scoped_lock lock(mutex_);
  auto it = builds_.find(number);
  return it == builds_.end() ? nullptr : it->second;
}

auto EnvironmentJob::builds() const
    -> std::vector<std::shared_ptr<EnvironmentBuild>> {
  std::scoped_lock lock(mutex_);
  return builds_ | std::views::values | std::ranges::to<std::vector>();
}

auto EnvironmentJob::create_build(const QueueItem &item)
    -> Result<std::shared_ptr<BuildRecord>> {
  if (!item.request.parent) {
    log::error("{}: environment builds need a parent build", name_);
    return fail(Error::InvalidArgument);
  }
  const int number = item.request.parent->number;

  std::scoped_lock lock(mutex_);
  if (auto it = builds_.find(number);
      it != builds_.end() && it->second->is_building()) {
    return fail(Error::AlreadyExists);
  }
  auto build = std::make_shared<EnvironmentBuild>(
      BuildRef{.job = name_, .number = number}, environment_,
      item.request.parent);
  build->set_parameters(item.request.parameters);
  build->console().println("{}", item.request.cause);
  builds_.insert_or_assign(number, build);
  return ok(std::static_pointer_cast<BuildRecord>(std::move(build)));
}

auto EnvironmentJob::perform(std::shared_ptr<BuildRecord> record)
    -> task<BuildResult> {
  auto build = std::dynamic_pointer_cast<EnvironmentBuild>(record);
  if (!build) {
    co_return BuildResult::Failure;
  }
  auto &console = build->console();

  auto parent = parent_lookup_ ? parent_lookup_(build->number()) : nullptr;
  auto model = parent ? parent->model() : nullptr;
  if (!model) {
    console.error("Parent build {} #{} has no build description", branch_,
                  build->number());
    build->set_error(make_error_code(Error::ModelBuildError));
    co_return BuildResult::Failure;
  }
  auto commands = model->build_command_for(environment_);
  if (!commands) {
    console.error("No build command for {}", environment_);
    build->set_error(make_error_code(Error::NoBuildForEnvironment));
    co_return BuildResult::Failure;
  }

  const auto cfg = settings();
  auto workspace = prepare_workspace(*build, cfg.repository);
  if (!workspace) {
    console.error("Cannot prepare workspace: {}", workspace.error().message());
    co_return BuildResult::Failure;
  }

  ShellCommand base{.command = {},
                    .working_dir = workspace->string(),
                    .timeout = cfg.timeout,
                    .env = {}};
  export_env(base.env, parent->scm_vars());
  export_env(base.env, build->parameters());
  base.env.insert_or_assign("MATRIXFORGE_ENVIRONMENT",
                            environment_.canonical_name());
  base.env.insert_or_assign("BUILD_NUMBER", std::to_string(build->number()));
  base.env.insert_or_assign("BUILD_ID", build->id());
  base.env.insert_or_assign("JOB_NAME", name_.str());

  console.println("Building {}", environment_);
  auto result = co_await run_build_steps(*executor_, *build, *commands, base);
  if (result == BuildResult::Success && !model->artifacts().empty()) {
    archive(*build, model->artifacts(), *workspace);
  }
  co_return result;
}

auto EnvironmentJob::prepare_workspace(EnvironmentBuild &build,
                                       const std::filesystem::path &repository)
    -> Result<std::filesystem::path> {
  namespace fs = std::filesystem;
  const auto workspace =
      store_->environment_build_dir(branch_, environment_, build.number()) /
      "workspace";
  std::error_code ec;
  fs::remove_all(workspace, ec);
  if (!ec) {
    fs::create_directories(workspace, ec);
  }
  if (ec) {
    return fail(ec);
  }
  build.set_workspace(workspace);
  if (repository.empty()) {
    return ok(workspace);
  }

  std::vector<std::string> excludes{".git/**"};
  const auto source = fs::weakly_canonical(repository, ec);
  if (ec) {
    return fail(ec);
  }
  const auto nested =
      fs::weakly_canonical(store_->root(), ec).lexically_relative(source);
  if (!ec && !nested.empty() && *nested.begin() != "..") {
    excludes.push_back(
        (nested / "branches").lexically_normal().generic_string() + "/**");
  }
  auto copied = util::copy_matching(source, workspace, {"**"}, excludes);
  if (!copied) {
    return fail(copied.error());
  }
  build.console().println("Workspace {} ({} files)", workspace.string(),
                          copied->size());
  return ok(workspace);
}

auto EnvironmentJob::archive(EnvironmentBuild &build,
                             const std::vector<std::string> &patterns,
                             const std::filesystem::path &from) -> void {
  const auto dir = store_->environment_build_dir(branch_, environment_,
                                                 build.number()) /
                   "archive";
  auto copied = util::copy_matching(
      from.empty() ? std::filesystem::path(".") : from, dir, patterns, {});
  if (!copied) {
    build.console().warn("Archiving artifacts failed: {}",
                         copied.error().message());
    return;
  }
  build.console().println("Archived {} files", copied->size());
  build.set_archive_dir(dir);
  build.set_artifacts(std::move(*copied));
}

auto EnvironmentJob::on_completed(const std::shared_ptr<BuildRecord> &record)
    -> void {
  auto build = std::dynamic_pointer_cast<EnvironmentBuild>(record);
  if (!build) {
    return;
  }
  if (auto r = store_->save(branch_, *build); !r) {
    log::error("Failed to save {}: {}", build->ref(), r.error().message());
  }
}

} // namespace matrixforge
