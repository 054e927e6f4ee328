#include "matrixforge/storage/build_store.hpp"
#include "matrixforge/util/json.hpp"
#include "matrixforge/util/log.hpp"
#include "matrixforge/util/time.hpp"
#include "matrixforge/util/url.hpp"

#include <glaze/json.hpp>

#include <algorithm>
#include <charconv>
#include <ranges>
#include <system_error>

namespace matrixforge {

namespace persistence_dto {

struct BuildStateJson {
  std::string phase;
  std::string result;
  std::map<std::string, std::string> parameters;
  std::int64_t scheduled_at{0};
  std::int64_t started_at{0};
  std::int64_t finished_at{0};
  std::vector<std::string> console;
};

struct ParameterDefinitionJson {
  std::string name;
  std::string default_value;
  std::string description;
  std::vector<std::string> choices;
};

struct EnvironmentCommandsJson {
  std::vector<std::string> environment;
  std::vector<std::string> commands;
};

struct TaskCommandJson {
  std::string id;
  std::vector<std::string> commands;
  std::vector<ParameterDefinitionJson> parameters;
};

struct ProjectModelJson {
  std::vector<EnvironmentCommandsJson> builds;
  std::vector<TaskCommandJson> tasks;
  std::vector<ParameterDefinitionJson> parameters;
  std::vector<std::string> artifacts;
};

// Flat union of every badge alternative, discriminated by `kind`.
struct BadgeJson {
  std::string kind;
  std::string result;
  std::string user;
  std::map<std::string, std::string> values;
  std::vector<std::string> value_order;
  std::map<std::string, int> promotions;
  std::vector<std::string> promotion_order;
  std::string custom_kind;
};

struct PromotionStatusJson {
  std::string name;
  std::vector<BadgeJson> badges;
  std::int64_t qualified_at{0};
  std::vector<int> attempts;
  std::optional<int> successful;
};

struct ApprovalJson {
  std::string process;
  BadgeJson badge;
};

struct BranchBuildJson {
  int number{0};
  BuildStateJson state;
  std::optional<std::vector<std::string>> environments;
  std::optional<ProjectModelJson> model;
  std::map<std::string, std::string> scm;
  std::vector<ApprovalJson> approvals;
  std::vector<PromotionStatusJson> promotions;
};

struct ParentJson {
  std::string job;
  int number{0};
};

struct EnvironmentBuildJson {
  int number{0};
  std::string environment;
  std::optional<ParentJson> parent;
  BuildStateJson state;
  std::string workspace;
  std::string archive_dir;
  std::vector<std::string> artifacts;
};

struct PromotionBuildJson {
  int number{0};
  std::string process;
  ParentJson target;
  BuildStateJson state;
  std::string workspace;
};

struct EnvironmentEntryJson {
  std::string environment;
  bool active{true};
};

struct JobJson {
  int next_build_number{1};
};

} // namespace persistence_dto

namespace {

namespace fs = std::filesystem;
namespace dto = persistence_dto;

constexpr std::string_view kBuildFile = "build.json";
constexpr std::string_view kJobFile = "job.json";
constexpr std::string_view kEnvironmentFile = "environment.json";

// Numbered subdirectories of <dir>/builds in ascending order.
[[nodiscard]] auto list_build_numbers(const fs::path &dir) -> std::vector<int> {
  std::vector<int> numbers;
  std::error_code ec;
  for (fs::directory_iterator it(dir / "builds", ec), end; !ec && it != end;
       it.increment(ec)) {
    if (!it->is_directory(ec)) {
      continue;
    }
    auto name = it->path().filename().string();
    int n = 0;
    auto [ptr, err] = std::from_chars(name.data(), name.data() + name.size(), n);
    if (err == std::errc{} && ptr == name.data() + name.size() && n > 0) {
      numbers.push_back(n);
    }
  }
  std::ranges::sort(numbers);
  return numbers;
}

auto to_dto(const BuildState &state) -> dto::BuildStateJson {
  return dto::BuildStateJson{
      .phase = std::string(to_string_view(state.phase)),
      .result = state.result ? std::string(to_string_view(*state.result))
                             : std::string{},
      .parameters = state.parameters,
      .scheduled_at = util::to_unix_millis(state.scheduled_at),
      .started_at = util::to_unix_millis(state.started_at),
      .finished_at = util::to_unix_millis(state.finished_at),
      .console = state.console,
  };
}

// A record that was still queued or building when the process went away can
// never finish; it comes back as an aborted build.
auto from_dto(dto::BuildStateJson j) -> BuildState {
  BuildState state;
  state.phase = parse<BuildPhase>(j.phase);
  if (!j.result.empty()) {
    state.result = parse<BuildResult>(j.result);
  }
  if (state.phase != BuildPhase::Completed) {
    state.phase = BuildPhase::Completed;
    state.result = BuildResult::Aborted;
    j.console.emplace_back("Build was interrupted by a restart");
  }
  state.parameters = std::move(j.parameters);
  state.scheduled_at = util::from_unix_millis(j.scheduled_at);
  state.started_at = util::from_unix_millis(j.started_at);
  state.finished_at = util::from_unix_millis(j.finished_at);
  state.console = std::move(j.console);
  return state;
}

auto to_dto(const std::vector<ParameterDefinition> &defs)
    -> std::vector<dto::ParameterDefinitionJson> {
  return defs | std::views::transform([](const ParameterDefinition &d) {
           return dto::ParameterDefinitionJson{.name = d.name,
                                               .default_value = d.default_value,
                                               .description = d.description,
                                               .choices = d.choices};
         }) |
         std::ranges::to<std::vector>();
}

auto from_dto(std::vector<dto::ParameterDefinitionJson> defs)
    -> std::vector<ParameterDefinition> {
  return defs | std::views::transform([](dto::ParameterDefinitionJson &d) {
           return ParameterDefinition{.name = std::move(d.name),
                                      .default_value = std::move(d.default_value),
                                      .description = std::move(d.description),
                                      .choices = std::move(d.choices)};
         }) |
         std::ranges::to<std::vector>();
}

auto to_dto(const ProjectModel &model) -> dto::ProjectModelJson {
  dto::ProjectModelJson j;
  for (const auto &b : model.builds()) {
    j.builds.push_back({.environment = b.environment.labels(),
                        .commands = b.commands});
  }
  for (const auto &t : model.tasks()) {
    j.tasks.push_back({.id = t.id,
                       .commands = t.commands,
                       .parameters = to_dto(t.parameters)});
  }
  j.parameters = to_dto(model.parameters());
  j.artifacts = model.artifacts();
  return j;
}

auto from_dto(dto::ProjectModelJson j) -> Result<ProjectModel> {
  std::vector<EnvironmentCommands> builds;
  for (auto &b : j.builds) {
    auto env = EnvironmentSet::from_labels(std::move(b.environment));
    if (!env) {
      return fail(env.error());
    }
    builds.push_back({.environment = std::move(*env),
                      .commands = std::move(b.commands)});
  }
  std::vector<TaskCommand> tasks;
  for (auto &t : j.tasks) {
    tasks.push_back({.id = std::move(t.id),
                     .commands = std::move(t.commands),
                     .parameters = from_dto(std::move(t.parameters))});
  }
  return ok(ProjectModel(std::move(builds), std::move(tasks),
                         from_dto(std::move(j.parameters)),
                         std::move(j.artifacts)));
}

struct BadgeToDto {
  auto operator()(const SelfPromotionBadge &b) const -> dto::BadgeJson {
    return {.kind = "self_promotion",
            .result = std::string(to_string_view(b.result))};
  }
  auto operator()(const ManualApprovalBadge &b) const -> dto::BadgeJson {
    dto::BadgeJson j{.kind = "manual_approval", .user = b.user};
    for (const auto &v : b.values) {
      j.values.insert_or_assign(v.name, v.value);
      j.value_order.push_back(v.name);
    }
    return j;
  }
  auto operator()(const UpstreamPromotionBadge &b) const -> dto::BadgeJson {
    dto::BadgeJson j{.kind = "upstream_promotion"};
    for (const auto &[process, number] : b.promotions) {
      j.promotions.insert_or_assign(process, number);
      j.promotion_order.push_back(process);
    }
    return j;
  }
  auto operator()(const ManualPromotionBadge &b) const -> dto::BadgeJson {
    return {.kind = "manual_promotion", .user = b.user};
  }
  auto operator()(const CustomBadge &b) const -> dto::BadgeJson {
    return {.kind = "custom", .values = b.values, .custom_kind = b.kind};
  }
};

auto from_dto(dto::BadgeJson j) -> PromotionBadge {
  switch (parse<BadgeKind>(j.kind)) {
  case BadgeKind::SelfPromotion:
    return SelfPromotionBadge{.result = parse<BuildResult>(j.result)};
  case BadgeKind::ManualApproval: {
    ManualApprovalBadge b{.user = std::move(j.user)};
    for (const auto &name : j.value_order) {
      if (auto it = j.values.find(name); it != j.values.end()) {
        b.values.push_back({.name = name, .value = it->second});
      }
    }
    return b;
  }
  case BadgeKind::UpstreamPromotion: {
    UpstreamPromotionBadge b;
    for (const auto &name : j.promotion_order) {
      if (auto it = j.promotions.find(name); it != j.promotions.end()) {
        b.promotions.emplace_back(name, it->second);
      }
    }
    return b;
  }
  case BadgeKind::ManualPromotion:
    return ManualPromotionBadge{.user = std::move(j.user)};
  case BadgeKind::Custom:
    break;
  }
  return CustomBadge{.kind = std::move(j.custom_kind),
                     .values = std::move(j.values)};
}

auto to_dto(const PromotionStatusState &s) -> dto::PromotionStatusJson {
  dto::PromotionStatusJson j{.name = s.name,
                             .qualified_at = util::to_unix_millis(s.qualified_at),
                             .attempts = s.attempts,
                             .successful = s.successful};
  for (const auto &badge : s.badges) {
    j.badges.push_back(std::visit(BadgeToDto{}, badge));
  }
  return j;
}

auto from_dto(dto::PromotionStatusJson j) -> PromotionStatusState {
  PromotionStatusState s{.name = std::move(j.name),
                         .qualified_at = util::from_unix_millis(j.qualified_at),
                         .attempts = std::move(j.attempts),
                         .successful = j.successful};
  for (auto &badge : j.badges) {
    s.badges.push_back(from_dto(std::move(badge)));
  }
  return s;
}

} // namespace

BuildStore::BuildStore(std::filesystem::path root) : root_(std::move(root)) {}

auto BuildStore::branch_dir(const JobName &branch) const -> fs::path {
  return root_ / "branches" / util::url_encode(branch.value());
}

auto BuildStore::environment_dir(const JobName &branch,
                                 const EnvironmentSet &env) const -> fs::path {
  return branch_dir(branch) / "environments" / env.directory_key();
}

auto BuildStore::environment_build_dir(const JobName &branch,
                                       const EnvironmentSet &env,
                                       int number) const -> fs::path {
  return environment_dir(branch, env) / "builds" / std::to_string(number);
}

auto BuildStore::promotion_dir(const JobName &branch,
                               std::string_view process) const -> fs::path {
  return branch_dir(branch) / "promotions" / util::url_encode(process);
}

auto BuildStore::promotion_build_dir(const JobName &branch,
                                     std::string_view process, int number) const
    -> fs::path {
  return promotion_dir(branch, process) / "builds" / std::to_string(number);
}

auto BuildStore::save(const BranchBuild &build) -> Result<void> {
  dto::BranchBuildJson j{.number = build.number(),
                         .state = to_dto(build.snapshot_state()),
                         .scm = build.scm_vars()};
  if (build.has_environments()) {
    j.environments = build.environments() |
                     std::views::transform(&EnvironmentSet::canonical_name) |
                     std::ranges::to<std::vector>();
  }
  if (auto model = build.model()) {
    j.model = to_dto(*model);
  }
  for (const auto &approval : build.approvals()) {
    j.approvals.push_back({.process = approval.process,
                           .badge = BadgeToDto{}(approval.badge)});
  }
  for (const auto &status : build.promotions().all()) {
    j.promotions.push_back(to_dto(status->snapshot()));
  }

  std::scoped_lock lock(write_mutex_);
  return json_file::write(branch_dir(build.job()) / "builds" /
                             std::to_string(build.number()) / kBuildFile,
                         j);
}

auto BuildStore::save(const JobName &branch, const EnvironmentBuild &build)
    -> Result<void> {
  dto::EnvironmentBuildJson j{
      .number = build.number(),
      .environment = build.environment().canonical_name(),
      .state = to_dto(build.snapshot_state()),
      .workspace = build.workspace().string(),
      .archive_dir = build.archive_dir().string(),
      .artifacts = build.artifacts(),
  };
  if (const auto &parent = build.parent()) {
    j.parent = dto::ParentJson{.job = parent->job.str(),
                               .number = parent->number};
  }
  std::scoped_lock lock(write_mutex_);
  return json_file::write(environment_build_dir(branch, build.environment(),
                                               build.number()) /
                             kBuildFile,
                         j);
}

auto BuildStore::save(const JobName &branch, const PromotionBuild &build)
    -> Result<void> {
  dto::PromotionBuildJson j{
      .number = build.number(),
      .process = build.process(),
      .target = {.job = build.target().job.str(),
                 .number = build.target().number},
      .state = to_dto(build.snapshot_state()),
      .workspace = build.workspace().string(),
  };
  std::scoped_lock lock(write_mutex_);
  return json_file::write(
      promotion_build_dir(branch, build.process(), build.number()) / kBuildFile,
      j);
}

auto BuildStore::save_next_build_number(const fs::path &dir, int next)
    -> Result<void> {
  std::scoped_lock lock(write_mutex_);
  return json_file::write(dir / kJobFile, dto::JobJson{.next_build_number = next});
}

auto BuildStore::load_next_build_number(const fs::path &dir) -> Result<int> {
  std::error_code ec;
  if (!fs::exists(dir / kJobFile, ec)) {
    return ok(1);
  }
  auto j = json_file::read<dto::JobJson>(dir / kJobFile);
  if (!j) {
    return fail(j.error());
  }
  return ok(std::max(1, j->next_build_number));
}

auto BuildStore::save_environment_entry(const JobName &branch,
                                        const EnvironmentEntry &entry)
    -> Result<void> {
  std::scoped_lock lock(write_mutex_);
  return json_file::write(
      environment_dir(branch, entry.environment) / kEnvironmentFile,
      dto::EnvironmentEntryJson{
          .environment = entry.environment.canonical_name(),
          .active = entry.active});
}

auto BuildStore::load_environment_entries(const JobName &branch)
    -> Result<std::vector<EnvironmentEntry>> {
  std::vector<EnvironmentEntry> out;
  auto base = branch_dir(branch) / "environments";
  std::error_code ec;
  for (fs::recursive_directory_iterator it(base, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (it->path().filename() != kEnvironmentFile) {
      continue;
    }
    auto j = json_file::read<dto::EnvironmentEntryJson>(it->path());
    if (!j) {
      continue;
    }
    auto env = EnvironmentSet::parse(j->environment);
    if (!env) {
      log::warn("Skipping environment '{}' of {}: {}", j->environment, branch,
                env.error().message());
      continue;
    }
    out.push_back({.environment = std::move(*env), .active = j->active});
  }
  if (ec && ec != std::errc::no_such_file_or_directory) {
    log::error("Cannot scan {}: {}", base.string(), ec.message());
    return fail(Error::IoError);
  }
  std::ranges::sort(out, {}, &EnvironmentEntry::environment);
  return ok(std::move(out));
}

auto BuildStore::load_branch_builds(const JobName &branch)
    -> Result<std::vector<std::shared_ptr<BranchBuild>>> {
  std::vector<std::shared_ptr<BranchBuild>> out;
  auto dir = branch_dir(branch);
  for (int number : list_build_numbers(dir)) {
    auto j = json_file::read<dto::BranchBuildJson>(
        dir / "builds" / std::to_string(number) / kBuildFile);
    if (!j) {
      continue;
    }
    auto build = std::make_shared<BranchBuild>(
        BuildRef{.job = branch, .number = number});
    build->restore_state(from_dto(std::move(j->state)));
    if (j->environments) {
      std::vector<EnvironmentSet> envs;
      for (const auto &name : *j->environments) {
        if (auto env = EnvironmentSet::parse(name)) {
          envs.push_back(std::move(*env));
        } else {
          log::warn("{} #{}: dropping malformed environment '{}'", branch,
                    number, name);
        }
      }
      if (auto r = build->set_environments(std::move(envs)); !r) {
        return fail(r.error());
      }
    }
    if (j->model) {
      if (auto model = from_dto(std::move(*j->model))) {
        build->set_model(
            std::make_shared<const ProjectModel>(std::move(*model)));
      }
    }
    build->set_scm_vars(std::move(j->scm));
    for (auto &approval : j->approvals) {
      auto badge = from_dto(std::move(approval.badge));
      if (auto *manual = std::get_if<ManualApprovalBadge>(&badge)) {
        auto process = approval.process;
        if (auto r = build->add_approval({.process = std::move(approval.process),
                                          .badge = std::move(*manual)});
            !r) {
          log::warn("{} #{}: duplicate approval for '{}' ignored", branch,
                    number, process);
        }
      }
    }
    for (auto &status : j->promotions) {
      build->promotions().add_if_absent(
          std::make_shared<PromotionStatus>(from_dto(std::move(status))));
    }
    build->promotions().relink(build.get());
    out.push_back(std::move(build));
  }
  return ok(std::move(out));
}

auto BuildStore::load_environment_builds(const JobName &branch,
                                         const JobName &job,
                                         const EnvironmentSet &env)
    -> Result<std::vector<std::shared_ptr<EnvironmentBuild>>> {
  std::vector<std::shared_ptr<EnvironmentBuild>> out;
  auto dir = environment_dir(branch, env);
  for (int number : list_build_numbers(dir)) {
    auto j = json_file::read<dto::EnvironmentBuildJson>(
        dir / "builds" / std::to_string(number) / kBuildFile);
    if (!j) {
      continue;
    }
    std::optional<BuildRef> parent;
    if (j->parent) {
      parent = BuildRef{.job = JobName{j->parent->job},
                        .number = j->parent->number};
    }
    auto build = std::make_shared<EnvironmentBuild>(
        BuildRef{.job = job, .number = number}, env, std::move(parent));
    build->restore_state(from_dto(std::move(j->state)));
    build->set_workspace(j->workspace);
    build->set_archive_dir(j->archive_dir);
    build->set_artifacts(std::move(j->artifacts));
    out.push_back(std::move(build));
  }
  return ok(std::move(out));
}

auto BuildStore::load_promotion_builds(const JobName &branch,
                                       const JobName &job,
                                       std::string_view process)
    -> Result<std::vector<std::shared_ptr<PromotionBuild>>> {
  std::vector<std::shared_ptr<PromotionBuild>> out;
  auto dir = promotion_dir(branch, process);
  for (int number : list_build_numbers(dir)) {
    auto j = json_file::read<dto::PromotionBuildJson>(
        dir / "builds" / std::to_string(number) / kBuildFile);
    if (!j) {
      continue;
    }
    auto build = std::make_shared<PromotionBuild>(
        BuildRef{.job = job, .number = number}, std::move(j->process),
        BuildRef{.job = JobName{j->target.job}, .number = j->target.number});
    build->restore_state(from_dto(std::move(j->state)));
    build->set_workspace(j->workspace);
    out.push_back(std::move(build));
  }
  return ok(std::move(out));
}

} // namespace matrixforge
