#include "matrixforge/cli/commands.hpp"
#include "matrixforge/cli/formatting.hpp"
#include "matrixforge/cli/session.hpp"
#include "matrixforge/util/log.hpp"

#include <print>
#include <ranges>

namespace matrixforge::cli {

namespace {

auto result_text(const BuildRecord &build) -> std::string {
  auto r = build.result();
  return r ? std::string(to_string_view(*r)) : std::string("building");
}

auto record_json(const BuildRecord &build) -> JsonValue {
  const auto state = build.snapshot_state();
  return JsonValue{
      {"job", build.job().str()},
      {"number", static_cast<std::int64_t>(build.number())},
      {"result", result_text(build)},
      {"started_at", util::format_iso8601(state.started_at)},
      {"finished_at", util::format_iso8601(state.finished_at)},
  };
}

auto promotion_summary(PromotionEngine &engine, BranchJob &branch,
                       const BranchBuild &build) -> std::string {
  std::string out;
  for (const auto &view : engine.status_views(branch, build)) {
    if (view.progress == PromotionProgress::NotAttempted && !view.status) {
      continue;
    }
    if (!out.empty())
      out += ", ";
    out += std::format("{}:{}", view.process, to_string_view(view.progress));
  }
  return out.empty() ? "-" : out;
}

} // namespace

auto print_build_report(BranchJob &branch, PromotionEngine &engine,
                        const BranchBuild &build) -> void {
  const auto state = build.snapshot_state();
  std::println("{} {}  {}  {}", fmt::ansi::bold("Build"), build.ref(),
               fmt::colorize_result(state.result),
               fmt::format_duration(state));
  if (auto ec = build.error()) {
    std::println("  {}", fmt::ansi::red(ec.message()));
  }

  auto env_builds = branch.environment_builds(build.number());
  if (!env_builds.empty()) {
    std::println("");
    fmt::Table table({{"ENVIRONMENT", 28}, {"RESULT", 10}, {"DURATION", 9}});
    table.print_header();
    for (const auto &eb : env_builds) {
      const auto es = eb->snapshot_state();
      table.print_row({eb->environment().canonical_name(),
                       fmt::colorize_result(es.result),
                       fmt::format_duration(es)});
    }
  }

  auto views = engine.status_views(branch, build);
  if (!views.empty()) {
    std::println("");
    fmt::Table table({{"PROMOTION", 20},
                      {"PROGRESS", 14},
                      {"BADGES", 36},
                      {"LAST", 8, true}});
    table.print_header();
    for (const auto &view : views) {
      std::string badges = "-";
      if (view.status) {
        badges.clear();
        for (const auto &badge : view.status->badges()) {
          if (!badges.empty())
            badges += "; ";
          badges += describe_badge(badge);
        }
      }
      table.print_row({view.display_name, fmt::colorize_progress(view.progress),
                       badges,
                       view.last ? std::format("#{}", view.last->number())
                                 : std::string("-")});
    }
  }
}

auto build_report_json(BranchJob &branch, PromotionEngine &engine,
                       const BranchBuild &build) -> JsonValue {
  JsonValue out = record_json(build);
  JsonValue envs = std::vector<JsonValue>{};
  for (const auto &eb : branch.environment_builds(build.number())) {
    JsonValue env = record_json(*eb);
    env.get_object().emplace("environment", eb->environment().canonical_name());
    envs.get_array().emplace_back(std::move(env));
  }
  out.get_object().emplace("environments", std::move(envs));

  JsonValue promotions = std::vector<JsonValue>{};
  for (const auto &view : engine.status_views(branch, build)) {
    JsonValue p{
        {"process", view.process},
        {"display_name", view.display_name},
        {"progress", std::string(to_string_view(view.progress))},
    };
    if (view.status) {
      JsonValue badges = std::vector<JsonValue>{};
      for (const auto &badge : view.status->badges()) {
        badges.get_array().emplace_back(describe_badge(badge));
      }
      p.get_object().emplace("badges", std::move(badges));
    }
    if (view.last) {
      p.get_object().emplace("last", record_json(*view.last));
    }
    promotions.get_array().emplace_back(std::move(p));
  }
  out.get_object().emplace("promotions", std::move(promotions));
  return out;
}

auto cmd_status(const StatusOptions &opts) -> int {
  log::set_output_stderr();
  auto session = open_session(opts.config_file, opts.branch_file);
  if (!session) {
    return 1;
  }
  // Status output should stay concise.
  log::set_level(log::Level::Warn);
  auto &branch = *session->branch;
  auto &engine = session->app->engine();

  if (opts.build_number) {
    auto build = branch.find_build(*opts.build_number);
    if (!build) {
      std::println(stderr, "Error: {} has no build #{}", branch.name(),
                   *opts.build_number);
      return 1;
    }
    if (opts.json) {
      std::println("{}", dump_json(build_report_json(branch, engine, *build)));
    } else {
      print_build_report(branch, engine, *build);
    }
    return 0;
  }

  auto builds = branch.builds();
  if (opts.json) {
    JsonValue arr = std::vector<JsonValue>{};
    for (const auto &b : builds | std::views::reverse) {
      arr.get_array().emplace_back(record_json(*b));
    }
    JsonValue output{
        {"branch", branch.name().str()},
        {"next_build_number",
         static_cast<std::int64_t>(branch.next_build_number())},
        {"builds", std::move(arr)},
    };
    std::println("{}", dump_json(output));
    return 0;
  }

  std::println("{} {}  ({} environment(s) known)", fmt::ansi::bold("Branch"),
               branch.name(), branch.environments().size());
  if (builds.empty()) {
    std::println("No builds yet.");
    return 0;
  }
  fmt::Table table({{"#", 6, true},
                    {"RESULT", 10},
                    {"STARTED", 19},
                    {"DURATION", 9},
                    {"PROMOTIONS", 40}});
  table.print_header();
  for (const auto &b : builds | std::views::reverse) {
    const auto state = b->snapshot_state();
    table.print_row({std::format("{}", b->number()),
                     fmt::colorize_result(state.result),
                     fmt::format_timestamp(state.started_at),
                     fmt::format_duration(state),
                     promotion_summary(engine, branch, *b)});
  }
  return 0;
}

} // namespace matrixforge::cli
