#include "matrixforge/cli/commands.hpp"
#include "matrixforge/cli/formatting.hpp"
#include "matrixforge/cli/session.hpp"
#include "matrixforge/util/log.hpp"

#include <chrono>
#include <cstdlib>
#include <print>

namespace matrixforge::cli {

namespace {

auto default_user() -> std::string {
  if (const char *user = std::getenv("USER"); user != nullptr && *user) {
    return user;
  }
  return "anonymous";
}

auto apply(PromoteAction action, Session &session, BranchBuild &target,
           const PromoteOptions &opts, std::vector<ParameterValue> values)
    -> Result<void> {
  auto &engine = session.app->engine();
  auto &branch = *session.branch;
  const auto user = opts.user.empty() ? default_user() : opts.user;

  switch (action) {
  case PromoteAction::Approve: {
    auto outcome =
        engine.approve(branch, target, opts.process, user, std::move(values));
    if (!outcome) {
      return fail(outcome.error());
    }
    std::println("Approved {} for {}: {}", opts.process, target.ref(),
                 to_string_view(*outcome));
    return ok();
  }
  case PromoteAction::Force: {
    auto outcome = engine.force_promotion(branch, target, opts.process, user);
    if (!outcome) {
      return fail(outcome.error());
    }
    std::println("Forced {} for {}: {}", opts.process, target.ref(),
                 to_string_view(*outcome));
    return ok();
  }
  case PromoteAction::Rerun:
    break;
  }
  auto r = engine.rebuild(branch, target, opts.process);
  if (r) {
    std::println("Re-running {} for {}", opts.process, target.ref());
  }
  return r;
}

} // namespace

auto cmd_promote(PromoteAction action, const PromoteOptions &opts) -> int {
  log::set_output_stderr();
  auto values = parse_param_args(opts.params);
  if (!values) {
    std::println(stderr, "Error: parameters must be given as name=value");
    return 1;
  }
  if (action != PromoteAction::Approve && !values->empty()) {
    std::println(stderr, "Error: --param only applies to approve");
    return 1;
  }

  auto session = open_session(opts.config_file, opts.branch_file);
  if (!session) {
    return 1;
  }
  auto &branch = *session->branch;
  auto target = branch.find_build(opts.build_number);
  if (!target) {
    std::println(stderr, "Error: {} has no build #{}", branch.name(),
                 opts.build_number);
    return 1;
  }
  if (target->is_building()) {
    std::println(stderr, "Error: {} is still building", target->ref());
    return 1;
  }

  if (auto r = apply(action, *session, *target, opts, std::move(*values));
      !r) {
    std::println(stderr, "Error: {} {}: {}", opts.process, target->ref(),
                 r.error().message());
    if (r.error() == make_error_code(Error::InvalidState)) {
      std::println(stderr, "Hint: {} has not qualified for {} yet.",
                   target->ref(), opts.process);
    }
    return 1;
  }

  const auto budget =
      std::chrono::seconds(session->app->config().executor.timeout_sec) * 2;
  if (!session->app->wait_idle(budget)) {
    log::warn("Promotion of {} is still running", target->ref());
  }

  if (opts.json) {
    std::println("{}", dump_json(build_report_json(
                           branch, session->app->engine(), *target)));
  } else {
    print_build_report(branch, session->app->engine(), *target);
  }

  auto status = target->promotions().find(opts.process);
  return status && status->is_promotion_successful() ? 0 : 1;
}

} // namespace matrixforge::cli
