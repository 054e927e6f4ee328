#include "matrixforge/cli/commands.hpp"
#include "matrixforge/cli/formatting.hpp"
#include "matrixforge/cli/session.hpp"
#include "matrixforge/util/log.hpp"

#include <chrono>
#include <print>

namespace matrixforge::cli {

auto cmd_build(const BuildOptions &opts) -> int {
  log::set_output_stderr();
  auto values = parse_param_args(opts.params);
  if (!values) {
    std::println(stderr, "Error: parameters must be given as name=value");
    return 1;
  }

  auto session = open_session(opts.config_file, opts.branch_file);
  if (!session) {
    return 1;
  }
  auto &app = *session->app;
  auto &branch = session->branch;

  Parameters parameters;
  for (auto &v : *values) {
    parameters.insert_or_assign(std::move(v.name), std::move(v.value));
  }

  auto handle = app.trigger_build(branch, std::move(parameters),
                                  "Started from the command line");
  if (!handle) {
    std::println(stderr, "Error: {}", handle.error().message());
    return 1;
  }
  if (!opts.json) {
    std::println("Queued a build of {}", branch->name());
  }

  auto record = handle->future.get();
  auto build = std::dynamic_pointer_cast<BranchBuild>(record);
  if (!build) {
    std::println(stderr, "Error: the build of {} was cancelled before it "
                         "started",
                 branch->name());
    return 1;
  }

  // Promotions are scheduled when the build completes; give them the same
  // budget as one command.
  if (!opts.no_wait_promotions) {
    const auto budget =
        std::chrono::seconds(app.config().executor.timeout_sec) * 2;
    if (!app.wait_idle(budget)) {
      log::warn("Promotions of {} are still running", build->ref());
    }
  }

  if (opts.json) {
    std::println("{}", dump_json(build_report_json(*branch, app.engine(),
                                                   *build)));
  } else {
    for (const auto &line : build->console().lines()) {
      std::println("{}", line);
    }
    std::println("");
    print_build_report(*branch, app.engine(), *build);
  }
  return build->result() == BuildResult::Success ? 0 : 1;
}

} // namespace matrixforge::cli
