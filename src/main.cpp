#include "matrixforge/cli/commands.hpp"
#include "matrixforge/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <string>

namespace {
auto default_config() -> std::string {
  if (const char *env = std::getenv("MATRIXFORGE_CONFIG"); env && *env) {
    return env;
  }
  return {};
}

auto add_config_option(CLI::App *cmd, std::string &target) -> void {
  cmd->add_option("-c,--config", target,
                  "System config file (default: built-in settings)")
      ->check(CLI::ExistingFile);
}

auto add_promote_command(CLI::App &app, const char *name,
                         const char *description,
                         matrixforge::cli::PromoteAction action,
                         matrixforge::cli::PromoteOptions &opts,
                         const std::string &env_config) -> void {
  auto *cmd = app.add_subcommand(name, description);
  opts.config_file = env_config;
  add_config_option(cmd, opts.config_file);
  cmd->add_option("-b,--branch", opts.branch_file, "Branch definition file")
      ->required()
      ->check(CLI::ExistingFile);
  cmd->add_option("build", opts.build_number, "Branch build number")
      ->required()
      ->check(CLI::PositiveNumber);
  cmd->add_option("process", opts.process, "Promotion process name")
      ->required();
  cmd->add_option("-u,--user", opts.user, "Acting user (default: $USER)");
  if (action == matrixforge::cli::PromoteAction::Approve) {
    cmd->add_option("-p,--param", opts.params,
                    "Approval parameter as name=value (repeatable)");
  }
  cmd->add_flag("--json", opts.json, "Output JSON");
  cmd->callback([action, &opts]() {
    std::exit(matrixforge::cli::cmd_promote(action, opts));
  });
}
} // namespace

int main(int argc, char *argv[]) {
  // Command output goes to stdout; keep the log out of the way.
  matrixforge::log::set_output_stderr();
  matrixforge::log::set_level(matrixforge::log::Level::Warn);

  CLI::App app{"MatrixForge", "Matrix build and promotion orchestrator"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  matrixforge validate -r ./repo -b branch.toml\n"
             "  matrixforge build -b branch.toml -p TARGET=release\n"
             "  matrixforge approve -b branch.toml 12 deploy -p ENV=prod\n"
             "  matrixforge status -b branch.toml 12 --json\n"
             "\nTip: Set MATRIXFORGE_CONFIG=system_config.toml to skip -c on "
             "every command.");

  const std::string env_config = default_config();

  matrixforge::cli::ValidateOptions validate_opts;
  auto *validate = app.add_subcommand(
      "validate", "Check a build description and/or a branch definition");
  validate->add_option("-r,--repository", validate_opts.repository,
                       "Repository directory holding the build description");
  validate->add_option("-m,--marker", validate_opts.marker,
                       "Build description file name inside the repository");
  validate
      ->add_option("-b,--branch", validate_opts.branch_file,
                   "Branch definition file")
      ->check(CLI::ExistingFile);
  validate->add_flag("--json", validate_opts.json, "Output JSON");
  validate->callback([&validate_opts]() {
    std::exit(matrixforge::cli::cmd_validate(validate_opts));
  });

  matrixforge::cli::BuildOptions build_opts;
  auto *build = app.add_subcommand(
      "build", "Run one branch build across every declared environment");
  build_opts.config_file = env_config;
  add_config_option(build, build_opts.config_file);
  build
      ->add_option("-b,--branch", build_opts.branch_file,
                   "Branch definition file")
      ->required()
      ->check(CLI::ExistingFile);
  build->add_option("-p,--param", build_opts.params,
                    "Build parameter as name=value (repeatable)");
  build->add_flag("--no-wait-promotions", build_opts.no_wait_promotions,
                  "Return once the branch build finishes");
  build->add_flag("--json", build_opts.json, "Output JSON");
  build->callback(
      [&build_opts]() { std::exit(matrixforge::cli::cmd_build(build_opts)); });

  matrixforge::cli::PromoteOptions approve_opts;
  add_promote_command(app, "approve", "Record a manual approval",
                      matrixforge::cli::PromoteAction::Approve, approve_opts,
                      env_config);

  matrixforge::cli::PromoteOptions force_opts;
  add_promote_command(app, "force",
                      "Promote regardless of the process conditions",
                      matrixforge::cli::PromoteAction::Force, force_opts,
                      env_config);

  matrixforge::cli::PromoteOptions rerun_opts;
  add_promote_command(app, "rerun",
                      "Run a qualified promotion again",
                      matrixforge::cli::PromoteAction::Rerun, rerun_opts,
                      env_config);

  matrixforge::cli::StatusOptions status_opts;
  auto *status = app.add_subcommand("status", "Show builds and promotions");
  status_opts.config_file = env_config;
  add_config_option(status, status_opts.config_file);
  status
      ->add_option("-b,--branch", status_opts.branch_file,
                   "Branch definition file")
      ->required()
      ->check(CLI::ExistingFile);
  status->add_option("build", status_opts.build_number,
                     "Show one build in detail");
  status->add_flag("--json", status_opts.json, "Output JSON");
  status->callback([&status_opts]() {
    std::exit(matrixforge::cli::cmd_status(status_opts));
  });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
