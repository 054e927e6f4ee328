#include "matrixforge/cli/commands.hpp"
#include "matrixforge/cli/formatting.hpp"
#include "matrixforge/config/branch_config.hpp"
#include "matrixforge/model/project_model.hpp"
#include "matrixforge/promotion/extensions.hpp"
#include "matrixforge/util/json.hpp"
#include "matrixforge/util/log.hpp"

#include <filesystem>
#include <print>
#include <vector>

namespace matrixforge::cli {

namespace {

struct ValidationResult {
  std::string kind;
  std::string file_path;
  bool valid{false};
  std::string error;
  std::vector<std::string> details;
};

auto validate_description(const std::filesystem::path &repository,
                          std::string_view marker) -> ValidationResult {
  const ModelRequest request{.marker = marker.empty()
                                           ? std::string(kDefaultMarkerFile)
                                           : std::string(marker)};
  ValidationResult vr{.kind = "build description",
                      .file_path = (repository / request.marker).string(),
                      .valid = false,
                      .error = {},
                      .details = {}};

  std::string diagnostic;
  auto model = TomlModelSource{}.resolve(repository, request, &diagnostic);
  if (!model) {
    vr.error = diagnostic.empty() ? model.error().message() : diagnostic;
    return vr;
  }
  const auto environments = (*model)->environments();
  if (environments.empty()) {
    vr.error = "no environments declared";
    return vr;
  }
  vr.valid = true;
  for (const auto &env : environments) {
    const bool has_build = (*model)->build_command_for(env).has_value();
    vr.details.push_back(
        std::format("environment {} {}", env, has_build ? "ok" : "missing build"));
    if (!has_build) {
      vr.valid = false;
      vr.error = std::format("no build command for environment {}", env);
    }
  }
  for (const auto &task : (*model)->tasks()) {
    vr.details.push_back(std::format("task {}", task.id));
  }
  return vr;
}

auto validate_branch(const std::filesystem::path &path) -> ValidationResult {
  ValidationResult vr{.kind = "branch",
                      .file_path = path.string(),
                      .valid = false,
                      .error = {},
                      .details = {}};
  const auto extensions = PromotionExtensions::with_builtins();
  std::string diagnostic;
  auto cfg = BranchConfigLoader(extensions).load_from_file(path, &diagnostic);
  vr.valid = cfg.has_value();
  if (!vr.valid) {
    vr.error = diagnostic.empty() ? cfg.error().message() : diagnostic;
    return vr;
  }
  vr.details.push_back(std::format("branch {}", cfg->name));
  for (const auto &def : cfg->settings.catalog->processes()) {
    vr.details.push_back(std::format("promotion {} ({} condition(s))",
                                     def.display(), def.conditions.size()));
  }
  return vr;
}

} // namespace

auto cmd_validate(const ValidateOptions &opts) -> int {
  log::set_output_stderr();
  std::vector<ValidationResult> results;

  if (!opts.repository.empty()) {
    if (!std::filesystem::is_directory(opts.repository)) {
      std::println(stderr, "Error: Directory does not exist: {}",
                   opts.repository);
      return 1;
    }
    results.emplace_back(validate_description(opts.repository, opts.marker));
  }
  if (!opts.branch_file.empty()) {
    if (!std::filesystem::exists(opts.branch_file)) {
      std::println(stderr, "Error: File does not exist: {}", opts.branch_file);
      return 1;
    }
    results.emplace_back(validate_branch(opts.branch_file));
  }
  if (results.empty()) {
    std::println(stderr, "Error: nothing to validate, pass -r or -b");
    return 1;
  }

  int invalid_count = 0;
  for (const auto &vr : results) {
    if (!vr.valid)
      invalid_count++;
  }

  if (opts.json) {
    JsonValue arr = std::vector<JsonValue>{};
    for (const auto &vr : results) {
      JsonValue obj{
          {"kind", vr.kind},
          {"file", vr.file_path},
          {"valid", vr.valid},
      };
      if (!vr.valid) {
        obj.get_object().emplace("error", vr.error);
      }
      JsonValue details = std::vector<JsonValue>{};
      for (const auto &d : vr.details) {
        details.get_array().emplace_back(d);
      }
      obj.get_object().emplace("details", std::move(details));
      arr.get_array().emplace_back(std::move(obj));
    }
    JsonValue output{
        {"results", std::move(arr)},
        {"invalid", static_cast<std::int64_t>(invalid_count)},
    };
    std::println("{}", dump_json(output));
    return invalid_count > 0 ? 1 : 0;
  }

  for (const auto &vr : results) {
    if (vr.valid) {
      std::println("{} {} {} - {}", fmt::ansi::green("✓"), vr.kind,
                   vr.file_path, fmt::ansi::green("Valid"));
    } else {
      std::println("{} {} {} - {}", fmt::ansi::red("✗"), vr.kind,
                   vr.file_path, fmt::ansi::red(vr.error));
    }
    for (const auto &d : vr.details) {
      std::println("    {}", fmt::ansi::dim(d));
    }
  }
  return invalid_count > 0 ? 1 : 0;
}

} // namespace matrixforge::cli
