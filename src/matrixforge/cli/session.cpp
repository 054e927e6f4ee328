#include "matrixforge/cli/session.hpp"

#include "matrixforge/config/config.hpp"
#include "matrixforge/util/log.hpp"

#include <print>

namespace matrixforge::cli {

auto open_session(std::string_view config_file, std::string_view branch_file)
    -> std::optional<Session> {
  auto config_res = ConfigLoader::load(config_file).or_else(
      [&](std::error_code ec) -> Result<SystemConfig> {
        std::println(stderr, "Error: {}: {}",
                     config_file.empty() ? "configuration" : config_file,
                     ec.message());
        return fail(ec);
      });
  if (!config_res) {
    return std::nullopt;
  }

  Session session{.app = std::make_unique<Application>(std::move(*config_res)),
                  .branch = nullptr};
  if (auto r = session.app->start(); !r) {
    std::println(stderr, "Error: {}", r.error().message());
    return std::nullopt;
  }

  std::string diagnostic;
  auto branch = session.app->open_branch(branch_file, &diagnostic);
  if (!branch) {
    std::println(stderr, "Error: {}",
                 diagnostic.empty() ? branch.error().message() : diagnostic);
    return std::nullopt;
  }
  session.branch = std::move(*branch);
  return session;
}

auto parse_param_args(const std::vector<std::string> &args)
    -> Result<std::vector<ParameterValue>> {
  std::vector<ParameterValue> out;
  out.reserve(args.size());
  for (const auto &arg : args) {
    const auto eq = arg.find('=');
    if (eq == std::string::npos || eq == 0) {
      log::warn("Malformed parameter '{}', expected name=value", arg);
      return fail(Error::InvalidArgument);
    }
    out.push_back({.name = arg.substr(0, eq), .value = arg.substr(eq + 1)});
  }
  return ok(std::move(out));
}

} // namespace matrixforge::cli
