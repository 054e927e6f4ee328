#pragma once

#include "matrixforge/app/application.hpp"
#include "matrixforge/core/error.hpp"
#include "matrixforge/model/parameters.hpp"
#include "matrixforge/util/json.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace matrixforge::cli {

// A started application with one branch opened. Errors are printed to stderr
// by open_session(), so callers only map a nullopt to an exit code.
struct Session {
  std::unique_ptr<Application> app;
  std::shared_ptr<BranchJob> branch;
};

[[nodiscard]] auto open_session(std::string_view config_file,
                                std::string_view branch_file)
    -> std::optional<Session>;

/// "name=value" pairs; a missing '=' or an empty name is InvalidArgument.
[[nodiscard]] auto parse_param_args(const std::vector<std::string> &args)
    -> Result<std::vector<ParameterValue>>;

/// Environment and promotion tables of one branch build.
auto print_build_report(BranchJob &branch, PromotionEngine &engine,
                        const BranchBuild &build) -> void;
[[nodiscard]] auto build_report_json(BranchJob &branch, PromotionEngine &engine,
                                     const BranchBuild &build) -> JsonValue;

} // namespace matrixforge::cli
