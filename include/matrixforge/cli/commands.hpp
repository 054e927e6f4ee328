#pragma once

#include <optional>
#include <string>
#include <vector>

namespace matrixforge::cli {

struct ValidateOptions {
  std::string repository;  // Directory holding the build description
  std::string marker;      // Empty: the default marker file
  std::string branch_file; // Optional branch definition to check as well
  bool json{false};
};

struct BuildOptions {
  std::string config_file;
  std::string branch_file;
  std::vector<std::string> params; // name=value
  bool no_wait_promotions{false};
  bool json{false};
};

enum class PromoteAction { Approve, Force, Rerun };

struct PromoteOptions {
  std::string config_file;
  std::string branch_file;
  int build_number{0};
  std::string process;
  std::string user;
  std::vector<std::string> params; // name=value, approval only
  bool json{false};
};

struct StatusOptions {
  std::string config_file;
  std::string branch_file;
  std::optional<int> build_number;
  bool json{false};
};

auto cmd_validate(const ValidateOptions &opts) -> int;
auto cmd_build(const BuildOptions &opts) -> int;
auto cmd_promote(PromoteAction action, const PromoteOptions &opts) -> int;
auto cmd_status(const StatusOptions &opts) -> int;

} // namespace matrixforge::cli
