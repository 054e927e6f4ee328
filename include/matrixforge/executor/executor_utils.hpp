#pragma once

#include <algorithm>
#include <cctype>
#include <map>
#include <string>
#include <string_view>

namespace matrixforge {

/// Truncate a command string for log preview (max 80 chars).
[[nodiscard]] inline auto cmd_preview(std::string_view cmd) -> std::string {
  if (cmd.size() <= 80)
    return std::string(cmd);
  return std::string(cmd.substr(0, 80)) + "...";
}

/// POSIX: [A-Za-z_][A-Za-z0-9_]*
[[nodiscard]] inline auto is_valid_env_key(std::string_view key) -> bool {
  if (key.empty())
    return false;
  if (!std::isalpha(static_cast<unsigned char>(key[0])) && key[0] != '_')
    return false;
  return std::ranges::all_of(key, [](char c) {
    const auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) != 0 || c == '_';
  });
}

/// Maps an arbitrary name onto a valid environment key: "build.type" ->
/// "BUILD_TYPE".
[[nodiscard]] inline auto to_env_key(std::string_view name) -> std::string {
  std::string out;
  out.reserve(name.size());
  for (char c : name) {
    const auto uc = static_cast<unsigned char>(c);
    out.push_back(std::isalnum(uc) != 0 ? static_cast<char>(std::toupper(uc))
                                        : '_');
  }
  if (!out.empty() && std::isdigit(static_cast<unsigned char>(out[0])) != 0) {
    out.insert(out.begin(), '_');
  }
  return out;
}

/// Copies `vars` into `env` under `prefix`, mapping names that are not valid
/// keys through to_env_key().
inline auto export_env(std::map<std::string, std::string> &env,
                       const std::map<std::string, std::string> &vars,
                       std::string_view prefix = {}) -> void {
  for (const auto &[name, value] : vars) {
    auto key = std::string(prefix) + name;
    if (!is_valid_env_key(key)) {
      key = to_env_key(key);
    }
    env.insert_or_assign(std::move(key), value);
  }
}

} // namespace matrixforge
