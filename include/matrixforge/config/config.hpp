#pragma once

#include "matrixforge/config/system_config.hpp"
#include "matrixforge/core/error.hpp"

#include <optional>
#include <string_view>

namespace matrixforge {

// Process-wide settings. Later sources win: built-in defaults, the TOML
// file, then MATRIXFORGE_* environment variables.
class ConfigLoader {
public:
  /// An empty `path` skips the file.
  [[nodiscard]] static auto load(std::string_view path) -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<SystemConfig>;

  /// Dotted name of the first out-of-range key, if any.
  [[nodiscard]] static auto first_invalid_key(const SystemConfig &cfg)
      -> std::optional<std::string_view>;
};

} // namespace matrixforge
