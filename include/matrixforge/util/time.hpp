#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <string>

namespace matrixforge::util {

// ISO 8601 (YYYY-MM-DDTHH:MM:SSZ); empty for the epoch sentinel.
[[nodiscard]] inline auto
format_iso8601(std::chrono::system_clock::time_point tp) -> std::string {
  if (tp == std::chrono::system_clock::time_point{}) {
    return {};
  }
  return std::format("{:%Y-%m-%dT%H:%M:%SZ}",
                     std::chrono::floor<std::chrono::seconds>(tp));
}

[[nodiscard]] inline auto
format_local_timestamp(std::chrono::system_clock::time_point tp)
    -> std::string {
  if (tp == std::chrono::system_clock::time_point{}) {
    return "-";
  }
  return std::format("{:%Y-%m-%d %H:%M:%S}",
                     std::chrono::floor<std::chrono::seconds>(tp));
}

// Stable build identifier derived from the scheduling time.
[[nodiscard]] inline auto
format_build_id(std::chrono::system_clock::time_point tp) -> std::string {
  return std::format("{:%Y-%m-%d_%H-%M-%S}",
                     std::chrono::floor<std::chrono::seconds>(tp));
}

[[nodiscard]] inline auto
to_unix_millis(std::chrono::system_clock::time_point tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

[[nodiscard]] inline auto from_unix_millis(std::int64_t millis)
    -> std::chrono::system_clock::time_point {
  return std::chrono::system_clock::time_point{
      std::chrono::milliseconds{millis}};
}

} // namespace matrixforge::util
