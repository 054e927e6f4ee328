#pragma once

#include "matrixforge/model/build_result.hpp"
#include "matrixforge/promotion/promotion_status.hpp"
#include "matrixforge/record/build_record.hpp"
#include "matrixforge/util/time.hpp"

#include <chrono>
#include <cstdio>
#include <format>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <unistd.h>
#include <vector>

namespace matrixforge::cli::fmt {

namespace ansi {

inline auto is_tty() noexcept -> bool {
  static const bool tty = ::isatty(::fileno(stdout));
  return tty;
}

inline constexpr std::string_view kReset = "\033[0m";
inline constexpr std::string_view kBold = "\033[1m";
inline constexpr std::string_view kDim = "\033[2m";

inline constexpr std::string_view kGreen = "\033[32m";
inline constexpr std::string_view kRed = "\033[31m";
inline constexpr std::string_view kYellow = "\033[33m";
inline constexpr std::string_view kBlue = "\033[34m";

inline auto colorize(std::string_view text, std::string_view color)
    -> std::string {
  if (!is_tty()) {
    return std::string(text);
  }
  return std::format("{}{}{}", color, text, kReset);
}

inline auto bold(std::string_view text) -> std::string {
  return colorize(text, kBold);
}
inline auto green(std::string_view text) -> std::string {
  return colorize(text, kGreen);
}
inline auto red(std::string_view text) -> std::string {
  return colorize(text, kRed);
}
inline auto yellow(std::string_view text) -> std::string {
  return colorize(text, kYellow);
}
inline auto blue(std::string_view text) -> std::string {
  return colorize(text, kBlue);
}
inline auto dim(std::string_view text) -> std::string {
  return colorize(text, kDim);
}

inline auto ansi_visible_width(std::string_view s) -> std::size_t {
  std::size_t width = 0;
  bool in_escape = false;
  for (char c : s) {
    if (in_escape) {
      if (c == 'm')
        in_escape = false;
    } else if (c == '\033') {
      in_escape = true;
    } else {
      ++width;
    }
  }
  return width;
}

} // namespace ansi

inline auto colorize_result(std::optional<BuildResult> result) -> std::string {
  if (!result)
    return ansi::blue("building");
  const auto text = to_string_view(*result);
  switch (*result) {
  case BuildResult::Success:
    return ansi::green(text);
  case BuildResult::Unstable:
    return ansi::yellow(text);
  case BuildResult::NotBuilt:
  case BuildResult::Aborted:
    return ansi::dim(text);
  case BuildResult::Failure:
    break;
  }
  return ansi::red(text);
}

inline auto colorize_progress(PromotionProgress progress) -> std::string {
  const auto text = to_string_view(progress);
  switch (progress) {
  case PromotionProgress::Promoted:
    return ansi::green(text);
  case PromotionProgress::Failed:
    return ansi::red(text);
  case PromotionProgress::Building:
    return ansi::blue(text);
  case PromotionProgress::Queued:
    return ansi::yellow(text);
  case PromotionProgress::NotAttempted:
    break;
  }
  return ansi::dim(text);
}

class Table {
public:
  struct Column {
    std::string header;
    std::size_t width;
    bool right_align{false};
  };

  explicit Table(std::vector<Column> columns) : columns_(std::move(columns)) {}

  auto print_header() const -> void {
    std::size_t total_width = 0;
    for (std::size_t i = 0; i < columns_.size(); ++i) {
      if (i > 0)
        std::print(" ");
      const auto &col = columns_[i];
      if (col.right_align) {
        std::print("{:>{}}", col.header, col.width);
      } else {
        std::print("{:<{}}", col.header, col.width);
      }
      total_width += col.width;
    }
    std::println("");
    total_width += columns_.empty() ? 0 : columns_.size() - 1;
    std::println("{}", std::string(total_width, '-'));
  }

  auto print_row(const std::vector<std::string> &values) const -> void {
    for (std::size_t i = 0; i < columns_.size() && i < values.size(); ++i) {
      if (i > 0)
        std::print(" ");
      const auto &col = columns_[i];
      const auto &val = values[i];
      auto visible = ansi::ansi_visible_width(val);
      auto pad = visible < col.width ? col.width - visible : 0;
      if (col.right_align) {
        std::print("{}{}", std::string(pad, ' '), val);
      } else {
        std::print("{}{}", val, std::string(pad, ' '));
      }
    }
    std::println("");
  }

private:
  std::vector<Column> columns_;
};

inline auto format_duration(const BuildState &state) -> std::string {
  using std::chrono::system_clock;
  if (state.started_at == system_clock::time_point{} ||
      state.finished_at == system_clock::time_point{}) {
    return "-";
  }
  auto dur = std::chrono::duration_cast<std::chrono::seconds>(
                 state.finished_at - state.started_at)
                 .count();
  if (dur < 60)
    return std::format("{}s", dur);
  if (dur < 3600)
    return std::format("{}m {}s", dur / 60, dur % 60);
  return std::format("{}h {}m", dur / 3600, (dur % 3600) / 60);
}

inline auto format_timestamp(std::chrono::system_clock::time_point tp)
    -> std::string {
  return util::format_local_timestamp(tp);
}

} // namespace matrixforge::cli::fmt
