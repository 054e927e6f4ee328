#pragma once

#include "matrixforge/core/interrupt.hpp"
#include "matrixforge/model/build_result.hpp"
#include "matrixforge/model/parameters.hpp"
#include "matrixforge/util/enum.hpp"
#include "matrixforge/util/id.hpp"
#include "matrixforge/util/log.hpp"

#include <boost/describe/enum.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <format>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace matrixforge {

/// (job, build number) pair. Records reference each other through this
/// instead of pointers so a pruned target simply fails to resolve.
struct BuildRef {
  JobName job;
  int number{0};

  friend auto operator==(const BuildRef &, const BuildRef &) -> bool = default;
};

// Ordered console of one build scope, mirrored to the process log.
class BuildConsole {
public:
  BuildConsole() = default;
  explicit BuildConsole(std::string scope) : scope_(std::move(scope)) {}

  template <typename... Args>
  auto println(std::format_string<Args...> fmt, Args &&...args) -> void {
    append(log::Level::Info, std::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
    append(log::Level::Warn,
           "WARNING: " + std::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
    append(log::Level::Error,
           "ERROR: " + std::format(fmt, std::forward<Args>(args)...));
  }

  auto append(log::Level level, std::string line) -> void;
  auto append_output(std::string_view chunk) -> void;

  [[nodiscard]] auto lines() const -> std::vector<std::string>;
  [[nodiscard]] auto contains(std::string_view needle) const -> bool;
  auto restore(std::vector<std::string> lines) -> void;

private:
  mutable std::mutex mutex_;
  std::string scope_;
  std::vector<std::string> lines_;
  std::string partial_;
};

enum class BuildPhase : std::uint8_t { Queued, Building, Completed };
BOOST_DESCRIBE_ENUM(BuildPhase, Queued, Building, Completed)
MATRIXFORGE_DEFINE_ENUM_SERDE(BuildPhase, BuildPhase::Completed)

/// Plain copy of a record's mutable state, used for persistence.
struct BuildState {
  BuildPhase phase{BuildPhase::Queued};
  std::optional<BuildResult> result;
  Parameters parameters;
  std::chrono::system_clock::time_point scheduled_at;
  std::chrono::system_clock::time_point started_at;
  std::chrono::system_clock::time_point finished_at;
  std::vector<std::string> console;
};

// Common part of branch, environment and promotion builds.
class BuildRecord {
public:
  explicit BuildRecord(BuildRef ref);
  virtual ~BuildRecord() = default;

  BuildRecord(const BuildRecord &) = delete;
  BuildRecord &operator=(const BuildRecord &) = delete;

  [[nodiscard]] auto ref() const noexcept -> const BuildRef & { return ref_; }
  [[nodiscard]] auto job() const noexcept -> const JobName & {
    return ref_.job;
  }
  [[nodiscard]] auto number() const noexcept -> int { return ref_.number; }
  /// Stable identifier derived from the scheduling time.
  [[nodiscard]] auto id() const -> std::string;

  [[nodiscard]] auto console() noexcept -> BuildConsole & { return console_; }
  [[nodiscard]] auto console() const noexcept -> const BuildConsole & {
    return console_;
  }

  [[nodiscard]] auto phase() const noexcept -> BuildPhase {
    return phase_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto is_building() const noexcept -> bool {
    return phase() != BuildPhase::Completed;
  }
  [[nodiscard]] auto result() const -> std::optional<BuildResult>;
  [[nodiscard]] auto parameters() const -> Parameters;
  auto set_parameters(Parameters params) -> void;
  [[nodiscard]] auto scheduled_at() const -> std::chrono::system_clock::time_point;

  /// Scope error that produced a non-success result, if any.
  [[nodiscard]] auto error() const -> std::error_code;
  auto set_error(std::error_code ec) -> void;

  auto mark_started() -> void;
  auto mark_completed(BuildResult result) -> void;

  [[nodiscard]] auto interrupt_signal() noexcept -> InterruptSignal & {
    return interrupt_;
  }
  auto interrupt() -> bool { return interrupt_.request(); }
  [[nodiscard]] auto is_interrupted() const noexcept -> bool {
    return interrupt_.requested();
  }

  [[nodiscard]] auto snapshot_state() const -> BuildState;
  auto restore_state(BuildState state) -> void;

private:
  BuildRef ref_;
  BuildConsole console_;
  InterruptSignal interrupt_;
  std::atomic<BuildPhase> phase_{BuildPhase::Queued};

  mutable std::mutex mutex_;
  std::optional<BuildResult> result_;
  std::error_code error_;
  Parameters parameters_;
  std::chrono::system_clock::time_point scheduled_at_;
  std::chrono::system_clock::time_point started_at_;
  std::chrono::system_clock::time_point finished_at_;
};

} // namespace matrixforge

template <>
struct std::formatter<matrixforge::BuildRef> : std::formatter<std::string> {
  auto format(const matrixforge::BuildRef &ref, auto &ctx) const {
    return std::formatter<std::string>::format(
        std::format("{} #{}", ref.job, ref.number), ctx);
  }
};
