#include "matrixforge/record/build_record.hpp"

#include "matrixforge/util/time.hpp"

#include <algorithm>
#include <ranges>

namespace matrixforge {

auto BuildConsole::append(log::Level level, std::string line) -> void {
  std::scoped_lock lock(mutex_);
  if (!scope_.empty()) {
    log::logger().write_line(level, std::format("[{}] {}", scope_, line));
  }
  lines_.push_back(std::move(line));
}

auto BuildConsole::append_output(std::string_view chunk) -> void {
  std::scoped_lock lock(mutex_);
  partial_.append(chunk);
  std::size_t pos = 0;
  while ((pos = partial_.find('\n')) != std::string::npos) {
    lines_.emplace_back(partial_.substr(0, pos));
    partial_.erase(0, pos + 1);
  }
}

auto BuildConsole::lines() const -> std::vector<std::string> {
  std::scoped_lock lock(mutex_);
  auto out = lines_;
  if (!partial_.empty()) {
    out.push_back(partial_);
  }
  return out;
}

auto BuildConsole::contains(std::string_view needle) const -> bool {
  std::scoped_lock lock(mutex_);
  return std::ranges::any_of(lines_, [needle](const auto &line) {
    return line.find(needle) != std::string::npos;
  });
}

auto BuildConsole::restore(std::vector<std::string> lines) -> void {
  std::scoped_lock lock(mutex_);
  lines_ = std::move(lines);
  partial_.clear();
}

BuildRecord::BuildRecord(BuildRef ref)
    : ref_(std::move(ref)), console_(std::format("{}", ref_)),
      scheduled_at_(std::chrono::system_clock::now()) {}

auto BuildRecord::id() const -> std::string {
  return util::format_build_id(scheduled_at());
}

auto BuildRecord::result() const -> std::optional<BuildResult> {
  std::scoped_lock lock(mutex_);
  return result_;
}

auto BuildRecord::parameters() const -> Parameters {
  std::scoped_lock lock(mutex_);
  return parameters_;
}

auto BuildRecord::set_parameters(Parameters params) -> void {
  std::scoped_lock lock(mutex_);
  parameters_ = std::move(params);
}

auto BuildRecord::scheduled_at() const
    -> std::chrono::system_clock::time_point {
  std::scoped_lock lock(mutex_);
  return scheduled_at_;
}

auto BuildRecord::error() const -> std::error_code {
  std::scoped_lock lock(mutex_);
  return error_;
}

auto BuildRecord::set_error(std::error_code ec) -> void {
  std::scoped_lock lock(mutex_);
  if (!error_) {
    error_ = ec;
  }
}

auto BuildRecord::mark_started() -> void {
  {
    std::scoped_lock lock(mutex_);
    started_at_ = std::chrono::system_clock::now();
  }
  phase_.store(BuildPhase::Building, std::memory_order_release);
}

auto BuildRecord::mark_completed(BuildResult result) -> void {
  {
    std::scoped_lock lock(mutex_);
    result_ = result_ ? combine(*result_, result) : result;
    finished_at_ = std::chrono::system_clock::now();
  }
  phase_.store(BuildPhase::Completed, std::memory_order_release);
}

auto BuildRecord::snapshot_state() const -> BuildState {
  BuildState out;
  out.phase = phase();
  {
    std::scoped_lock lock(mutex_);
    out.result = result_;
    out.parameters = parameters_;
    out.scheduled_at = scheduled_at_;
    out.started_at = started_at_;
    out.finished_at = finished_at_;
  }
  out.console = console_.lines();
  return out;
}

auto BuildRecord::restore_state(BuildState state) -> void {
  {
    std::scoped_lock lock(mutex_);
    result_ = state.result;
    parameters_ = std::move(state.parameters);
    scheduled_at_ = state.scheduled_at;
    started_at_ = state.started_at;
    finished_at_ = state.finished_at;
  }
  console_.restore(std::move(state.console));
  phase_.store(state.phase, std::memory_order_release);
}

} // namespace matrixforge
