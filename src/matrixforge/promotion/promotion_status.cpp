#include "matrixforge/promotion/promotion_status.hpp"

#include <boost/algorithm/string/predicate.hpp>

#include <algorithm>

namespace matrixforge {

PromotionStatus::PromotionStatus(std::string name,
                                 std::vector<PromotionBadge> badges)
    : name_(std::move(name)), badges_(std::move(badges)),
      qualified_at_(std::chrono::system_clock::now()) {}

PromotionStatus::PromotionStatus(PromotionStatusState state)
    : name_(std::move(state.name)), badges_(std::move(state.badges)),
      qualified_at_(state.qualified_at), attempts_(std::move(state.attempts)),
      successful_(state.successful), needs_schedule_(false) {
  if (successful_ && !std::ranges::contains(attempts_, *successful_)) {
    attempts_.push_back(*successful_);
    std::ranges::sort(attempts_);
  }
}

auto PromotionStatus::add_attempt(int number) -> void {
  std::scoped_lock lock(mutex_);
  if (!std::ranges::contains(attempts_, number)) {
    attempts_.push_back(number);
  }
}

auto PromotionStatus::attempts() const -> std::vector<int> {
  std::scoped_lock lock(mutex_);
  return attempts_;
}

auto PromotionStatus::mark_successful(int number) -> bool {
  std::scoped_lock lock(mutex_);
  if (successful_ || !std::ranges::contains(attempts_, number)) {
    return false;
  }
  successful_ = number;
  return true;
}

auto PromotionStatus::successful_attempt() const -> std::optional<int> {
  std::scoped_lock lock(mutex_);
  return successful_;
}

auto PromotionStatus::is_promotion_successful() const -> bool {
  return successful_attempt().has_value();
}

auto PromotionStatus::is_promotion_attempted() const -> bool {
  std::scoped_lock lock(mutex_);
  return !attempts_.empty();
}

auto PromotionStatus::claim_schedule() -> bool {
  std::scoped_lock lock(mutex_);
  return std::exchange(needs_schedule_, false);
}

auto PromotionStatus::request_schedule() -> void {
  std::scoped_lock lock(mutex_);
  needs_schedule_ = true;
}

auto PromotionStatus::contribute_env(
    std::map<std::string, std::string> &env) const -> void {
  for (const auto &badge : badges_) {
    matrixforge::contribute_env(badge, env);
  }
}

auto PromotionStatus::snapshot() const -> PromotionStatusState {
  std::scoped_lock lock(mutex_);
  return PromotionStatusState{.name = name_,
                              .badges = badges_,
                              .qualified_at = qualified_at_,
                              .attempts = attempts_,
                              .successful = successful_};
}

auto PromotionStatusList::add_if_absent(std::shared_ptr<PromotionStatus> status)
    -> std::pair<std::shared_ptr<PromotionStatus>, bool> {
  std::scoped_lock lock(mutex_);
  auto it = std::ranges::find_if(statuses_, [&](const auto &s) {
    return boost::algorithm::iequals(s->name(), status->name());
  });
  if (it != statuses_.end()) {
    return {*it, false};
  }
  status->owner_ = owner_;
  statuses_.push_back(status);
  return {std::move(status), true};
}

auto PromotionStatusList::find(std::string_view name) const
    -> std::shared_ptr<PromotionStatus> {
  std::scoped_lock lock(mutex_);
  auto it = std::ranges::find_if(statuses_, [&](const auto &s) {
    return boost::algorithm::iequals(s->name(), name);
  });
  return it == statuses_.end() ? nullptr : *it;
}

auto PromotionStatusList::all() const
    -> std::vector<std::shared_ptr<PromotionStatus>> {
  std::scoped_lock lock(mutex_);
  return statuses_;
}

auto PromotionStatusList::size() const -> std::size_t {
  std::scoped_lock lock(mutex_);
  return statuses_.size();
}

auto PromotionStatusList::relink(BranchBuild *owner) -> void {
  std::scoped_lock lock(mutex_);
  owner_ = owner;
  for (auto &status : statuses_) {
    status->owner_ = owner;
  }
}

} // namespace matrixforge
