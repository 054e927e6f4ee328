#pragma once

#include "matrixforge/promotion/badge.hpp"
#include "matrixforge/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace matrixforge {

class BranchBuild;

/// Persisted form of a PromotionStatus; the owning build is implied by where
/// it is stored.
struct PromotionStatusState {
  std::string name;
  std::vector<PromotionBadge> badges;
  std::chrono::system_clock::time_point qualified_at;
  std::vector<int> attempts;
  std::optional<int> successful;
};

// Qualification record of one promotion process for one target build. Exists
// only once the process qualified; attempts are appended as promotion builds
// start and the successful attempt is set at most once.
class PromotionStatus {
public:
  PromotionStatus(std::string name, std::vector<PromotionBadge> badges);
  explicit PromotionStatus(PromotionStatusState state);

  PromotionStatus(const PromotionStatus &) = delete;
  PromotionStatus &operator=(const PromotionStatus &) = delete;

  [[nodiscard]] auto name() const noexcept -> const std::string & {
    return name_;
  }
  [[nodiscard]] auto badges() const noexcept
      -> const std::vector<PromotionBadge> & {
    return badges_;
  }
  [[nodiscard]] auto qualified_at() const noexcept
      -> std::chrono::system_clock::time_point {
    return qualified_at_;
  }

  /// Owning target build; relinked after load, never persisted.
  [[nodiscard]] auto owner() const noexcept -> BranchBuild * { return owner_; }

  auto add_attempt(int number) -> void;
  [[nodiscard]] auto attempts() const -> std::vector<int>;

  /// First write wins; `number` must already be a recorded attempt.
  auto mark_successful(int number) -> bool;
  [[nodiscard]] auto successful_attempt() const -> std::optional<int>;
  [[nodiscard]] auto is_promotion_successful() const -> bool;
  [[nodiscard]] auto is_promotion_attempted() const -> bool;

  /// True exactly once per pending request to schedule an attempt.
  [[nodiscard]] auto claim_schedule() -> bool;
  auto request_schedule() -> void;

  auto contribute_env(std::map<std::string, std::string> &env) const -> void;

  [[nodiscard]] auto snapshot() const -> PromotionStatusState;

private:
  friend class PromotionStatusList;

  std::string name_;
  std::vector<PromotionBadge> badges_;
  std::chrono::system_clock::time_point qualified_at_;
  BranchBuild *owner_{nullptr};

  mutable std::mutex mutex_;
  std::vector<int> attempts_;
  std::optional<int> successful_;
  bool needs_schedule_{true};
};

// Statuses of one target build in qualification order. Process names compare
// case-insensitively.
class PromotionStatusList {
public:
  PromotionStatusList() = default;
  PromotionStatusList(const PromotionStatusList &) = delete;
  PromotionStatusList &operator=(const PromotionStatusList &) = delete;

  /// Inserts `status` unless one with the same name exists. Returns the
  /// stored status and whether it was inserted.
  auto add_if_absent(std::shared_ptr<PromotionStatus> status)
      -> std::pair<std::shared_ptr<PromotionStatus>, bool>;

  [[nodiscard]] auto find(std::string_view name) const
      -> std::shared_ptr<PromotionStatus>;
  [[nodiscard]] auto contains(std::string_view name) const -> bool {
    return find(name) != nullptr;
  }
  [[nodiscard]] auto all() const -> std::vector<std::shared_ptr<PromotionStatus>>;
  [[nodiscard]] auto size() const -> std::size_t;

  /// Re-establishes every status' owner after load.
  auto relink(BranchBuild *owner) -> void;

private:
  mutable std::mutex mutex_;
  BranchBuild *owner_{nullptr};
  std::vector<std::shared_ptr<PromotionStatus>> statuses_;
};

enum class PromotionProgress : std::uint8_t {
  NotAttempted,
  Queued,
  Building,
  Failed,
  Promoted,
};
BOOST_DESCRIBE_ENUM(PromotionProgress, NotAttempted, Queued, Building, Failed,
                    Promoted)
MATRIXFORGE_DEFINE_ENUM_SERDE(PromotionProgress, PromotionProgress::NotAttempted)

} // namespace matrixforge
