#pragma once

#include "matrixforge/core/coroutine.hpp"
#include "matrixforge/core/error.hpp"
#include "matrixforge/model/build_result.hpp"
#include "matrixforge/model/parameters.hpp"
#include "matrixforge/record/build_record.hpp"
#include "matrixforge/util/id.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace matrixforge {

struct ScheduleRequest {
  std::string cause;
  /// Coordinating build, so that cancellation can find queued children.
  std::optional<BuildRef> parent;
  /// Build a promotion acts on.
  std::optional<BuildRef> target;
  Parameters parameters;
};

using QueueId = std::uint64_t;

struct QueueItem {
  QueueId id{0};
  JobName job;
  ScheduleRequest request;
  std::chrono::steady_clock::time_point enqueued_at;
  /// Why the item has not started yet.
  std::string why;
};

// A schedulable unit: branch coordinator, environment build or promotion.
class IJob {
public:
  virtual ~IJob() = default;

  [[nodiscard]] virtual auto name() const -> const JobName & = 0;

  /// Called under the queue lock when the item leaves the queue.
  [[nodiscard]] virtual auto create_build(const QueueItem &item)
      -> Result<std::shared_ptr<BuildRecord>> = 0;

  [[nodiscard]] virtual auto perform(std::shared_ptr<BuildRecord> build)
      -> task<BuildResult> = 0;

  /// Runs after the record is marked completed.
  virtual auto on_completed(const std::shared_ptr<BuildRecord> &build)
      -> void {
    (void)build;
  }

  /// Coordinators that only wait on other builds do not take an executor
  /// slot.
  [[nodiscard]] virtual auto is_flyweight() const noexcept -> bool {
    return false;
  }
};

} // namespace matrixforge
