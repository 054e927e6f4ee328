#pragma once

#include "matrixforge/core/runtime.hpp"
#include "matrixforge/scheduler/job.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace matrixforge {

struct ScheduledBuild {
  QueueId queue_id{0};
  /// Resolves to the finished record, or nullptr when the item was cancelled
  /// before it started.
  std::shared_future<std::shared_ptr<BuildRecord>> future;
};

struct JobSchedulerOptions {
  std::size_t executors{2};
  std::size_t max_queue_length{1024};
};

// Bounded build queue with a fixed number of executor slots. Builds run as
// coroutines on the runtime; the queue itself is guarded by one recursive
// mutex that callers can hold through with_queue_lock().
class JobScheduler {
public:
  JobScheduler(Runtime &runtime, JobSchedulerOptions options);
  ~JobScheduler();

  JobScheduler(const JobScheduler &) = delete;
  JobScheduler &operator=(const JobScheduler &) = delete;

  /// Returns nullopt when the scheduler is stopped, the queue is full, or an
  /// item for the same job, parent and target is already waiting.
  [[nodiscard]] auto schedule(std::shared_ptr<IJob> job,
                              ScheduleRequest request)
      -> std::optional<ScheduledBuild>;

  /// Removes a waiting item. Returns false once it has started.
  auto cancel(QueueId id) -> bool;

  [[nodiscard]] auto items_for(const JobName &job) const
      -> std::vector<QueueItem>;
  [[nodiscard]] auto queue_length() const -> std::size_t;
  [[nodiscard]] auto running_count() const -> std::size_t;

  template <typename F> auto with_queue_lock(F &&fn) -> decltype(auto) {
    std::scoped_lock lock(mutex_);
    return std::forward<F>(fn)();
  }

  /// Blocks until nothing is queued or running, or the timeout elapses.
  auto wait_idle(std::chrono::milliseconds timeout) -> bool;

  /// Rejects further schedules and cancels everything still queued.
  auto stop() -> void;

  [[nodiscard]] auto runtime() noexcept -> Runtime & { return *runtime_; }

private:
  struct Pending {
    QueueItem item;
    std::shared_ptr<IJob> job;
    std::shared_ptr<std::promise<std::shared_ptr<BuildRecord>>> promise;
  };

  auto dispatch_locked() -> void;
  auto run_build(std::shared_ptr<IJob> job, std::shared_ptr<BuildRecord> build,
                 std::shared_ptr<std::promise<std::shared_ptr<BuildRecord>>>
                     promise,
                 bool uses_slot) -> spawn_task;
  auto finish_build(bool uses_slot) -> void;

  Runtime *runtime_;
  JobSchedulerOptions options_;

  mutable std::recursive_mutex mutex_;
  std::condition_variable_any idle_cv_;
  std::deque<Pending> queue_;
  std::size_t busy_slots_{0};
  std::size_t running_{0};
  QueueId next_id_{1};
  bool stopped_{false};
};

} // namespace matrixforge
