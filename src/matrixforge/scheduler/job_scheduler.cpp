#include "matrixforge/scheduler/job_scheduler.hpp"

#include "matrixforge/util/log.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <ranges>
#include <utility>

namespace matrixforge {

namespace {

[[nodiscard]] auto same_request(const ScheduleRequest &a,
                                const ScheduleRequest &b) -> bool {
  return a.parent == b.parent && a.target == b.target;
}

} // namespace

JobScheduler::JobScheduler(Runtime &runtime, JobSchedulerOptions options)
    : runtime_(&runtime), options_(options) {
  if (options_.executors == 0) {
    options_.executors = 1;
  }
}

JobScheduler::~JobScheduler() { stop(); }

auto JobScheduler::schedule(std::shared_ptr<IJob> job, ScheduleRequest request)
    -> std::optional<ScheduledBuild> {
  std::scoped_lock lock(mutex_);
  if (stopped_ || !runtime_->is_running()) {
    log::warn("Rejected {}: scheduler is not running", job->name());
    return std::nullopt;
  }
  if (queue_.size() >= options_.max_queue_length) {
    log::warn("Rejected {}: queue is full ({} items)", job->name(),
              queue_.size());
    return std::nullopt;
  }
  const bool duplicate = std::ranges::any_of(queue_, [&](const Pending &p) {
    return p.item.job == job->name() && same_request(p.item.request, request);
  });
  if (duplicate) {
    log::debug("Rejected {}: an equivalent item is already queued",
               job->name());
    return std::nullopt;
  }

  auto promise =
      std::make_shared<std::promise<std::shared_ptr<BuildRecord>>>();
  ScheduledBuild out{.queue_id = next_id_++,
                     .future = promise->get_future().share()};
  log::debug("Queued {} (id={}, cause='{}')", job->name(), out.queue_id,
             request.cause);
  queue_.push_back(Pending{
      .item = QueueItem{.id = out.queue_id,
                        .job = job->name(),
                        .request = std::move(request),
                        .enqueued_at = std::chrono::steady_clock::now(),
                        .why = {}},
      .job = std::move(job),
      .promise = std::move(promise)});
  dispatch_locked();
  return out;
}

auto JobScheduler::cancel(QueueId id) -> bool {
  std::scoped_lock lock(mutex_);
  auto it = std::ranges::find(queue_, id,
                              [](const Pending &p) { return p.item.id; });
  if (it == queue_.end()) {
    return false;
  }
  log::debug("Cancelled queue item {} ({})", id, it->item.job);
  it->promise->set_value(nullptr);
  queue_.erase(it);
  idle_cv_.notify_all();
  return true;
}

auto JobScheduler::items_for(const JobName &job) const
    -> std::vector<QueueItem> {
  std::scoped_lock lock(mutex_);
  std::vector<QueueItem> out;
  for (const auto &p : queue_) {
    if (p.item.job == job) {
      auto item = p.item;
      item.why = std::format("Waiting for next available executor ({} of {} "
                             "busy)",
                             busy_slots_, options_.executors);
      out.push_back(std::move(item));
    }
  }
  return out;
}

auto JobScheduler::queue_length() const -> std::size_t {
  std::scoped_lock lock(mutex_);
  return queue_.size();
}

auto JobScheduler::running_count() const -> std::size_t {
  std::scoped_lock lock(mutex_);
  return running_;
}

auto JobScheduler::wait_idle(std::chrono::milliseconds timeout) -> bool {
  std::unique_lock lock(mutex_);
  return idle_cv_.wait_for(lock, timeout,
                           [this] { return queue_.empty() && running_ == 0; });
}

auto JobScheduler::stop() -> void {
  std::scoped_lock lock(mutex_);
  if (stopped_) {
    return;
  }
  stopped_ = true;
  for (auto &p : queue_) {
    p.promise->set_value(nullptr);
  }
  queue_.clear();
  idle_cv_.notify_all();
}

auto JobScheduler::dispatch_locked() -> void {
  auto it = queue_.begin();
  while (it != queue_.end()) {
    const bool uses_slot = !it->job->is_flyweight();
    if (uses_slot && busy_slots_ >= options_.executors) {
      ++it;
      continue;
    }

    auto pending = std::move(*it);
    it = queue_.erase(it);

    auto build = pending.job->create_build(pending.item);
    if (!build) {
      log::warn("Could not start {}: {}", pending.item.job,
                build.error().message());
      pending.promise->set_value(nullptr);
      continue;
    }
    if (uses_slot) {
      ++busy_slots_;
    }
    ++running_;
    runtime_->spawn_external(run_build(std::move(pending.job),
                                       std::move(*build),
                                       std::move(pending.promise), uses_slot));
  }
  idle_cv_.notify_all();
}

auto JobScheduler::run_build(
    std::shared_ptr<IJob> job, std::shared_ptr<BuildRecord> build,
    std::shared_ptr<std::promise<std::shared_ptr<BuildRecord>>> promise,
    bool uses_slot) -> spawn_task {
  build->mark_started();
  log::info("Started {}", build->ref());

  auto result = BuildResult::Failure;
  try {
    result = co_await job->perform(build);
  } catch (const std::exception &ex) {
    build->console().error("{}", ex.what());
    result = BuildResult::Failure;
  }
  if (build->is_interrupted()) {
    result = combine(result, BuildResult::Aborted);
  }
  build->mark_completed(result);
  log::info("Finished {}: {}", build->ref(),
            to_string_view(build->result().value_or(result)));

  try {
    job->on_completed(build);
  } catch (const std::exception &ex) {
    log::error("Completion handler of {} failed: {}", build->ref(), ex.what());
  }
  promise->set_value(build);
  finish_build(uses_slot);
}

auto JobScheduler::finish_build(bool uses_slot) -> void {
  std::scoped_lock lock(mutex_);
  if (uses_slot) {
    --busy_slots_;
  }
  --running_;
  if (!stopped_) {
    dispatch_locked();
  }
  idle_cv_.notify_all();
}

} // namespace matrixforge
