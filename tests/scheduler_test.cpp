#include "matrixforge/scheduler/job_scheduler.hpp"

#include "test_utils.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>

#include "gtest/gtest.h"

using namespace matrixforge;
using matrixforge::test::poll_until;

namespace {

constexpr auto kWait = std::chrono::seconds(5);

// Job whose builds block until the gate opens.
class GatedJob final : public IJob {
public:
  explicit GatedJob(std::string name, bool flyweight = false)
      : name_(std::move(name)), flyweight_(flyweight) {}

  [[nodiscard]] auto name() const -> const JobName & override { return name_; }

  [[nodiscard]] auto create_build(const QueueItem &item)
      -> Result<std::shared_ptr<BuildRecord>> override {
    if (refuse_builds) {
      return fail(Error::InvalidState);
    }
    auto build = std::make_shared<BuildRecord>(
        BuildRef{.job = name_, .number = ++last_number_});
    build->set_parameters(item.request.parameters);
    std::scoped_lock lock(mutex_);
    last_build_ = build;
    return build;
  }

  [[nodiscard]] auto perform(std::shared_ptr<BuildRecord> build)
      -> task<BuildResult> override {
    const int now = active.fetch_add(1) + 1;
    int seen = peak.load();
    while (now > seen && !peak.compare_exchange_weak(seen, now)) {
    }
    while (!open.load() && !build->is_interrupted()) {
      co_await async_sleep(std::chrono::milliseconds(5));
    }
    active.fetch_sub(1);
    if (throw_in_perform) {
      throw std::runtime_error("perform exploded");
    }
    co_return BuildResult::Success;
  }

  auto on_completed(const std::shared_ptr<BuildRecord> &) -> void override {
    completed.fetch_add(1);
  }

  [[nodiscard]] auto is_flyweight() const noexcept -> bool override {
    return flyweight_;
  }

  [[nodiscard]] auto last_build() const -> std::shared_ptr<BuildRecord> {
    std::scoped_lock lock(mutex_);
    return last_build_;
  }

  std::atomic<bool> open{false};
  std::atomic<int> active{0};
  std::atomic<int> peak{0};
  std::atomic<int> completed{0};
  bool refuse_builds{false};
  bool throw_in_perform{false};

private:
  JobName name_;
  bool flyweight_;
  int last_number_{0};
  mutable std::mutex mutex_;
  std::shared_ptr<BuildRecord> last_build_;
};

auto request(std::string cause, int parent = 0) -> ScheduleRequest {
  ScheduleRequest r{.cause = std::move(cause),
                    .parent = std::nullopt,
                    .target = std::nullopt,
                    .parameters = {}};
  if (parent > 0) {
    r.parent = BuildRef{.job = JobName{"demo/main"}, .number = parent};
  }
  return r;
}

class JobSchedulerTest : public ::testing::Test {
protected:
  void SetUp() override { ASSERT_TRUE(rt_.start()); }
  void TearDown() override {
    scheduler_.stop();
    rt_.stop();
  }

  Runtime rt_{2};
  JobScheduler scheduler_{rt_, JobSchedulerOptions{.executors = 2,
                                                   .max_queue_length = 8}};
};

} // namespace

TEST_F(JobSchedulerTest, CompletedBuildResolvesFuture) {
  auto job = std::make_shared<GatedJob>("demo/main/linux");
  job->open = true;
  auto handle = scheduler_.schedule(job, request("test"));
  ASSERT_TRUE(handle.has_value());
  ASSERT_EQ(handle->future.wait_for(kWait), std::future_status::ready);
  auto build = handle->future.get();
  ASSERT_NE(build, nullptr);
  EXPECT_EQ(build->number(), 1);
  EXPECT_EQ(build->result(), BuildResult::Success);
  EXPECT_FALSE(build->is_building());
  EXPECT_TRUE(scheduler_.wait_idle(kWait));
  EXPECT_EQ(job->completed.load(), 1);
}

TEST_F(JobSchedulerTest, ExecutorSlotsBoundConcurrency) {
  std::vector<std::shared_ptr<GatedJob>> jobs;
  for (int i = 0; i < 4; ++i) {
    jobs.push_back(std::make_shared<GatedJob>(std::format("job{}", i)));
    ASSERT_TRUE(scheduler_.schedule(jobs.back(), request("test")));
  }
  EXPECT_TRUE(
      poll_until([&] { return scheduler_.running_count() == 2; }, kWait));
  EXPECT_EQ(scheduler_.queue_length(), 2U);

  auto waiting = scheduler_.items_for(JobName{"job3"});
  ASSERT_EQ(waiting.size(), 1U);
  EXPECT_NE(waiting[0].why.find("next available executor"), std::string::npos);

  for (auto &j : jobs) {
    j->open = true;
  }
  EXPECT_TRUE(scheduler_.wait_idle(kWait));
  for (auto &j : jobs) {
    EXPECT_EQ(j->completed.load(), 1);
  }
}

TEST_F(JobSchedulerTest, FlyweightJobsDoNotTakeSlots) {
  auto heavy_a = std::make_shared<GatedJob>("heavy-a");
  auto heavy_b = std::make_shared<GatedJob>("heavy-b");
  auto coordinator = std::make_shared<GatedJob>("coordinator", true);
  ASSERT_TRUE(scheduler_.schedule(heavy_a, request("test")));
  ASSERT_TRUE(scheduler_.schedule(heavy_b, request("test")));
  ASSERT_TRUE(scheduler_.schedule(coordinator, request("test")));

  EXPECT_TRUE(
      poll_until([&] { return scheduler_.running_count() == 3; }, kWait));
  EXPECT_EQ(scheduler_.queue_length(), 0U);

  heavy_a->open = heavy_b->open = coordinator->open = true;
  EXPECT_TRUE(scheduler_.wait_idle(kWait));
}

TEST_F(JobSchedulerTest, EquivalentQueuedRequestIsRejected) {
  auto blocker_a = std::make_shared<GatedJob>("blocker-a");
  auto blocker_b = std::make_shared<GatedJob>("blocker-b");
  ASSERT_TRUE(scheduler_.schedule(blocker_a, request("fill")));
  ASSERT_TRUE(scheduler_.schedule(blocker_b, request("fill")));

  auto job = std::make_shared<GatedJob>("demo/main/linux");
  EXPECT_TRUE(scheduler_.schedule(job, request("first", 1)));
  EXPECT_FALSE(scheduler_.schedule(job, request("second", 1)));
  EXPECT_TRUE(scheduler_.schedule(job, request("other parent", 2)));
  EXPECT_EQ(scheduler_.items_for(job->name()).size(), 2U);

  blocker_a->open = blocker_b->open = job->open = true;
  EXPECT_TRUE(scheduler_.wait_idle(kWait));
}

TEST_F(JobSchedulerTest, CancelRemovesWaitingItemOnly) {
  auto blocker_a = std::make_shared<GatedJob>("blocker-a");
  auto blocker_b = std::make_shared<GatedJob>("blocker-b");
  auto running = scheduler_.schedule(blocker_a, request("fill"));
  ASSERT_TRUE(running);
  ASSERT_TRUE(scheduler_.schedule(blocker_b, request("fill")));

  auto job = std::make_shared<GatedJob>("queued");
  auto queued = scheduler_.schedule(job, request("test"));
  ASSERT_TRUE(queued);
  EXPECT_TRUE(
      poll_until([&] { return scheduler_.running_count() == 2; }, kWait));

  EXPECT_TRUE(scheduler_.cancel(queued->queue_id));
  ASSERT_EQ(queued->future.wait_for(kWait), std::future_status::ready);
  EXPECT_EQ(queued->future.get(), nullptr);
  EXPECT_FALSE(scheduler_.cancel(queued->queue_id));
  EXPECT_FALSE(scheduler_.cancel(running->queue_id));

  blocker_a->open = blocker_b->open = true;
  EXPECT_TRUE(scheduler_.wait_idle(kWait));
  EXPECT_EQ(job->completed.load(), 0);
}

TEST_F(JobSchedulerTest, QueueLengthIsBounded) {
  JobScheduler small(rt_, JobSchedulerOptions{.executors = 1,
                                              .max_queue_length = 1});
  auto blocker = std::make_shared<GatedJob>("blocker");
  ASSERT_TRUE(small.schedule(blocker, request("run")));
  auto a = std::make_shared<GatedJob>("a");
  auto b = std::make_shared<GatedJob>("b");
  EXPECT_TRUE(small.schedule(a, request("wait")));
  EXPECT_FALSE(small.schedule(b, request("overflow")));
  blocker->open = a->open = true;
  EXPECT_TRUE(small.wait_idle(kWait));
}

TEST_F(JobSchedulerTest, StopResolvesQueuedItemsAndRejectsNewOnes) {
  auto blocker_a = std::make_shared<GatedJob>("blocker-a");
  auto blocker_b = std::make_shared<GatedJob>("blocker-b");
  ASSERT_TRUE(scheduler_.schedule(blocker_a, request("fill")));
  ASSERT_TRUE(scheduler_.schedule(blocker_b, request("fill")));
  auto job = std::make_shared<GatedJob>("queued");
  auto queued = scheduler_.schedule(job, request("test"));
  ASSERT_TRUE(queued);

  scheduler_.stop();
  ASSERT_EQ(queued->future.wait_for(kWait), std::future_status::ready);
  EXPECT_EQ(queued->future.get(), nullptr);
  EXPECT_FALSE(scheduler_.schedule(job, request("late")));

  blocker_a->open = blocker_b->open = true;
  EXPECT_TRUE(scheduler_.wait_idle(kWait));
}

TEST_F(JobSchedulerTest, RefusedBuildResolvesToNull) {
  auto job = std::make_shared<GatedJob>("refusing");
  job->refuse_builds = true;
  auto handle = scheduler_.schedule(job, request("test"));
  ASSERT_TRUE(handle);
  ASSERT_EQ(handle->future.wait_for(kWait), std::future_status::ready);
  EXPECT_EQ(handle->future.get(), nullptr);
}

TEST_F(JobSchedulerTest, ThrowingPerformFails) {
  auto job = std::make_shared<GatedJob>("throwing");
  job->open = true;
  job->throw_in_perform = true;
  auto handle = scheduler_.schedule(job, request("test"));
  ASSERT_TRUE(handle);
  auto build = handle->future.get();
  ASSERT_NE(build, nullptr);
  EXPECT_EQ(build->result(), BuildResult::Failure);
  EXPECT_TRUE(build->console().contains("perform exploded"));
}

TEST_F(JobSchedulerTest, InterruptedBuildIsAborted) {
  auto job = std::make_shared<GatedJob>("interrupted");
  auto handle = scheduler_.schedule(job, request("test"));
  ASSERT_TRUE(handle);
  ASSERT_TRUE(poll_until([&] { return job->active.load() == 1; }, kWait));

  auto running = job->last_build();
  ASSERT_NE(running, nullptr);
  EXPECT_TRUE(running->interrupt());
  EXPECT_FALSE(running->interrupt());

  auto build = handle->future.get();
  ASSERT_EQ(build, running);
  EXPECT_EQ(build->result(), BuildResult::Aborted);
}

TEST(JobSchedulerStoppedRuntimeTest, RejectsWhenRuntimeIsDown) {
  Runtime rt(1);
  JobScheduler scheduler(rt, JobSchedulerOptions{});
  auto job = std::make_shared<GatedJob>("idle");
  EXPECT_FALSE(scheduler.schedule(job, request("test")));
}
