#include "matrixforge/orchestrator/fan_out.hpp"

#include "test_utils.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <mutex>
#include <thread>

#include "gtest/gtest.h"

using namespace matrixforge;
using matrixforge::test::env_set;
using matrixforge::test::kFastFanOut;
using matrixforge::test::poll_until;
using matrixforge::test::run_on;

namespace {

constexpr auto kWait = std::chrono::seconds(5);

// Child that finishes with a preset result once its gate opens.
class SyntheticChildJob final : public IChildJob {
public:
  SyntheticChildJob(EnvironmentSet env, BuildResult result,
                    bool gate_open = true)
      : open(gate_open), env_(std::move(env)),
        name_(std::format("demo/main/{}", env_.canonical_name())),
        result_(result) {}

  [[nodiscard]] auto name() const -> const JobName & override { return name_; }
  [[nodiscard]] auto environment() const -> const EnvironmentSet & override {
    return env_;
  }

  [[nodiscard]] auto create_build(const QueueItem &item)
      -> Result<std::shared_ptr<BuildRecord>> override {
    if (vanish) {
      return fail(Error::InvalidState);
    }
    auto build = std::make_shared<BuildRecord>(
        BuildRef{.job = name_, .number = item.request.parent->number});
    build->set_parameters(item.request.parameters);
    std::scoped_lock lock(mutex_);
    builds_[build->number()] = build;
    return build;
  }

  [[nodiscard]] auto perform(std::shared_ptr<BuildRecord> build)
      -> task<BuildResult> override {
    started.store(true);
    while (!open.load()) {
      if (build->is_interrupted()) {
        co_return BuildResult::Aborted;
      }
      co_await async_sleep(std::chrono::milliseconds(5));
    }
    co_return result_;
  }

  [[nodiscard]] auto build_by_number(int number) const
      -> std::shared_ptr<BuildRecord> override {
    if (started.load() && hidden_lookups.load() > 0) {
      --hidden_lookups;
      return nullptr;
    }
    std::scoped_lock lock(mutex_);
    auto it = builds_.find(number);
    return it == builds_.end() ? nullptr : it->second;
  }

  std::atomic<bool> open;
  std::atomic<bool> started{false};
  bool vanish{false};
  // Lookups that miss the running build, as when the queue and executor
  // views briefly disagree.
  mutable std::atomic<int> hidden_lookups{0};

private:
  EnvironmentSet env_;
  JobName name_;
  BuildResult result_;
  mutable std::mutex mutex_;
  std::map<int, std::shared_ptr<BuildRecord>> builds_;
};

class FanOutTest : public ::testing::Test {
protected:
  void SetUp() override { ASSERT_TRUE(rt_.start()); }
  void TearDown() override {
    scheduler_.stop();
    (void)scheduler_.wait_idle(kWait);
    rt_.stop();
  }

  auto run(std::vector<std::shared_ptr<IChildJob>> children,
           Parameters params = {}) -> BuildResult {
    return run_on(rt_, [](FanOutOrchestrator &fan_out, BuildRecord &parent,
                          std::vector<std::shared_ptr<IChildJob>> kids,
                          Parameters p) -> task<BuildResult> {
      co_return co_await fan_out.run(parent, kids, std::move(p));
    }(fan_out_, parent_, std::move(children), std::move(params)));
  }

  Runtime rt_{2};
  JobScheduler scheduler_{rt_, JobSchedulerOptions{.executors = 4,
                                                   .max_queue_length = 64}};
  FanOutOrchestrator fan_out_{scheduler_, kFastFanOut};
  BuildRecord parent_{BuildRef{.job = JobName{"demo/main"}, .number = 7}};
};

auto model_of(std::vector<std::pair<EnvironmentSet, bool>> envs)
    -> ProjectModel {
  std::vector<EnvironmentCommands> builds;
  for (auto &[env, has_command] : envs) {
    if (has_command) {
      builds.push_back({.environment = env, .commands = {"make"}});
    }
  }
  return ProjectModel(std::move(builds), {});
}

} // namespace

TEST(FanOutPrepareTest, ReturnsDeclaredEnvironmentsInOrder) {
  BuildConsole console;
  auto model = model_of({{env_set({"mac"}), true}, {env_set({"linux"}), true}});
  auto envs = FanOutOrchestrator::prepare(model, std::nullopt, console);
  ASSERT_TRUE(envs.has_value());
  EXPECT_EQ(*envs,
            (std::vector<EnvironmentSet>{env_set({"mac"}), env_set({"linux"})}));
  EXPECT_TRUE(console.contains("Checking 2 execution environments"));
}

TEST(FanOutPrepareTest, FilterSkipsEnvironments) {
  BuildConsole console;
  auto model = model_of({{env_set({"mac"}), true}, {env_set({"linux"}), true}});
  auto envs = FanOutOrchestrator::prepare(
      model, EnvironmentConstraint{"linux"}, console);
  ASSERT_TRUE(envs.has_value());
  EXPECT_EQ(*envs, std::vector<EnvironmentSet>{env_set({"linux"})});
  EXPECT_TRUE(console.contains("Skipping mac"));
}

TEST(FanOutPrepareTest, FilterNamesDefaultEnvironment) {
  BuildConsole console;
  auto model = model_of({{EnvironmentSet{}, true}, {env_set({"linux"}), true}});
  auto envs = FanOutOrchestrator::prepare(
      model, EnvironmentConstraint{"default"}, console);
  ASSERT_TRUE(envs.has_value());
  EXPECT_EQ(*envs, std::vector<EnvironmentSet>{EnvironmentSet{}});

  auto linux_only = FanOutOrchestrator::prepare(
      model, EnvironmentConstraint{"linux"}, console);
  ASSERT_TRUE(linux_only.has_value());
  EXPECT_EQ(*linux_only, std::vector<EnvironmentSet>{env_set({"linux"})});
  EXPECT_TRUE(console.contains("Skipping default"));
}

TEST(FanOutPrepareTest, NoEnvironmentsIsModelBuildError) {
  BuildConsole console;
  auto empty = FanOutOrchestrator::prepare(ProjectModel{}, std::nullopt,
                                           console);
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error(), make_error_code(Error::ModelBuildError));

  auto model = model_of({{env_set({"mac"}), true}});
  auto filtered = FanOutOrchestrator::prepare(
      model, EnvironmentConstraint{"windows"}, console);
  ASSERT_FALSE(filtered.has_value());
  EXPECT_EQ(filtered.error(), make_error_code(Error::ModelBuildError));
}

TEST(FanOutPrepareTest, EnvironmentWithoutBuildFailsFast) {
  BuildConsole console;
  ProjectModel model({{.environment = env_set({"linux"}), .commands = {"make"}}},
                     {}, {}, {},
                     {env_set({"linux"}), env_set({"windows"}), env_set({"osx"})});
  auto envs = FanOutOrchestrator::prepare(model, std::nullopt, console);
  ASSERT_FALSE(envs.has_value());
  EXPECT_EQ(envs.error(), make_error_code(Error::NoBuildForEnvironment));
  EXPECT_TRUE(console.contains(" * linux ok"));
  EXPECT_TRUE(console.contains(" * windows missing build"));
  EXPECT_TRUE(console.contains(" * osx missing build"));

  // the filter can drop the environments that cannot be built
  auto filtered = FanOutOrchestrator::prepare(
      model, EnvironmentConstraint{"linux"}, console);
  ASSERT_TRUE(filtered.has_value());
  EXPECT_EQ(filtered->size(), 1U);
}

TEST(FanOutPrepareTest, ListsEveryCheckedEnvironment) {
  BuildConsole console;
  ProjectModel model(
      {{.environment = env_set({"linux"}), .commands = {"make"}},
       {.environment = env_set({"gcc", "linux"}), .commands = {"make gcc"}}},
      {});
  auto envs = FanOutOrchestrator::prepare(model, std::nullopt, console);
  ASSERT_TRUE(envs.has_value());
  EXPECT_EQ(envs->size(), 2U);
  EXPECT_TRUE(console.contains(" * linux ok"));
  EXPECT_TRUE(console.contains(" * gcc,linux ok"));
}

TEST_F(FanOutTest, AllChildrenSucceed) {
  auto a = std::make_shared<SyntheticChildJob>(env_set({"linux"}),
                                               BuildResult::Success);
  auto b = std::make_shared<SyntheticChildJob>(env_set({"mac"}),
                                               BuildResult::Success);
  EXPECT_EQ(run({a, b}, {{"FLAVOR", "release"}}), BuildResult::Success);
  ASSERT_NE(a->build_by_number(7), nullptr);
  EXPECT_EQ(a->build_by_number(7)->parameters().at("FLAVOR"), "release");
  EXPECT_TRUE(parent_.console().contains("Completed linux"));
  EXPECT_FALSE(parent_.error());
}

TEST_F(FanOutTest, WorstChildResultWins) {
  auto a = std::make_shared<SyntheticChildJob>(env_set({"linux"}),
                                               BuildResult::Unstable);
  auto b = std::make_shared<SyntheticChildJob>(env_set({"mac"}),
                                               BuildResult::Failure);
  auto c = std::make_shared<SyntheticChildJob>(env_set({"win"}),
                                               BuildResult::Success);
  EXPECT_EQ(run({a, b, c}), BuildResult::Failure);
  EXPECT_EQ(parent_.error(), make_error_code(Error::ChildExecutionFailure));
}

// Same aggregate whichever child finishes first.
TEST_F(FanOutTest, AggregateIgnoresCompletionOrder) {
  const std::vector<BuildResult> results{
      BuildResult::Unstable, BuildResult::Failure, BuildResult::Success};
  std::vector<std::size_t> order{0, 1, 2};
  do {
    std::vector<std::shared_ptr<SyntheticChildJob>> kids;
    const std::array<std::string, 3> labels{"linux", "mac", "win"};
    for (std::size_t i = 0; i < results.size(); ++i) {
      kids.push_back(std::make_shared<SyntheticChildJob>(
          env_set({labels[i]}), results[i], false));
    }
    auto done = std::async(std::launch::async, [&] {
      return run({kids[0], kids[1], kids[2]});
    });
    EXPECT_TRUE(poll_until(
        [&] {
          return std::ranges::all_of(
              kids, [](const auto &k) { return k->started.load(); });
        },
        kWait));
    for (auto i : order) {
      kids[i]->open.store(true);
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    EXPECT_EQ(done.get(), BuildResult::Failure);
  } while (std::ranges::next_permutation(order).found);
}

TEST_F(FanOutTest, VanishedChildCountsAsAborted) {
  auto ok_child = std::make_shared<SyntheticChildJob>(env_set({"linux"}),
                                                      BuildResult::Success);
  auto gone = std::make_shared<SyntheticChildJob>(env_set({"mac"}),
                                                  BuildResult::Success);
  gone->vanish = true;
  EXPECT_EQ(run({ok_child, gone}), BuildResult::Aborted);
  EXPECT_TRUE(parent_.console().contains("Appears cancelled: mac"));
}

TEST_F(FanOutTest, ShortAbsenceIsNotCancellation) {
  auto child = std::make_shared<SyntheticChildJob>(env_set({"linux"}),
                                                   BuildResult::Unstable, false);
  child->hidden_lookups = kFastFanOut.cancel_debounce - 1;
  std::thread opener([&] {
    EXPECT_TRUE(poll_until(
        [&] {
          return child->started.load() && child->hidden_lookups.load() == 0;
        },
        kWait));
    child->open = true;
  });
  EXPECT_EQ(run({child}), BuildResult::Unstable);
  opener.join();
  EXPECT_FALSE(parent_.console().contains("Appears cancelled"));
  EXPECT_TRUE(parent_.console().contains("Completed linux"));
}

TEST_F(FanOutTest, AbsenceForDebounceCountIsCancellation) {
  auto child = std::make_shared<SyntheticChildJob>(env_set({"linux"}),
                                                   BuildResult::Success, false);
  child->hidden_lookups = kFastFanOut.cancel_debounce;
  EXPECT_EQ(run({child}), BuildResult::Aborted);
  EXPECT_TRUE(parent_.console().contains("Appears cancelled: linux"));
  EXPECT_EQ(child->hidden_lookups.load(), 0);
  EXPECT_TRUE(scheduler_.wait_idle(kWait));
  EXPECT_EQ(child->build_by_number(7)->result(), BuildResult::Aborted);
}

TEST_F(FanOutTest, UnschedulableChildCountsAsAborted) {
  scheduler_.stop();
  auto a = std::make_shared<SyntheticChildJob>(env_set({"linux"}),
                                               BuildResult::Success);
  EXPECT_EQ(run({a}), BuildResult::Aborted);
  EXPECT_TRUE(parent_.console().contains("Failed to schedule linux"));
  EXPECT_EQ(a->build_by_number(7), nullptr);
}

TEST_F(FanOutTest, ParentInterruptStopsRunningChildren) {
  auto a = std::make_shared<SyntheticChildJob>(env_set({"linux"}),
                                               BuildResult::Success, false);
  auto b = std::make_shared<SyntheticChildJob>(env_set({"mac"}),
                                               BuildResult::Success, false);
  std::thread interrupter([&] {
    EXPECT_TRUE(poll_until([&] { return a->started.load() && b->started.load(); },
                           kWait));
    parent_.interrupt();
  });
  EXPECT_EQ(run({a, b}), BuildResult::Aborted);
  interrupter.join();
  EXPECT_TRUE(parent_.console().contains("Interrupting"));
  EXPECT_TRUE(scheduler_.wait_idle(kWait));
  EXPECT_EQ(a->build_by_number(7)->result(), BuildResult::Aborted);
  EXPECT_EQ(b->build_by_number(7)->result(), BuildResult::Aborted);
}

TEST(FanOutQueueTest, ReportsWhyChildIsStillQueued) {
  Runtime rt(2);
  ASSERT_TRUE(rt.start());
  {
    JobScheduler scheduler(rt, JobSchedulerOptions{.executors = 1,
                                                   .max_queue_length = 8});
    FanOutOrchestrator fan_out(scheduler, kFastFanOut);
    BuildRecord parent(BuildRef{.job = JobName{"demo/main"}, .number = 3});

    // Another build holds the only executor slot.
    auto blocker = std::make_shared<SyntheticChildJob>(
        env_set({"other"}), BuildResult::Success, false);
    ASSERT_TRUE(scheduler.schedule(
        blocker,
        ScheduleRequest{.cause = "blocker",
                        .parent = BuildRef{.job = JobName{"demo/other"},
                                           .number = 1},
                        .target = std::nullopt,
                        .parameters = {}}));
    ASSERT_TRUE(poll_until([&] { return blocker->started.load(); }, kWait));

    auto child = std::make_shared<SyntheticChildJob>(env_set({"mac"}),
                                                     BuildResult::Success);
    std::thread releaser([&] {
      EXPECT_TRUE(poll_until(
          [&] { return parent.console().contains("still in the queue"); },
          kWait));
      blocker->open = true;
    });
    std::vector<std::shared_ptr<IChildJob>> children{child};
    auto result = run_on(
        rt, [](FanOutOrchestrator &f, BuildRecord &p,
               std::vector<std::shared_ptr<IChildJob>> kids)
                -> task<BuildResult> {
          co_return co_await f.run(p, kids, {});
        }(fan_out, parent, children));
    releaser.join();
    EXPECT_EQ(result, BuildResult::Success);
    EXPECT_TRUE(parent.console().contains("next available executor"));
    EXPECT_TRUE(scheduler.wait_idle(kWait));
  }
  rt.stop();
}

TEST(FanOutQueueTest, ParentInterruptCancelsQueuedChildren) {
  Runtime rt(2);
  ASSERT_TRUE(rt.start());
  {
    JobScheduler scheduler(rt, JobSchedulerOptions{.executors = 1,
                                                   .max_queue_length = 8});
    FanOutOrchestrator fan_out(scheduler, kFastFanOut);
    BuildRecord parent(BuildRef{.job = JobName{"demo/main"}, .number = 4});

    auto running = std::make_shared<SyntheticChildJob>(
        env_set({"linux"}), BuildResult::Success, false);
    auto queued = std::make_shared<SyntheticChildJob>(env_set({"mac"}),
                                                      BuildResult::Success);
    std::thread interrupter([&] {
      EXPECT_TRUE(poll_until(
          [&] {
            return running->started.load() &&
                   !scheduler.items_for(queued->name()).empty();
          },
          kWait));
      parent.interrupt();
    });
    std::vector<std::shared_ptr<IChildJob>> children{running, queued};
    auto result = run_on(
        rt, [](FanOutOrchestrator &f, BuildRecord &p,
               std::vector<std::shared_ptr<IChildJob>> kids)
                -> task<BuildResult> {
          co_return co_await f.run(p, kids, {});
        }(fan_out, parent, children));
    interrupter.join();

    EXPECT_EQ(result, BuildResult::Aborted);
    EXPECT_TRUE(parent.console().contains("Cancelled mac"));
    EXPECT_TRUE(parent.console().contains("Interrupting linux"));
    EXPECT_TRUE(scheduler.wait_idle(kWait));
    EXPECT_EQ(scheduler.queue_length(), 0U);
    EXPECT_EQ(queued->build_by_number(4), nullptr);
    EXPECT_FALSE(queued->started.load());
    EXPECT_EQ(running->build_by_number(4)->result(), BuildResult::Aborted);
  }
  rt.stop();
}
