#pragma once

#include "matrixforge/core/coroutine.hpp"
#include "matrixforge/core/runtime.hpp"
#include "matrixforge/executor/executor.hpp"
#include "matrixforge/orchestrator/branch_job.hpp"
#include "matrixforge/orchestrator/job_registry.hpp"
#include "matrixforge/promotion/promotion_engine.hpp"
#include "matrixforge/scheduler/job_scheduler.hpp"
#include "matrixforge/storage/build_store.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include <chrono>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <initializer_list>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <unistd.h>
#include <utility>

namespace matrixforge::test {

// Run a coroutine synchronously on a fresh io_context and return its result.
// Throws if the coroutine does not complete within `timeout`.
template <typename T>
[[nodiscard]] inline auto
run_coro(task<T> coro,
         std::chrono::milliseconds timeout = std::chrono::seconds(10)) -> T {
  boost::asio::io_context io;
  std::exception_ptr eptr;
  std::optional<T> result;
  boost::asio::co_spawn(
      io,
      [&]() -> task<void> {
        result = co_await std::move(coro);
        co_return;
      },
      [&](std::exception_ptr e) { eptr = e; });
  io.run_for(timeout);
  if (!result && !eptr)
    throw std::runtime_error("run_coro timed out");
  if (eptr)
    std::rethrow_exception(eptr);
  return std::move(*result);
}

// Run a coroutine on a shard of a started runtime and block for its result.
template <typename T>
[[nodiscard]] auto run_on(Runtime &rt, task<T> coro,
                          std::chrono::seconds timeout = std::chrono::seconds(30))
    -> T {
  auto promise = std::make_shared<std::promise<T>>();
  auto future = promise->get_future();
  rt.spawn_external([](task<T> inner,
                       std::shared_ptr<std::promise<T>> p) -> spawn_task {
    try {
      p->set_value(co_await std::move(inner));
    } catch (...) {
      p->set_exception(std::current_exception());
    }
  }(std::move(coro), std::move(promise)));
  if (future.wait_for(timeout) != std::future_status::ready) {
    throw std::runtime_error("coroutine timed out");
  }
  return future.get();
}

template <typename Predicate>
[[nodiscard]] inline auto
poll_until(Predicate &&predicate, std::chrono::milliseconds timeout,
           std::chrono::milliseconds interval = std::chrono::milliseconds(10))
    -> bool {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (std::invoke(predicate)) {
      return true;
    }
    std::this_thread::sleep_for(interval);
  }
  return std::invoke(predicate);
}

[[nodiscard]] inline auto
make_temp_dir(std::string_view prefix = "matrixforge_test_") -> std::string {
  std::string templ = std::string("/tmp/") + std::string(prefix) + "XXXXXX";
  char *path = ::mkdtemp(templ.data());
  return path ? std::string(path) : "";
}

// Temporary directory removed on destruction.
class TempDir {
public:
  explicit TempDir(std::string_view prefix = "matrixforge_test_")
      : path_(make_temp_dir(prefix)) {
    if (path_.empty()) {
      throw std::runtime_error("mkdtemp failed");
    }
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  [[nodiscard]] auto path() const -> const std::filesystem::path & {
    return path_;
  }

private:
  std::filesystem::path path_;
};

inline auto write_file(const std::filesystem::path &path,
                       std::string_view content) -> void {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
  if (!out) {
    throw std::runtime_error("cannot write " + path.string());
  }
}

[[nodiscard]] inline auto env_set(std::initializer_list<std::string_view> labels)
    -> EnvironmentSet {
  auto env = EnvironmentSet::of(labels);
  if (!env) {
    throw std::runtime_error("invalid environment labels");
  }
  return std::move(*env);
}

inline constexpr FanOutOptions kFastFanOut{
    .poll_interval = std::chrono::milliseconds(10),
    .cancel_debounce = 3,
    .queue_report_after = std::chrono::milliseconds(50)};

// Runtime, shell executor, scheduler, store, promotion engine and registry
// wired the way the application wires them, against a temporary store and
// repository.
class Stack {
public:
  explicit Stack(std::size_t executors = 4)
      : runtime_(2), store_(dir_.path() / "store"),
        engine_(std::in_place, start_scheduler(executors), store_) {
    repository_ = dir_.path() / "repo";
    std::filesystem::create_directories(repository_);
    registry_.emplace(BranchServices{.scheduler = *scheduler_,
                                     .executor = *executor_,
                                     .store = store_,
                                     .model_source = model_source_,
                                     .engine = *engine_,
                                     .fan_out = kFastFanOut,
                                     .command_timeout =
                                         std::chrono::seconds(30)});
  }

  ~Stack() {
    if (scheduler_) {
      scheduler_->stop();
      (void)scheduler_->wait_idle(std::chrono::seconds(5));
    }
    runtime_.stop();
  }

  Stack(const Stack &) = delete;
  Stack &operator=(const Stack &) = delete;

  /// Writes the build description read by every branch of this stack.
  auto write_description(std::string_view toml) -> void {
    write_file(repository_ / std::string(kDefaultMarkerFile), toml);
  }

  [[nodiscard]] auto settings() const -> BranchSettings {
    BranchSettings s;
    s.repository = repository_;
    s.scm = {{"GIT_COMMIT", "abc123"}, {"GIT_BRANCH", "main"}};
    return s;
  }

  [[nodiscard]] auto add_branch(BranchSettings s,
                                std::string_view name = "demo/main")
      -> std::shared_ptr<BranchJob> {
    auto branch = registry_->add_branch(JobName{name}, std::move(s));
    if (!branch) {
      throw std::runtime_error("add_branch failed");
    }
    return *branch;
  }

  /// Schedules a branch build and blocks until it has completed.
  [[nodiscard]] auto build(const std::shared_ptr<BranchJob> &branch,
                           Parameters params = {})
      -> std::shared_ptr<BranchBuild> {
    auto handle = scheduler_->schedule(
        branch, ScheduleRequest{.cause = "Started by test",
                                .parent = std::nullopt,
                                .target = std::nullopt,
                                .parameters = std::move(params)});
    if (!handle) {
      return nullptr;
    }
    if (handle->future.wait_for(std::chrono::seconds(30)) !=
        std::future_status::ready) {
      return nullptr;
    }
    return std::dynamic_pointer_cast<BranchBuild>(handle->future.get());
  }

  auto wait_idle() -> bool {
    return scheduler_->wait_idle(std::chrono::seconds(30));
  }

  [[nodiscard]] auto runtime() -> Runtime & { return runtime_; }
  [[nodiscard]] auto executor() -> IExecutor & { return *executor_; }
  [[nodiscard]] auto jobs() -> JobScheduler & { return *scheduler_; }
  [[nodiscard]] auto store() -> BuildStore & { return store_; }
  [[nodiscard]] auto engine() -> PromotionEngine & { return *engine_; }
  [[nodiscard]] auto registry() -> JobRegistry & { return *registry_; }
  [[nodiscard]] auto model_source() const -> const IModelSource & {
    return model_source_;
  }
  [[nodiscard]] auto repository() const -> const std::filesystem::path & {
    return repository_;
  }
  [[nodiscard]] auto root() const -> const std::filesystem::path & {
    return dir_.path();
  }

private:
  auto start_scheduler(std::size_t executors) -> JobScheduler & {
    if (!runtime_.is_running() && !runtime_.start()) {
      throw std::runtime_error("runtime failed to start");
    }
    executor_ = create_shell_executor(runtime_);
    scheduler_.emplace(runtime_, JobSchedulerOptions{.executors = executors,
                                                     .max_queue_length = 256});
    return *scheduler_;
  }

  TempDir dir_;
  Runtime runtime_;
  std::unique_ptr<IExecutor> executor_;
  std::optional<JobScheduler> scheduler_;
  BuildStore store_;
  TomlModelSource model_source_;
  std::optional<PromotionEngine> engine_;
  std::optional<JobRegistry> registry_;
  std::filesystem::path repository_;
};

} // namespace matrixforge::test
