#pragma once

#include "matrixforge/config/branch_config.hpp"
#include "matrixforge/config/system_config.hpp"
#include "matrixforge/core/error.hpp"
#include "matrixforge/core/runtime.hpp"
#include "matrixforge/executor/executor.hpp"
#include "matrixforge/model/project_model.hpp"
#include "matrixforge/orchestrator/job_registry.hpp"
#include "matrixforge/promotion/extensions.hpp"
#include "matrixforge/promotion/promotion_engine.hpp"
#include "matrixforge/scheduler/job_scheduler.hpp"
#include "matrixforge/storage/build_store.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace matrixforge {

// Owns the runtime and every process-wide service, and wires them into the
// job registry. One instance per process.
class Application {
public:
  explicit Application(SystemConfig config);
  ~Application();

  Application(const Application &) = delete;
  auto operator=(const Application &) -> Application & = delete;

  [[nodiscard]] auto config() const noexcept -> const SystemConfig & {
    return config_;
  }

  // Lifecycle
  [[nodiscard]] auto start() -> Result<void>;
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }

  /// Reads a branch file, registers the branch and loads its history.
  /// An already registered branch is reconfigured instead.
  [[nodiscard]] auto open_branch(const std::filesystem::path &file,
                                 std::string *diagnostic = nullptr)
      -> Result<std::shared_ptr<BranchJob>>;

  [[nodiscard]] auto trigger_build(const std::shared_ptr<BranchJob> &branch,
                                   Parameters parameters, std::string cause)
      -> Result<ScheduledBuild>;

  /// Blocks until the queue drains; false on timeout.
  auto wait_idle(std::chrono::milliseconds timeout) -> bool;

  [[nodiscard]] auto registry() noexcept -> JobRegistry & { return registry_; }
  [[nodiscard]] auto engine() noexcept -> PromotionEngine & { return engine_; }
  [[nodiscard]] auto scheduler() noexcept -> JobScheduler & {
    return scheduler_;
  }
  [[nodiscard]] auto store() noexcept -> BuildStore & { return store_; }
  [[nodiscard]] auto extensions() const noexcept
      -> const PromotionExtensions & {
    return extensions_;
  }
  [[nodiscard]] auto runtime() noexcept -> Runtime & { return runtime_; }

private:
  auto setup_logging() -> void;

  std::atomic<bool> running_{false};
  SystemConfig config_;

  // Core runtime
  Runtime runtime_;
  std::unique_ptr<IExecutor> executor_;

  // Services
  JobScheduler scheduler_;
  BuildStore store_;
  TomlModelSource model_source_;
  PromotionExtensions extensions_;
  PromotionEngine engine_;
  JobRegistry registry_;
};

} // namespace matrixforge
