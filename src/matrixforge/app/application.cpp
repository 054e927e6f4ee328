#include "matrixforge/app/application.hpp"

#include "matrixforge/util/log.hpp"

#include <format>

namespace matrixforge {
namespace {

auto fan_out_options(const OrchestratorConfig &cfg) -> FanOutOptions {
  return FanOutOptions{
      .poll_interval = std::chrono::milliseconds(cfg.poll_interval_ms),
      .cancel_debounce = cfg.cancel_debounce,
      .queue_report_after =
          std::chrono::milliseconds(cfg.queue_report_after_ms)};
}

} // namespace

Application::Application(SystemConfig config)
    : config_(std::move(config)),
      runtime_(static_cast<unsigned>(config_.runtime.shards)),
      executor_(create_shell_executor(runtime_, config_.executor.shell)),
      scheduler_(runtime_,
                 JobSchedulerOptions{
                     .executors =
                         static_cast<std::size_t>(config_.runtime.executors),
                     .max_queue_length = static_cast<std::size_t>(
                         config_.runtime.max_queue_length)}),
      store_(config_.storage.root),
      extensions_(PromotionExtensions::with_builtins()),
      engine_(scheduler_, store_),
      registry_(BranchServices{
          .scheduler = scheduler_,
          .executor = *executor_,
          .store = store_,
          .model_source = model_source_,
          .engine = engine_,
          .fan_out = fan_out_options(config_.orchestrator),
          .command_timeout =
              std::chrono::seconds(config_.executor.timeout_sec)}) {}

Application::~Application() { stop(); }

auto Application::setup_logging() -> void {
  log::set_level(config_.log.level);
  if (!config_.log.file.empty() && !log::set_output_file(config_.log.file)) {
    log::warn("Cannot open log file {}, logging to stderr", config_.log.file);
  }
}

auto Application::start() -> Result<void> {
  if (running_.exchange(true)) {
    return ok();
  }
  setup_logging();

  auto runtime_res = runtime_.start();
  if (!runtime_res) {
    running_ = false;
    return fail(runtime_res.error());
  }
  log::start();
  log::info("Runtime started with {} shard(s), {} executor(s)",
            runtime_.shard_count(), config_.runtime.executors);
  return ok();
}

auto Application::stop() noexcept -> void {
  if (!running_.exchange(false)) {
    return;
  }
  log::info("Stopping MatrixForge...");

  // Queued items resolve as cancelled; running builds get a bounded budget.
  scheduler_.stop();
  if (!scheduler_.wait_idle(std::chrono::seconds(3))) {
    log::warn("Shutdown timeout: {} build(s) still running",
              scheduler_.running_count());
  }
  runtime_.stop();
  log::stop();
}

auto Application::open_branch(const std::filesystem::path &file,
                              std::string *diagnostic)
    -> Result<std::shared_ptr<BranchJob>> {
  BranchConfigLoader loader(extensions_);
  auto cfg = loader.load_from_file(file, diagnostic);
  if (!cfg) {
    return fail(cfg.error());
  }

  if (auto existing = registry_.find_branch(cfg->name)) {
    existing->configure(std::move(cfg->settings));
    return ok(std::move(existing));
  }

  auto branch = registry_.add_branch(cfg->name, std::move(cfg->settings));
  if (!branch) {
    if (diagnostic) {
      *diagnostic = std::format("cannot register branch '{}': {}", cfg->name,
                                branch.error().message());
    }
    return fail(branch.error());
  }
  if (auto r = (*branch)->load(); !r) {
    if (diagnostic) {
      *diagnostic = std::format("cannot load history of '{}': {}", cfg->name,
                                r.error().message());
    }
    return fail(r.error());
  }
  return branch;
}

auto Application::trigger_build(const std::shared_ptr<BranchJob> &branch,
                                Parameters parameters, std::string cause)
    -> Result<ScheduledBuild> {
  if (!is_running()) {
    return fail(Error::SystemNotRunning);
  }
  auto handle = scheduler_.schedule(
      branch, ScheduleRequest{.cause = std::move(cause),
                              .parent = std::nullopt,
                              .target = std::nullopt,
                              .parameters = std::move(parameters)});
  if (!handle) {
    log::warn("Could not queue a build of {}", branch->name());
    return fail(Error::SchedulingFailure);
  }
  return ok(std::move(*handle));
}

auto Application::wait_idle(std::chrono::milliseconds timeout) -> bool {
  return scheduler_.wait_idle(timeout);
}

} // namespace matrixforge
