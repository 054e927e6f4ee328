#include "matrixforge/orchestrator/fan_out.hpp"

#include "matrixforge/core/interrupt.hpp"
#include "matrixforge/util/log.hpp"

#include <exception>
#include <format>
#include <string>
#include <utility>

namespace matrixforge {

auto FanOutOrchestrator::prepare(
    const ProjectModel &model,
    const std::optional<EnvironmentConstraint> &filter, BuildConsole &console)
    -> Result<std::vector<EnvironmentSet>> {
  auto declared = model.environments();
  if (declared.empty()) {
    console.error("The build description declares no execution environments");
    return fail(Error::ModelBuildError);
  }

  std::vector<EnvironmentSet> envs;
  for (auto &env : declared) {
    if (filter && !env.matches(*filter)) {
      console.println("Skipping {} (excluded by the environment filter)", env);
      continue;
    }
    envs.push_back(std::move(env));
  }
  if (envs.empty()) {
    console.error("No execution environment is left after filtering");
    return fail(Error::ModelBuildError);
  }

  console.println("Checking {} execution environments", envs.size());
  bool all_ok = true;
  for (const auto &env : envs) {
    if (model.build_command_for(env)) {
      console.println(" * {} ok", env);
    } else {
      console.println(" * {} missing build", env);
      all_ok = false;
    }
  }
  if (!all_ok) {
    console.error("Some execution environments have no build command");
    return fail(Error::NoBuildForEnvironment);
  }
  return ok(std::move(envs));
}

auto FanOutOrchestrator::run(
    BuildRecord &parent, std::span<const std::shared_ptr<IChildJob>> children,
    Parameters parameters) -> task<BuildResult> {
  auto &console = parent.console();
  std::vector<std::optional<BuildResult>> results(children.size());
  std::vector<bool> scheduled(children.size(), false);

  for (std::size_t i = 0; i < children.size(); ++i) {
    auto &child = children[i];
    auto handle = scheduler_->schedule(
        child, ScheduleRequest{
                   .cause = std::format("Started by upstream {}", parent.ref()),
                   .parent = parent.ref(),
                   .target = std::nullopt,
                   .parameters = parameters});
    if (!handle) {
      console.warn("Failed to schedule {}", child->environment());
      log::warn("{}: {} for {}", parent.ref(),
                make_error_code(Error::SchedulingFailure).message(),
                child->name());
      results[i] = BuildResult::Aborted;
      continue;
    }
    scheduled[i] = true;
  }

  std::exception_ptr failure;
  try {
    for (std::size_t i = 0; i < children.size(); ++i) {
      if (!scheduled[i]) {
        continue;
      }
      if (parent.is_interrupted()) {
        break;
      }
      results[i] = co_await wait_for(parent, *children[i]);
    }
  } catch (...) {
    failure = std::current_exception();
  }

  cancel_outstanding(parent, children);
  if (failure) {
    std::rethrow_exception(failure);
  }

  auto result = aggregate_results(results);
  if (parent.is_interrupted()) {
    result = combine(result, BuildResult::Aborted);
  }
  if (result != BuildResult::Success) {
    parent.set_error(make_error_code(Error::ChildExecutionFailure));
  }
  co_return result;
}

auto FanOutOrchestrator::wait_for(BuildRecord &parent, IChildJob &child)
    -> task<std::optional<BuildResult>> {
  auto &console = parent.console();
  const auto &env = child.environment();
  console.println("Waiting for the completion of {}...", env);

  const auto started = std::chrono::steady_clock::now();
  std::string last_why;
  int absent = 0;
  while (true) {
    if (auto build = child.build_by_number(parent.number())) {
      if (!build->is_building()) {
        auto result = build->result();
        if (result) {
          console.println("Completed {} {} Result {}", env, build->ref(),
                          to_string_view(*result));
          co_return result;
        }
      }
      absent = 0;
    } else {
      auto items = queued_for(parent, child);
      if (items.empty()) {
        if (++absent >= options_.cancel_debounce) {
          console.println("Appears cancelled: {}", env);
          co_return std::nullopt;
        }
      } else {
        absent = 0;
        const auto &why = items.front().why;
        if (std::chrono::steady_clock::now() - started >=
                options_.queue_report_after &&
            why != last_why) {
          console.println("{} is still in the queue: {}", env, why);
          last_why = why;
        }
      }
    }

    if (!co_await interruptible_sleep(parent.interrupt_signal(),
                                      options_.poll_interval)) {
      co_return std::nullopt;
    }
  }
}

auto FanOutOrchestrator::queued_for(const BuildRecord &parent,
                                    const IChildJob &child) const
    -> std::vector<QueueItem> {
  auto items = scheduler_->items_for(child.name());
  std::erase_if(items, [&](const QueueItem &item) {
    return item.request.parent != parent.ref();
  });
  return items;
}

auto FanOutOrchestrator::cancel_outstanding(
    BuildRecord &parent, std::span<const std::shared_ptr<IChildJob>> children)
    -> void {
  scheduler_->with_queue_lock([&] {
    for (const auto &child : children) {
      for (const auto &item : queued_for(parent, *child)) {
        if (scheduler_->cancel(item.id)) {
          parent.console().println("Cancelled {}", child->environment());
        }
      }
      auto build = child->build_by_number(parent.number());
      if (build && build->is_building()) {
        parent.console().println("Interrupting {} {}", child->environment(),
                                 build->ref());
        build->interrupt();
      }
    }
  });
}

} // namespace matrixforge
