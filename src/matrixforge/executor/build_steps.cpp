#include "matrixforge/executor/build_steps.hpp"

#include "matrixforge/executor/executor_utils.hpp"
#include "matrixforge/util/id.hpp"

namespace matrixforge {

auto run_build_steps(IExecutor &executor, BuildRecord &build,
                     const std::vector<std::string> &commands,
                     ShellCommand base) -> task<BuildResult> {
  for (std::size_t step = 0; step < commands.size(); ++step) {
    if (build.is_interrupted()) {
      build.console().println("Interrupted before step {}", step + 1);
      co_return BuildResult::Aborted;
    }

    auto id = generate_instance_id(build.job(), build.number(), step);
    auto command = base;
    command.command = commands[step];
    build.console().println("$ {}", cmd_preview(command.command));

    const auto token = build.interrupt_signal().subscribe(
        [&executor, id] { executor.cancel(id); });
    auto result = co_await execute_async(
        executor, ExecutorRequest{.instance_id = id, .command = std::move(command)},
        [&build](std::string_view data) { build.console().append_output(data); });
    build.interrupt_signal().unsubscribe(token);

    if (build.is_interrupted()) {
      build.console().println("Aborted");
      co_return BuildResult::Aborted;
    }
    if (!result.succeeded()) {
      if (!result.error.empty()) {
        build.console().error("{}", result.error);
      }
      build.console().error("Command exited with code {}", result.exit_code);
      co_return BuildResult::Failure;
    }
  }
  co_return BuildResult::Success;
}

} // namespace matrixforge
