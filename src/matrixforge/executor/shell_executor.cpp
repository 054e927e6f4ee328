#include "matrixforge/core/runtime.hpp"
#include "matrixforge/executor/executor.hpp"
#include "matrixforge/executor/executor_utils.hpp"
#include "matrixforge/util/hash.hpp"
#include "matrixforge/util/log.hpp"

#include <ankerl/unordered_dense.h>

#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/cancel_after.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/process/v2/start_dir.hpp>
#include <boost/process/v2/stdio.hpp>

#include <array>
#include <map>
#include <ranges>
#include <csignal>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace matrixforge {

namespace {

namespace bp = boost::process::v2;

inline constexpr std::size_t kMaxOutputSize = 10UZ * 1024 * 1024;
inline constexpr std::size_t kReadBufferSize = 4096;

[[nodiscard]] auto
build_process_env(const std::map<std::string, std::string> &custom)
    -> bp::process_environment {
  std::vector<bp::environment::key_value_pair> env_vec;
  env_vec.reserve(64);

  for (const auto &entry : bp::environment::current()) {
    auto key_sv = entry.key();
    if (custom.contains(std::string(key_sv.data(), key_sv.size()))) {
      continue;
    }
    env_vec.emplace_back(entry);
  }
  for (const auto &[k, v] : custom) {
    env_vec.emplace_back(bp::environment::key{k}, bp::environment::value{v});
  }
  return bp::process_environment(std::move(env_vec));
}

struct WaitProcessResult {
  int exit_code{-1};
  bool timed_out{false};
};

// Pids of running commands owned by one shard; touched only on that shard.
struct ShellShardState {
  ankerl::unordered_dense::map<InstanceId, pid_t> active_processes;
};

class OutputForwarder {
public:
  OutputForwarder(InstanceId id, ExecutionSink &sink)
      : id_(std::move(id)), sink_(&sink) {}

  auto forward(std::string_view data) -> void {
    if (!sink_->on_output || total_ >= kMaxOutputSize) {
      return;
    }
    const auto n = std::min(data.size(), kMaxOutputSize - total_);
    total_ += n;
    sink_->on_output(id_, data.substr(0, n));
  }

private:
  InstanceId id_;
  ExecutionSink *sink_;
  std::size_t total_{0};
};

[[nodiscard]] auto read_pipe_all(boost::asio::readable_pipe &pipe,
                                 OutputForwarder &out,
                                 boost::asio::cancellation_signal &cancel_sig)
    -> task<void> {
  std::array<char, kReadBufferSize> buffer{};
  while (true) {
    auto [ec, bytes] = co_await pipe.async_read_some(
        boost::asio::buffer(buffer.data(), buffer.size()),
        boost::asio::bind_cancellation_slot(cancel_sig.slot(), use_nothrow));
    if (ec) {
      co_return;
    }
    if (bytes > 0) {
      out.forward(std::string_view(buffer.data(), bytes));
    }
  }
}

[[nodiscard]] auto
wait_process_with_timeout(bp::process &proc, std::chrono::seconds timeout,
                          boost::asio::cancellation_signal &cancel_sig)
    -> task<WaitProcessResult> {
  auto [ec, exit_code] =
      co_await proc.async_wait(boost::asio::cancel_after(timeout, use_nothrow));
  if (!ec) {
    co_return WaitProcessResult{.exit_code = exit_code, .timed_out = false};
  }
  if (ec == boost::asio::error::operation_aborted) {
    cancel_sig.emit(boost::asio::cancellation_type::total);
    boost::system::error_code terminate_ec;
    proc.terminate(terminate_ec);
    const auto pid = proc.id();
    if (pid > 0) {
      (void)::kill(pid, SIGKILL);
    }
    [[maybe_unused]] auto [wait_ec, ignored_exit] =
        co_await proc.async_wait(use_nothrow);
    co_return WaitProcessResult{.exit_code = kExitCodeTimeout,
                                .timed_out = true};
  }
  co_return WaitProcessResult{.exit_code = -1, .timed_out = false};
}

auto execute_command(std::string shell, ShellCommand cmd,
                     InstanceId instance_id, ExecutionSink sink,
                     ShellShardState *state) -> spawn_task {
  auto executor = co_await boost::asio::this_coro::executor;
  boost::asio::readable_pipe stdout_pipe(executor);
  boost::asio::readable_pipe stderr_pipe(executor);
  ExecutorResult result;

  std::optional<bp::process> proc;
  try {
    std::vector<std::string> args{"-c", std::move(cmd.command)};
    auto stdio = bp::process_stdio{
        .in = nullptr, .out = stdout_pipe, .err = stderr_pipe};
    auto env = build_process_env(cmd.env);
    if (cmd.working_dir.empty()) {
      proc.emplace(executor, shell, args, std::move(stdio), std::move(env));
    } else {
      proc.emplace(executor, shell, args, std::move(stdio),
                   bp::process_start_dir{std::move(cmd.working_dir)},
                   std::move(env));
    }
  } catch (const std::exception &ex) {
    result.exit_code = -1;
    result.error = ex.what();
    log::error("shell spawn failed: instance_id={} err='{}'", instance_id,
               result.error);
    if (sink.on_complete) {
      sink.on_complete(instance_id, std::move(result));
    }
    co_return;
  }

  const auto pid = proc->id();
  state->active_processes[instance_id] = pid;
  log::debug("shell process started pid={} instance_id={}", pid, instance_id);

  boost::asio::cancellation_signal cancel_sig;
  OutputForwarder out(instance_id, sink);
  using namespace boost::asio::experimental::awaitable_operators;
  auto wait_result =
      co_await (read_pipe_all(stdout_pipe, out, cancel_sig) &&
                read_pipe_all(stderr_pipe, out, cancel_sig) &&
                wait_process_with_timeout(*proc, cmd.timeout, cancel_sig));

  result.timed_out = wait_result.timed_out;
  result.exit_code = wait_result.exit_code;
  if (result.timed_out) {
    result.error = "Execution timeout";
  }

  state->active_processes.erase(instance_id);
  log::debug("shell finish: instance_id={} exit_code={} timed_out={}",
             instance_id, result.exit_code, result.timed_out);
  if (sink.on_complete) {
    sink.on_complete(instance_id, std::move(result));
  }
}

} // namespace

class ShellExecutor final : public IExecutor {
public:
  ShellExecutor(Runtime &rt, std::string shell)
      : runtime_{&rt}, shell_(std::move(shell)),
        shard_states_(rt.shard_count()) {}

  ShellExecutor(const ShellExecutor &) = delete;
  ShellExecutor &operator=(const ShellExecutor &) = delete;

  auto start(ExecutorRequest req, ExecutionSink sink) -> Result<void> override {
    if (req.command.command.empty()) {
      return fail(Error::InvalidArgument);
    }
    for (const auto &key : req.command.env | std::views::keys) {
      if (!is_valid_env_key(key)) {
        log::error("Invalid environment variable key: {}", key);
        return fail(Error::InvalidArgument);
      }
    }
    if (!runtime_->is_running()) {
      return fail(Error::SystemNotRunning);
    }

    log::debug("ShellExecutor start: instance_id={} timeout={}s cmd='{}'",
               req.instance_id, req.command.timeout.count(),
               cmd_preview(req.command.command));

    auto owner = owner_shard(req.instance_id);
    runtime_->spawn_on(owner, execute_command(shell_, std::move(req.command),
                                              req.instance_id, std::move(sink),
                                              &shard_states_[owner]));
    return ok();
  }

  auto cancel(const InstanceId &instance_id) -> void override {
    auto owner = owner_shard(instance_id);
    runtime_->post_to(owner, [this, owner, instance_id] {
      auto &active = shard_states_[owner].active_processes;
      auto it = active.find(instance_id);
      if (it == active.end() || it->second <= 0) {
        return;
      }
      (void)::kill(it->second, SIGKILL);
      log::info("Killed process for instance {}", instance_id);
    });
  }

private:
  [[nodiscard]] auto owner_shard(const InstanceId &instance_id) const noexcept
      -> shard_id {
    return util::shard_of(instance_id, runtime_->shard_count());
  }

  Runtime *runtime_;
  std::string shell_;
  std::vector<ShellShardState> shard_states_;
};

auto create_shell_executor(Runtime &rt, std::string shell)
    -> std::unique_ptr<IExecutor> {
  return std::make_unique<ShellExecutor>(rt, std::move(shell));
}

} // namespace matrixforge
