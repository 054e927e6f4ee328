#pragma once

#include "matrixforge/core/coroutine.hpp"
#include "matrixforge/core/error.hpp"
#include "matrixforge/util/id.hpp"

#include <boost/asio/async_result.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace matrixforge {

struct ShellCommand {
  std::string command;
  std::string working_dir;
  std::chrono::seconds timeout{std::chrono::seconds(3600)};
  std::map<std::string, std::string> env;
};

inline constexpr int kExitCodeTimeout = 124;

struct ExecutorResult {
  int exit_code{0};
  bool timed_out{false};
  std::string error;

  [[nodiscard]] auto succeeded() const noexcept -> bool {
    return exit_code == 0 && !timed_out && error.empty();
  }
};

struct ExecutorRequest {
  InstanceId instance_id;
  ShellCommand command;
};

struct ExecutionSink {
  /// Raw stdout and stderr chunks, in arrival order.
  std::move_only_function<void(const InstanceId &, std::string_view data)>
      on_output;
  std::move_only_function<void(const InstanceId &, ExecutorResult result)>
      on_complete;
};

class Runtime;

class IExecutor {
public:
  virtual ~IExecutor() = default;

  virtual auto start(ExecutorRequest req, ExecutionSink sink)
      -> Result<void> = 0;

  /// Kills the process of `instance_id`; a no-op once it has exited.
  virtual auto cancel(const InstanceId &instance_id) -> void = 0;
};

[[nodiscard]] auto create_shell_executor(Runtime &rt,
                                         std::string shell = "/bin/sh")
    -> std::unique_ptr<IExecutor>;

using OutputCallback = std::move_only_function<void(std::string_view)>;

inline auto execute_async(IExecutor &executor, ExecutorRequest req,
                          OutputCallback on_output = {})
    -> task<ExecutorResult> {
  auto result =
      co_await boost::asio::async_initiate<const boost::asio::use_awaitable_t<>,
                                           void(ExecutorResult)>(
          [&executor, req = std::move(req),
           on_output = std::move(on_output)](auto handler) mutable {
            auto shared_h =
                std::make_shared<decltype(handler)>(std::move(handler));
            ExecutionSink sink;
            if (on_output) {
              sink.on_output = [cb = std::move(on_output)](
                                   const InstanceId &,
                                   std::string_view data) mutable { cb(data); };
            }
            sink.on_complete = [shared_h](const InstanceId &,
                                          ExecutorResult res) mutable {
              std::move(*shared_h)(std::move(res));
            };

            auto start_res = executor.start(std::move(req), std::move(sink));
            if (!start_res) {
              // on_complete never fires when start() fails.
              ExecutorResult err_result;
              err_result.exit_code = 1;
              err_result.error = start_res.error().message();
              std::move(*shared_h)(std::move(err_result));
            }
          },
          boost::asio::use_awaitable);

  co_return result;
}

} // namespace matrixforge
