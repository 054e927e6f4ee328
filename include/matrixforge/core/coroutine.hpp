#pragma once

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>

#include <chrono>

namespace matrixforge {

// Every build step, fan-out wait and promotion attempt is one of these,
// running on a Runtime shard.
template <typename T = void> using task = boost::asio::awaitable<T>;

using spawn_task = task<void>;

using boost::asio::co_spawn;
using boost::asio::detached;
using boost::asio::use_awaitable;

/// Completion token that reports errors as a tuple element instead of
/// throwing; used wherever a cancelled wait is an expected outcome.
inline constexpr auto use_nothrow =
    boost::asio::as_tuple(boost::asio::use_awaitable);

/// Re-queues the calling coroutine behind whatever is ready on its executor.
[[nodiscard]] inline auto async_yield() -> spawn_task {
  auto executor = co_await boost::asio::this_coro::executor;
  co_await boost::asio::post(executor, use_awaitable);
}

/// Timer wait on the calling coroutine's executor. Cancellation ends the
/// wait early without an exception; poll loops check their interrupt flag
/// right after.
template <typename Rep, typename Period>
[[nodiscard]] auto async_sleep(std::chrono::duration<Rep, Period> duration)
    -> spawn_task {
  boost::asio::steady_timer timer(
      co_await boost::asio::this_coro::executor,
      std::chrono::duration_cast<std::chrono::nanoseconds>(duration));
  auto [ec] = co_await timer.async_wait(use_nothrow);
  if (ec && ec != boost::asio::error::operation_aborted) {
    throw boost::system::system_error(ec);
  }
}

} // namespace matrixforge
