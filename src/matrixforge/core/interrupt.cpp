#include "matrixforge/core/interrupt.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include <algorithm>
#include <memory>

namespace matrixforge {

auto InterruptSignal::request() -> bool {
  std::vector<std::pair<std::uint64_t, Hook>> fired;
  {
    std::scoped_lock lock(mutex_);
    if (requested_.exchange(true, std::memory_order_acq_rel)) {
      return false;
    }
    fired.swap(hooks_);
  }
  for (auto &[token, hook] : fired) {
    hook();
  }
  return true;
}

auto InterruptSignal::subscribe(Hook hook) -> std::uint64_t {
  std::unique_lock lock(mutex_);
  const auto token = next_token_++;
  if (requested_.load(std::memory_order_acquire)) {
    lock.unlock();
    hook();
    return token;
  }
  hooks_.emplace_back(token, std::move(hook));
  return token;
}

auto InterruptSignal::unsubscribe(std::uint64_t token) -> void {
  std::scoped_lock lock(mutex_);
  std::erase_if(hooks_, [token](const auto &h) { return h.first == token; });
}

auto interruptible_sleep(InterruptSignal &signal,
                         std::chrono::milliseconds duration) -> task<bool> {
  if (signal.requested()) {
    co_return false;
  }
  auto timer = std::make_shared<boost::asio::steady_timer>(
      co_await boost::asio::this_coro::executor, duration);
  std::weak_ptr<boost::asio::steady_timer> weak = timer;
  const auto token = signal.subscribe([weak] {
    if (auto t = weak.lock()) {
      boost::asio::post(t->get_executor(), [t] { t->cancel(); });
    }
  });
  [[maybe_unused]] auto [ec] = co_await timer->async_wait(use_nothrow);
  signal.unsubscribe(token);
  co_return !signal.requested();
}

} // namespace matrixforge
