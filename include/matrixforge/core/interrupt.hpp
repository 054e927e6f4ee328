#pragma once

#include "matrixforge/core/coroutine.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace matrixforge {

// Cooperative interruption flag with wake-up hooks. A hook subscribed after
// the request runs immediately on the subscribing thread.
class InterruptSignal {
public:
  using Hook = std::move_only_function<void()>;

  InterruptSignal() = default;
  InterruptSignal(const InterruptSignal &) = delete;
  InterruptSignal &operator=(const InterruptSignal &) = delete;

  /// Returns true for the first request only.
  auto request() -> bool;
  [[nodiscard]] auto requested() const noexcept -> bool {
    return requested_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto subscribe(Hook hook) -> std::uint64_t;
  auto unsubscribe(std::uint64_t token) -> void;

private:
  std::atomic<bool> requested_{false};
  std::mutex mutex_;
  std::uint64_t next_token_{1};
  std::vector<std::pair<std::uint64_t, Hook>> hooks_;
};

/// Sleeps on a steady_timer of the calling coroutine's executor. Returns false
/// when the sleep was cut short by `signal`.
[[nodiscard]] auto interruptible_sleep(InterruptSignal &signal,
                                       std::chrono::milliseconds duration)
    -> task<bool>;

} // namespace matrixforge
