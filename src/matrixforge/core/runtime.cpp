#include "matrixforge/core/runtime.hpp"

#include "matrixforge/util/log.hpp"

#include <pthread.h>

#include <exception>
#include <format>
#include <ranges>

namespace matrixforge {

Runtime::Runtime(unsigned num_shards) {
  if (num_shards == 0) {
    num_shards = std::max(1U, std::thread::hardware_concurrency());
  }
  num_shards_ = num_shards;

  contexts_.reserve(num_shards_);
  work_guards_.resize(num_shards_);
  for ([[maybe_unused]] auto i : std::views::iota(0U, num_shards_)) {
    contexts_.emplace_back(std::make_unique<boost::asio::io_context>(1));
  }
}

Runtime::~Runtime() noexcept { stop(); }

auto Runtime::start() -> Result<void> {
  if (running_.exchange(true)) {
    return ok();
  }

  log::debug("Starting runtime with {} shards", num_shards_);

  threads_.reserve(num_shards_);
  for (auto i : std::views::iota(0U, num_shards_)) {
    auto &ctx = *contexts_[i];
    ctx.restart();
    work_guards_[i].emplace(boost::asio::make_work_guard(ctx));
    threads_.emplace_back([this, i] { run_shard(i); });
  }
  return ok();
}

auto Runtime::stop() noexcept -> void {
  if (!running_.exchange(false)) {
    return;
  }

  log::debug("Stopping runtime");
  for (auto i : std::views::iota(0U, num_shards_)) {
    if (work_guards_[i].has_value()) {
      work_guards_[i]->reset();
      work_guards_[i].reset();
    }
    contexts_[i]->stop();
  }
  // A build coroutine may stop the runtime from its own shard; that thread
  // cannot join itself.
  for (auto &t : threads_) {
    if (t.get_id() == std::this_thread::get_id()) {
      t.detach();
    }
  }
  threads_.clear();
}

auto Runtime::is_running() const noexcept -> bool {
  return running_.load(std::memory_order_acquire);
}

auto Runtime::current_shard() const noexcept -> shard_id {
  return detail::current_runtime == this ? detail::current_shard_id
                                         : kInvalidShard;
}

auto Runtime::is_current_shard() const noexcept -> bool {
  return detail::current_runtime == this &&
         detail::current_shard_id != kInvalidShard;
}

auto Runtime::run_shard(shard_id id) -> void {
  detail::current_shard_id = id;
  detail::current_runtime = this;
  const auto name = std::format("mf-shard-{}", id);
  ::pthread_setname_np(::pthread_self(), name.c_str());

  // Exceptions escaping a detached coroutine surface here. The shard keeps
  // serving the other builds on it.
  auto &ctx = *contexts_[id];
  while (true) {
    try {
      ctx.run();
      break;
    } catch (const std::exception &e) {
      log::error("Uncaught exception on shard {}: {}", id, e.what());
    }
  }

  detail::current_shard_id = kInvalidShard;
  detail::current_runtime = nullptr;
}

} // namespace matrixforge
