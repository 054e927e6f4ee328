#pragma once

#include "matrixforge/environment/environment_set.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <span>
#include <vector>

namespace matrixforge {

// Per-branch mapping from EnvironmentSet to the job that builds it. Readers
// get an immutable snapshot; writers build a new map and swap it in under
// the writer mutex. Entries are never dropped by reconcile(), only marked
// inactive.
template <typename Handle> class EnvironmentRegistry {
public:
  struct Entry {
    std::shared_ptr<Handle> handle;
    bool active{true};
  };
  using Snapshot = std::map<EnvironmentSet, Entry>;
  using Factory =
      std::function<std::shared_ptr<Handle>(const EnvironmentSet &)>;
  using Configure = std::function<void(Handle &)>;

  EnvironmentRegistry()
      : current_(std::make_shared<const Snapshot>()) {}

  EnvironmentRegistry(const EnvironmentRegistry &) = delete;
  EnvironmentRegistry &operator=(const EnvironmentRegistry &) = delete;

  [[nodiscard]] auto snapshot() const -> std::shared_ptr<const Snapshot> {
    return current_.load(std::memory_order_acquire);
  }

  /// Reuses (and reconfigures) the handle of every resolved set that is
  /// already known, creates the missing ones and deactivates the rest.
  /// Returns the active handles in resolved order, duplicates collapsed.
  auto reconcile(std::span<const EnvironmentSet> resolved,
                 const Factory &create, const Configure &configure)
      -> std::vector<std::shared_ptr<Handle>> {
    std::scoped_lock lock(writer_mutex_);
    auto next = std::make_shared<Snapshot>(*current_.load());
    for (auto &[env, entry] : *next) {
      entry.active = false;
    }

    std::vector<std::shared_ptr<Handle>> active;
    active.reserve(resolved.size());
    for (const auto &env : resolved) {
      auto it = next->find(env);
      if (it == next->end()) {
        it = next->emplace(env, Entry{.handle = create(env)}).first;
      } else if (it->second.active) {
        continue;
      }
      it->second.active = true;
      if (configure) {
        configure(*it->second.handle);
      }
      active.push_back(it->second.handle);
    }

    current_.store(std::move(next), std::memory_order_release);
    return active;
  }

  /// Adds a previously persisted entry. Returns false if `env` is taken.
  auto restore(const EnvironmentSet &env, std::shared_ptr<Handle> handle,
               bool active) -> bool {
    std::scoped_lock lock(writer_mutex_);
    auto next = std::make_shared<Snapshot>(*current_.load());
    if (!next->emplace(env, Entry{.handle = std::move(handle), .active = active})
             .second) {
      return false;
    }
    current_.store(std::move(next), std::memory_order_release);
    return true;
  }

  [[nodiscard]] auto find(const EnvironmentSet &env) const
      -> std::shared_ptr<Handle> {
    auto snap = snapshot();
    auto it = snap->find(env);
    return it == snap->end() ? nullptr : it->second.handle;
  }

  [[nodiscard]] auto is_active(const EnvironmentSet &env) const -> bool {
    auto snap = snapshot();
    auto it = snap->find(env);
    return it != snap->end() && it->second.active;
  }

  [[nodiscard]] auto active_sets() const -> std::vector<EnvironmentSet> {
    return collect(true);
  }
  [[nodiscard]] auto inactive_sets() const -> std::vector<EnvironmentSet> {
    return collect(false);
  }

  /// Drops inactive entries and returns their sets.
  auto remove_inactive() -> std::vector<EnvironmentSet> {
    std::scoped_lock lock(writer_mutex_);
    auto next = std::make_shared<Snapshot>(*current_.load());
    std::vector<EnvironmentSet> removed;
    std::erase_if(*next, [&](const auto &kv) {
      if (kv.second.active) {
        return false;
      }
      removed.push_back(kv.first);
      return true;
    });
    current_.store(std::move(next), std::memory_order_release);
    return removed;
  }

  [[nodiscard]] auto size() const -> std::size_t { return snapshot()->size(); }

private:
  [[nodiscard]] auto collect(bool active) const -> std::vector<EnvironmentSet> {
    std::vector<EnvironmentSet> out;
    for (const auto &[env, entry] : *snapshot()) {
      if (entry.active == active) {
        out.push_back(env);
      }
    }
    return out;
  }

  std::mutex writer_mutex_;
  std::atomic<std::shared_ptr<const Snapshot>> current_;
};

} // namespace matrixforge
