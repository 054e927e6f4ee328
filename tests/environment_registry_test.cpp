#include "matrixforge/environment/environment_registry.hpp"

#include "test_utils.hpp"

#include <atomic>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

using namespace matrixforge;
using matrixforge::test::env_set;

namespace {

struct FakeHandle {
  explicit FakeHandle(EnvironmentSet e) : env(std::move(e)) {}
  EnvironmentSet env;
  int configured{0};
};

class EnvironmentRegistryTest : public ::testing::Test {
protected:
  auto reconcile(std::vector<EnvironmentSet> envs)
      -> std::vector<std::shared_ptr<FakeHandle>> {
    return registry_.reconcile(
        envs,
        [this](const EnvironmentSet &env) {
          ++created_;
          return std::make_shared<FakeHandle>(env);
        },
        [](FakeHandle &h) { ++h.configured; });
  }

  EnvironmentRegistry<FakeHandle> registry_;
  int created_{0};
};

} // namespace

TEST_F(EnvironmentRegistryTest, CreatesHandlesInResolvedOrder) {
  auto lin = env_set({"linux"});
  auto mac = env_set({"mac"});
  auto active = reconcile({mac, lin});
  ASSERT_EQ(active.size(), 2U);
  EXPECT_EQ(active[0]->env, mac);
  EXPECT_EQ(active[1]->env, lin);
  EXPECT_EQ(created_, 2);
  EXPECT_TRUE(registry_.is_active(lin));
}

TEST_F(EnvironmentRegistryTest, ReusesHandlesAcrossBuilds) {
  auto lin = env_set({"linux"});
  auto first = reconcile({lin});
  auto second = reconcile({lin});
  ASSERT_EQ(second.size(), 1U);
  EXPECT_EQ(first[0], second[0]);
  EXPECT_EQ(created_, 1);
  EXPECT_EQ(second[0]->configured, 2);
}

TEST_F(EnvironmentRegistryTest, DroppedEnvironmentsBecomeInactiveNotRemoved) {
  auto lin = env_set({"linux"});
  auto mac = env_set({"mac"});
  (void)reconcile({lin, mac});
  auto active = reconcile({lin});

  EXPECT_EQ(active.size(), 1U);
  EXPECT_EQ(registry_.size(), 2U);
  EXPECT_FALSE(registry_.is_active(mac));
  EXPECT_NE(registry_.find(mac), nullptr);
  EXPECT_EQ(registry_.inactive_sets(), std::vector<EnvironmentSet>{mac});

  auto back = reconcile({lin, mac});
  EXPECT_EQ(back.size(), 2U);
  EXPECT_EQ(created_, 2);
  EXPECT_TRUE(registry_.is_active(mac));
}

TEST_F(EnvironmentRegistryTest, DuplicateResolvedSetsCollapse) {
  auto lin = env_set({"linux"});
  auto active = reconcile({lin, lin});
  EXPECT_EQ(active.size(), 1U);
}

TEST_F(EnvironmentRegistryTest, RestoreRejectsTakenSet) {
  auto lin = env_set({"linux"});
  EXPECT_TRUE(registry_.restore(lin, std::make_shared<FakeHandle>(lin),
                                false));
  EXPECT_FALSE(registry_.restore(lin, std::make_shared<FakeHandle>(lin),
                                 true));
  EXPECT_FALSE(registry_.is_active(lin));
}

TEST_F(EnvironmentRegistryTest, RemoveInactiveReturnsDroppedSets) {
  auto lin = env_set({"linux"});
  auto mac = env_set({"mac"});
  (void)reconcile({lin, mac});
  (void)reconcile({mac});
  EXPECT_EQ(registry_.remove_inactive(), std::vector<EnvironmentSet>{lin});
  EXPECT_EQ(registry_.find(lin), nullptr);
  EXPECT_EQ(registry_.size(), 1U);
}

TEST_F(EnvironmentRegistryTest, SnapshotIsStableWhileWritersSwap) {
  auto lin = env_set({"linux"});
  (void)reconcile({lin});
  auto snap = registry_.snapshot();
  (void)reconcile({env_set({"mac"})});
  EXPECT_EQ(snap->size(), 1U);
  EXPECT_TRUE(snap->at(lin).active);
  EXPECT_FALSE(registry_.is_active(lin));
}

TEST_F(EnvironmentRegistryTest, ConcurrentReconcileCreatesOneHandlePerSet) {
  std::vector<EnvironmentSet> envs{env_set({"a"}), env_set({"b"}),
                                   env_set({"c"})};
  std::atomic<int> created{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      for (int j = 0; j < 50; ++j) {
        (void)registry_.reconcile(
            envs,
            [&](const EnvironmentSet &env) {
              created.fetch_add(1);
              return std::make_shared<FakeHandle>(env);
            },
            {});
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }
  EXPECT_EQ(created.load(), 3);
  EXPECT_EQ(registry_.active_sets().size(), 3U);
}
