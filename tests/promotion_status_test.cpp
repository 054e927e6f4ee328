#include "matrixforge/promotion/badge.hpp"
#include "matrixforge/promotion/promotion_status.hpp"
#include "matrixforge/record/branch_build.hpp"

#include "test_utils.hpp"

#include <atomic>
#include <thread>

#include "gtest/gtest.h"

using namespace matrixforge;

namespace {

auto make_status(std::string name = "QA") -> std::shared_ptr<PromotionStatus> {
  return std::make_shared<PromotionStatus>(
      std::move(name),
      std::vector<PromotionBadge>{SelfPromotionBadge{BuildResult::Success}});
}

} // namespace

TEST(PromotionStatusTest, ScheduleIsClaimedOnce) {
  auto status = make_status();
  EXPECT_TRUE(status->claim_schedule());
  EXPECT_FALSE(status->claim_schedule());
  status->request_schedule();
  EXPECT_TRUE(status->claim_schedule());
}

TEST(PromotionStatusTest, ConcurrentClaimsHaveOneWinner) {
  auto status = make_status();
  std::atomic<int> winners{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 16; ++i) {
    threads.emplace_back([&] {
      if (status->claim_schedule()) {
        winners.fetch_add(1);
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }
  EXPECT_EQ(winners.load(), 1);
}

TEST(PromotionStatusTest, AttemptsAreRecordedOnce) {
  auto status = make_status();
  EXPECT_FALSE(status->is_promotion_attempted());
  status->add_attempt(1);
  status->add_attempt(1);
  status->add_attempt(2);
  EXPECT_EQ(status->attempts(), (std::vector<int>{1, 2}));
  EXPECT_TRUE(status->is_promotion_attempted());
}

TEST(PromotionStatusTest, FirstSuccessWins) {
  auto status = make_status();
  EXPECT_FALSE(status->mark_successful(1));
  status->add_attempt(1);
  status->add_attempt(2);
  EXPECT_TRUE(status->mark_successful(2));
  EXPECT_FALSE(status->mark_successful(1));
  EXPECT_EQ(status->successful_attempt(), 2);
  EXPECT_TRUE(status->is_promotion_successful());
}

TEST(PromotionStatusTest, RestoredStatusDoesNotReschedule) {
  PromotionStatus restored(PromotionStatusState{
      .name = "Deploy",
      .badges = {ManualPromotionBadge{.user = "bob"}},
      .qualified_at = std::chrono::system_clock::now(),
      .attempts = {1},
      .successful = 3});
  EXPECT_FALSE(restored.claim_schedule());
  EXPECT_EQ(restored.attempts(), (std::vector<int>{1, 3}));
  EXPECT_EQ(restored.snapshot().successful, 3);
  EXPECT_EQ(restored.snapshot().name, "Deploy");
}

TEST(PromotionStatusListTest, NamesIgnoreCase) {
  PromotionStatusList list;
  auto [first, inserted] = list.add_if_absent(make_status("QA"));
  EXPECT_TRUE(inserted);
  auto [second, again] = list.add_if_absent(make_status("qa"));
  EXPECT_FALSE(again);
  EXPECT_EQ(second, first);
  EXPECT_EQ(list.size(), 1U);
  EXPECT_EQ(list.find("Qa"), first);
  EXPECT_FALSE(list.contains("Deploy"));
}

TEST(PromotionStatusListTest, KeepsQualificationOrder) {
  PromotionStatusList list;
  (void)list.add_if_absent(make_status("Deploy"));
  (void)list.add_if_absent(make_status("QA"));
  auto all = list.all();
  ASSERT_EQ(all.size(), 2U);
  EXPECT_EQ(all[0]->name(), "Deploy");
  EXPECT_EQ(all[1]->name(), "QA");
}

TEST(PromotionStatusListTest, RelinkSetsOwner) {
  BranchBuild build(BuildRef{.job = JobName{"demo/main"}, .number = 1});
  auto [status, inserted] = build.promotions().add_if_absent(make_status());
  ASSERT_TRUE(inserted);
  EXPECT_EQ(status->owner(), &build);

  PromotionStatusList detached;
  auto [loose, ok_insert] = detached.add_if_absent(make_status());
  ASSERT_TRUE(ok_insert);
  EXPECT_EQ(loose->owner(), nullptr);
  detached.relink(&build);
  EXPECT_EQ(loose->owner(), &build);
}

TEST(PromotionBadgeTest, DescribesEveryKind) {
  EXPECT_EQ(describe_badge(SelfPromotionBadge{BuildResult::Unstable}),
            "target finished unstable");
  EXPECT_EQ(describe_badge(ManualApprovalBadge{.user = "alice", .values = {}}),
            "approved by alice");
  EXPECT_EQ(describe_badge(UpstreamPromotionBadge{.promotions = {{"QA", 2}}}),
            "after QA #2");
  EXPECT_EQ(describe_badge(ManualPromotionBadge{.user = "bob"}),
            "forced by bob");
  EXPECT_EQ(badge_kind(CustomBadge{.kind = "nightly", .values = {}}),
            BadgeKind::Custom);
  EXPECT_EQ(badge_kind(ManualPromotionBadge{}), BadgeKind::ManualPromotion);
}

TEST(PromotionBadgeTest, ContributesEnvironment) {
  PromotionStatus status(
      "Deploy",
      {SelfPromotionBadge{BuildResult::Success},
       ManualApprovalBadge{.user = "alice",
                           .values = {{.name = "target.host", .value = "h1"}}},
       ManualPromotionBadge{.user = "bob"}});
  std::map<std::string, std::string> env;
  status.contribute_env(env);
  EXPECT_EQ(env.at("PROMOTION_SELF"), "true");
  EXPECT_EQ(env.at("PROMOTION_APPROVER"), "alice");
  EXPECT_EQ(env.at("TARGET_HOST"), "h1");
  EXPECT_EQ(env.at("PROMOTION_FORCED_BY"), "bob");
}

TEST(BranchBuildTest, ApprovalsAreUniquePerProcess) {
  BranchBuild build(BuildRef{.job = JobName{"demo/main"}, .number = 1});
  ASSERT_TRUE(build.add_approval(
      {.process = "Deploy", .badge = {.user = "alice", .values = {}}}));
  auto again = build.add_approval(
      {.process = "deploy", .badge = {.user = "bob", .values = {}}});
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error(), make_error_code(Error::AlreadyExists));
  ASSERT_TRUE(build.approval_for("DEPLOY").has_value());
  EXPECT_EQ(build.approval_for("DEPLOY")->user, "alice");
  EXPECT_FALSE(build.approval_for("QA").has_value());
}

TEST(BranchBuildTest, EnvironmentsAreSetOnce) {
  BranchBuild build(BuildRef{.job = JobName{"demo/main"}, .number = 1});
  EXPECT_FALSE(build.has_environments());
  ASSERT_TRUE(build.set_environments({test::env_set({"linux"})}));
  auto again = build.set_environments({test::env_set({"mac"})});
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error(), make_error_code(Error::InvalidState));
  EXPECT_EQ(build.environments(),
            std::vector<EnvironmentSet>{test::env_set({"linux"})});
}
