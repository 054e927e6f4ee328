#include "matrixforge/orchestrator/branch_job.hpp"
#include "matrixforge/promotion/promotion_job.hpp"
#include "matrixforge/storage/build_store.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace matrixforge;
using matrixforge::test::env_set;
using matrixforge::test::kFastFanOut;
using matrixforge::test::Stack;
using matrixforge::test::TempDir;
using matrixforge::test::write_file;

namespace {

const JobName kBranch{"demo/main"};

auto completed_branch_build(int number) -> std::shared_ptr<BranchBuild> {
  auto build =
      std::make_shared<BranchBuild>(BuildRef{.job = kBranch, .number = number});
  build->set_parameters({{"FLAVOR", "release"}});
  build->set_scm_vars({{"GIT_COMMIT", "abc123"}});
  EXPECT_TRUE(build->set_environments({env_set({"linux"}),
                                       env_set({"gcc", "linux"})}));
  build->set_model(std::make_shared<const ProjectModel>(
      std::vector<EnvironmentCommands>{
          {.environment = env_set({"linux"}), .commands = {"make"}}},
      std::vector<TaskCommand>{{.id = "Deploy",
                                .commands = {"./deploy.sh"},
                                .parameters = {{.name = "TARGET",
                                                .default_value = "staging",
                                                .description = {},
                                                .choices = {}}}}}));
  build->console().println("hello from {}", number);
  build->mark_started();
  build->mark_completed(BuildResult::Unstable);
  return build;
}

} // namespace

TEST(BuildStoreTest, BranchBuildRoundTrip) {
  TempDir dir;
  BuildStore store(dir.path());
  auto build = completed_branch_build(3);
  ASSERT_TRUE(build->add_approval(
      {.process = "Deploy",
       .badge = {.user = "alice",
                 .values = {{.name = "TARGET", .value = "prod"}}}}));
  auto [status, inserted] =
      build->promotions().add_if_absent(std::make_shared<PromotionStatus>(
          "Deploy",
          std::vector<PromotionBadge>{
              SelfPromotionBadge{BuildResult::Unstable},
              ManualApprovalBadge{.user = "alice",
                                  .values = {{.name = "TARGET",
                                              .value = "prod"}}},
              UpstreamPromotionBadge{.promotions = {{"QA", 1}}},
              ManualPromotionBadge{.user = "bob"},
              CustomBadge{.kind = "nightly", .values = {{"K", "V"}}}}));
  ASSERT_TRUE(inserted);
  status->add_attempt(1);
  status->add_attempt(2);
  ASSERT_TRUE(status->mark_successful(2));
  ASSERT_TRUE(store.save(*build));

  auto loaded = store.load_branch_builds(kBranch);
  ASSERT_TRUE(loaded.has_value());
  ASSERT_EQ(loaded->size(), 1U);
  const auto &copy = loaded->front();
  EXPECT_EQ(copy->ref(), build->ref());
  EXPECT_EQ(copy->result(), BuildResult::Unstable);
  EXPECT_EQ(copy->phase(), BuildPhase::Completed);
  EXPECT_EQ(copy->parameters(), build->parameters());
  EXPECT_EQ(copy->scm_vars(), build->scm_vars());
  EXPECT_EQ(copy->environments(), build->environments());
  EXPECT_TRUE(copy->console().contains("hello from 3"));
  ASSERT_NE(copy->model(), nullptr);
  ASSERT_TRUE(copy->model()->task_command("deploy").has_value());
  EXPECT_EQ(copy->model()->task_command("deploy")->parameters.at(0).default_value,
            "staging");
  ASSERT_TRUE(copy->approval_for("Deploy").has_value());
  EXPECT_EQ(copy->approval_for("Deploy")->values.at(0).value, "prod");

  auto restored = copy->promotions().find("deploy");
  ASSERT_NE(restored, nullptr);
  EXPECT_EQ(restored->owner(), copy.get());
  EXPECT_EQ(restored->badges(), status->badges());
  EXPECT_EQ(restored->attempts(), (std::vector<int>{1, 2}));
  EXPECT_EQ(restored->successful_attempt(), 2);
  EXPECT_FALSE(restored->claim_schedule());
  EXPECT_EQ(std::chrono::floor<std::chrono::milliseconds>(
                restored->qualified_at()),
            std::chrono::floor<std::chrono::milliseconds>(
                status->qualified_at()));
}

TEST(BuildStoreTest, RunningBuildComesBackAborted) {
  TempDir dir;
  BuildStore store(dir.path());
  auto build =
      std::make_shared<BranchBuild>(BuildRef{.job = kBranch, .number = 1});
  build->mark_started();
  ASSERT_TRUE(store.save(*build));

  auto loaded = store.load_branch_builds(kBranch);
  ASSERT_TRUE(loaded.has_value());
  ASSERT_EQ(loaded->size(), 1U);
  EXPECT_FALSE(loaded->front()->is_building());
  EXPECT_EQ(loaded->front()->result(), BuildResult::Aborted);
  EXPECT_TRUE(
      loaded->front()->console().contains("interrupted by a restart"));
}

TEST(BuildStoreTest, CorruptRecordIsSkipped) {
  TempDir dir;
  BuildStore store(dir.path());
  ASSERT_TRUE(store.save(*completed_branch_build(1)));
  ASSERT_TRUE(store.save(*completed_branch_build(2)));
  write_file(store.branch_dir(kBranch) / "builds" / "1" / "build.json",
             "{ not json");

  auto loaded = store.load_branch_builds(kBranch);
  ASSERT_TRUE(loaded.has_value());
  ASSERT_EQ(loaded->size(), 1U);
  EXPECT_EQ(loaded->front()->number(), 2);
}

TEST(BuildStoreTest, NextBuildNumber) {
  TempDir dir;
  BuildStore store(dir.path());
  auto fresh = store.load_next_build_number(store.branch_dir(kBranch));
  ASSERT_TRUE(fresh.has_value());
  EXPECT_EQ(*fresh, 1);
  ASSERT_TRUE(store.save_next_build_number(store.branch_dir(kBranch), 8));
  EXPECT_EQ(store.load_next_build_number(store.branch_dir(kBranch)).value(), 8);
}

TEST(BuildStoreTest, NamesBecomeSingleDirectories) {
  TempDir dir;
  BuildStore store(dir.path());
  EXPECT_EQ(store.branch_dir(kBranch).parent_path(), dir.path() / "branches");
  EXPECT_EQ(store.promotion_dir(kBranch, "a/b").parent_path(),
            store.branch_dir(kBranch) / "promotions");
  EXPECT_NE(store.environment_dir(kBranch, env_set({"linux"})),
            store.environment_dir(kBranch, env_set({"gcc", "linux"})));
}

TEST(BuildStoreTest, EnvironmentEntriesAndBuilds) {
  TempDir dir;
  BuildStore store(dir.path());
  ASSERT_TRUE(store.save_environment_entry(
      kBranch, {.environment = env_set({"linux"}), .active = true}));
  ASSERT_TRUE(store.save_environment_entry(
      kBranch, {.environment = env_set({"mac"}), .active = false}));

  auto entries = store.load_environment_entries(kBranch);
  ASSERT_TRUE(entries.has_value());
  ASSERT_EQ(entries->size(), 2U);
  for (const auto &e : *entries) {
    EXPECT_EQ(e.active, e.environment == env_set({"linux"}));
  }

  const JobName job{"demo/main/linux"};
  EnvironmentBuild build(BuildRef{.job = job, .number = 4}, env_set({"linux"}),
                         BuildRef{.job = kBranch, .number = 4});
  build.set_workspace(dir.path() / "workspace");
  build.set_archive_dir(dir.path() / "archive");
  build.set_artifacts({"out/a.bin"});
  build.mark_started();
  build.mark_completed(BuildResult::Success);
  ASSERT_TRUE(store.save(kBranch, build));

  auto loaded = store.load_environment_builds(kBranch, job, env_set({"linux"}));
  ASSERT_TRUE(loaded.has_value());
  ASSERT_EQ(loaded->size(), 1U);
  const auto &copy = *loaded->front();
  EXPECT_EQ(copy.parent(), build.parent());
  EXPECT_EQ(copy.workspace(), build.workspace());
  EXPECT_EQ(copy.archive_dir(), build.archive_dir());
  EXPECT_EQ(copy.artifacts(), build.artifacts());
  EXPECT_EQ(copy.result(), BuildResult::Success);
}

TEST(BuildStoreTest, PromotionBuildRoundTrip) {
  TempDir dir;
  BuildStore store(dir.path());
  const JobName job{"demo/main/promotion/QA"};
  PromotionBuild build(BuildRef{.job = job, .number = 2}, "QA",
                       BuildRef{.job = kBranch, .number = 5});
  build.set_workspace(dir.path() / "ws");
  build.mark_started();
  build.mark_completed(BuildResult::NotBuilt);
  ASSERT_TRUE(store.save(kBranch, build));

  auto loaded = store.load_promotion_builds(kBranch, job, "QA");
  ASSERT_TRUE(loaded.has_value());
  ASSERT_EQ(loaded->size(), 1U);
  EXPECT_EQ(loaded->front()->process(), "QA");
  EXPECT_EQ(loaded->front()->target(), build.target());
  EXPECT_EQ(loaded->front()->workspace(), build.workspace());
  EXPECT_EQ(loaded->front()->result(), BuildResult::NotBuilt);
}

// A branch reloaded from the store sees the same builds, environments and
// promotion history, and keeps numbering where it left off.
TEST(BranchReloadTest, RestoresHistory) {
  Stack stack;
  stack.write_description(R"(
[[build]]
environment = ["linux"]
commands = ["echo linux"]

[[build]]
environment = ["mac"]
commands = ["echo mac"]

[[task]]
id = "QA"
commands = ["echo qa"]
)");
  auto settings = stack.settings();
  settings.catalog = std::make_shared<const PromotionCatalog>(
      std::vector<PromotionProcessDefinition>{
          {.name = "QA",
           .display_name = {},
           .environment = std::nullopt,
           .setups = {},
           .conditions = {std::make_shared<SelfPromotionCondition>()}}});
  auto branch = stack.add_branch(settings);
  ASSERT_NE(stack.build(branch), nullptr);
  ASSERT_NE(stack.build(branch), nullptr);
  ASSERT_TRUE(stack.wait_idle());

  auto reloaded = std::make_shared<BranchJob>(
      branch->name(), settings,
      BranchServices{.scheduler = stack.jobs(),
                     .executor = stack.executor(),
                     .store = stack.store(),
                     .model_source = stack.model_source(),
                     .engine = stack.engine(),
                     .fan_out = kFastFanOut,
                     .command_timeout = std::chrono::seconds(30)});
  ASSERT_TRUE(reloaded->load());

  EXPECT_EQ(reloaded->builds().size(), 2U);
  EXPECT_EQ(reloaded->next_build_number(), 3);
  EXPECT_EQ(reloaded->environments().active_sets(),
            branch->environments().active_sets());
  EXPECT_EQ(reloaded->environment_builds(2).size(), 2U);

  auto second = reloaded->find_build(2);
  ASSERT_NE(second, nullptr);
  EXPECT_EQ(second->result(), BuildResult::Success);
  auto status = second->promotions().find("QA");
  ASSERT_NE(status, nullptr);
  EXPECT_EQ(status->owner(), second.get());
  EXPECT_TRUE(status->is_promotion_successful());

  auto qa_job = reloaded->promotion_job("QA");
  ASSERT_NE(qa_job, nullptr);
  EXPECT_EQ(qa_job->builds().size(), 2U);
  ASSERT_NE(qa_job->find_build(*status->successful_attempt()), nullptr);
  EXPECT_EQ(qa_job->find_build(*status->successful_attempt())->target(),
            second->ref());
}
