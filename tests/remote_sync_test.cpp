#include "aoa/workspace/remote_sync.hpp"

#include "test_utils.hpp"

#include <vector>

#include "gtest/gtest.h"

using namespace aoa;
using aoa::test::FakeProcessRunner;
using aoa::test::run_coro;

class RemoteSyncTest : public ::testing::Test {
protected:
  FakeProcessRunner fake_;
  Git git_{fake_};
  test::TempDir repo_;
  WorkspaceProvisioner provisioner_{
      git_, WorkspaceLayout{.repo_root = repo_.path(),
                            .worktree_dir = ".worktrees",
                            .branch_prefix = "agent-"}};
  RemoteSync sync_{git_, repo_.path()};
};

TEST_F(RemoteSyncTest, NoRemote_IsSkipped) {
  auto ws = run_coro(provisioner_.provision(0));
  ASSERT_TRUE(ws.has_value());
  auto outcome = run_coro(sync_.sync(*ws));
  EXPECT_EQ(outcome.status, SyncStatus::Skipped);
  EXPECT_EQ(fake_.count("fetch"), 0);
}

TEST_F(RemoteSyncTest, Remote_FetchesThenPullsSharedBranch) {
  fake_.remote_exit = 0;
  auto ws = run_coro(provisioner_.provision(0));
  ASSERT_TRUE(ws.has_value());

  auto outcome = run_coro(sync_.sync(*ws));
  EXPECT_EQ(outcome.status, SyncStatus::Synced);
  EXPECT_EQ(outcome.detail, "origin/main");
  EXPECT_EQ(fake_.count("fetch"), 1);
  ASSERT_EQ(fake_.count("pull"), 1);
  EXPECT_EQ(fake_.calls.back().args,
            (std::vector<std::string>{"pull", "--no-edit", "origin", "main"}));
  EXPECT_EQ(fake_.calls.back().dir, ws->path);
}

TEST_F(RemoteSyncTest, FetchFailure_IsWarningNotError) {
  fake_.remote_exit = 0;
  fake_.fetch_exit = 128;
  auto ws = run_coro(provisioner_.provision(0));
  ASSERT_TRUE(ws.has_value());

  auto outcome = run_coro(sync_.sync(*ws));
  EXPECT_EQ(outcome.status, SyncStatus::Warning);
  EXPECT_EQ(fake_.count("pull"), 0);
}

TEST_F(RemoteSyncTest, PullFailure_IsWarningNotError) {
  fake_.remote_exit = 0;
  fake_.pull_exit = 1;
  auto ws = run_coro(provisioner_.provision(0));
  ASSERT_TRUE(ws.has_value());

  auto outcome = run_coro(sync_.sync(*ws));
  EXPECT_EQ(outcome.status, SyncStatus::Warning);
}

TEST_F(RemoteSyncTest, WorkspaceNotARepository_IsSkipped) {
  fake_.remote_exit = 0;
  Workspace ghost{.worker = 0,
                  .path = repo_.path() / "gone",
                  .branch = "agent-0",
                  .base_branch = "main"};
  auto outcome = run_coro(sync_.sync(ghost));
  EXPECT_EQ(outcome.status, SyncStatus::Skipped);
}
