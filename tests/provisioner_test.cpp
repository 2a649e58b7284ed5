#include "aoa/workspace/provisioner.hpp"

#include "test_utils.hpp"

#include <filesystem>

#include "gtest/gtest.h"

using namespace aoa;
using aoa::test::FakeProcessRunner;
using aoa::test::run_coro;

class ProvisionerTest : public ::testing::Test {
protected:
  FakeProcessRunner fake_;
  Git git_{fake_};
  test::TempDir repo_;
  WorkspaceProvisioner provisioner_{
      git_, WorkspaceLayout{.repo_root = repo_.path(),
                            .worktree_dir = ".worktrees",
                            .branch_prefix = "agent-"}};
};

TEST_F(ProvisionerTest, PathAndBranch_DerivedFromWorkerId) {
  EXPECT_EQ(provisioner_.branch_for(4), "agent-4");
  EXPECT_EQ(provisioner_.path_for(4), repo_.path() / ".worktrees" / "agent-4");
}

TEST_F(ProvisionerTest, AbsoluteWorktreeDir_IsKept) {
  test::TempDir elsewhere;
  WorkspaceProvisioner p(git_,
                         WorkspaceLayout{.repo_root = repo_.path(),
                                         .worktree_dir = elsewhere.path(),
                                         .branch_prefix = "job-"});
  EXPECT_EQ(p.path_for(0), elsewhere.path() / "job-0");
}

TEST_F(ProvisionerTest, Provision_CreatesWorktreeFromCurrentBranch) {
  auto ws = run_coro(provisioner_.provision(1));
  ASSERT_TRUE(ws.has_value()) << ws.error().message();

  EXPECT_EQ(ws->worker, 1u);
  EXPECT_EQ(ws->branch, "agent-1");
  EXPECT_EQ(ws->base_branch, "main");
  EXPECT_TRUE(std::filesystem::is_directory(ws->path));
  EXPECT_EQ(fake_.count("worktree"), 1);

  const auto &add = fake_.calls.back();
  EXPECT_EQ(add.args, (std::vector<std::string>{"worktree", "add", "-B",
                                                "agent-1", ws->path.string(),
                                                "main"}));
  EXPECT_EQ(add.dir, repo_.path());
}

TEST_F(ProvisionerTest, Provision_ExistingPathIsCollision) {
  std::filesystem::create_directories(provisioner_.path_for(0));
  auto ws = run_coro(provisioner_.provision(0));
  ASSERT_FALSE(ws.has_value());
  EXPECT_EQ(ws.error(), make_error_code(Error::AlreadyExists));
  EXPECT_EQ(fake_.count("worktree"), 0);
}

TEST_F(ProvisionerTest, Provision_NotARepository) {
  WorkspaceProvisioner p(
      git_, WorkspaceLayout{.repo_root = repo_.path() / "missing",
                            .worktree_dir = ".worktrees",
                            .branch_prefix = "agent-"});
  auto ws = run_coro(p.provision(0));
  ASSERT_FALSE(ws.has_value());
  EXPECT_EQ(ws.error(), make_error_code(Error::NotARepository));
}

TEST_F(ProvisionerTest, Provision_GitFailureIsSetupFailure) {
  fake_.worktree_add_exit = 128;
  auto ws = run_coro(provisioner_.provision(0));
  ASSERT_FALSE(ws.has_value());
  EXPECT_EQ(ws.error(), make_error_code(Error::WorkspaceSetupFailed));
}

TEST_F(ProvisionerTest, Teardown_RemovesWorktree) {
  auto ws = run_coro(provisioner_.provision(0));
  ASSERT_TRUE(ws.has_value());

  auto res = run_coro(provisioner_.teardown(*ws));
  ASSERT_TRUE(res.has_value());
  EXPECT_FALSE(std::filesystem::exists(ws->path));
  EXPECT_TRUE(fake_.live_workspaces.empty());
}

TEST_F(ProvisionerTest, Teardown_TwiceIsHarmless) {
  auto ws = run_coro(provisioner_.provision(0));
  ASSERT_TRUE(ws.has_value());

  ASSERT_TRUE(run_coro(provisioner_.teardown(*ws)).has_value());
  auto again = run_coro(provisioner_.teardown(*ws));
  EXPECT_TRUE(again.has_value());

  // Second call only prunes metadata.
  EXPECT_EQ(fake_.calls.back().args,
            (std::vector<std::string>{"worktree", "prune"}));
}

TEST_F(ProvisionerTest, Teardown_FallsBackToDeletingDirectory) {
  auto ws = run_coro(provisioner_.provision(0));
  ASSERT_TRUE(ws.has_value());
  test::write_file(ws->path / "scratch.txt", "left behind");

  fake_.worktree_remove_exit = 128;
  auto res = run_coro(provisioner_.teardown(*ws));
  ASSERT_TRUE(res.has_value());
  EXPECT_FALSE(std::filesystem::exists(ws->path));
  EXPECT_TRUE(fake_.live_workspaces.empty());
}

TEST_F(ProvisionerTest, WorkerIdentity_ReusableAfterTeardown) {
  for (int round = 0; round < 3; ++round) {
    auto ws = run_coro(provisioner_.provision(2));
    ASSERT_TRUE(ws.has_value()) << "round " << round;
    ASSERT_TRUE(run_coro(provisioner_.teardown(*ws)).has_value());
  }
  EXPECT_EQ(fake_.overlap_violations, 0);
}
