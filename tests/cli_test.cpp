#include "aoa/cli/commands.hpp"
#include "aoa/cli/formatting.hpp"

#include "test_utils.hpp"

#include <chrono>
#include <string>

#include "gtest/gtest.h"

using namespace aoa;
using namespace aoa::cli;
using namespace std::chrono_literals;

namespace {

auto dispatched(TaskOutcome outcome) -> TaskReport {
  return TaskReport{.task = {},
                    .worker = 0,
                    .dispatched = true,
                    .outcome = outcome,
                    .phase = TaskPhase::Done,
                    .error = {},
                    .sync = {},
                    .elapsed = {}};
}

auto visible(const std::string &s) -> std::size_t {
  return fmt::ansi::ansi_visible_width(s);
}

} // namespace

TEST(CLITest, StartOptionsDefaults) {
  StartOptions opts;
  EXPECT_TRUE(opts.tasks_file.empty());
  EXPECT_TRUE(opts.config_file.empty());
  EXPECT_FALSE(opts.agents.has_value());
  EXPECT_FALSE(opts.directory.has_value());
  EXPECT_FALSE(opts.model.has_value());
  EXPECT_FALSE(opts.interactive);
  EXPECT_FALSE(opts.auto_approve);
  EXPECT_FALSE(opts.log_level.has_value());
  EXPECT_TRUE(opts.agent_args.empty());
}

TEST(CLITest, ResolveConfig_FlagsOverrideFile) {
  test::TempDir dir;
  const auto path = dir.path() / "aoa.toml";
  test::write_file(path, "[agent]\nmodel = \"sonnet\"\nadditional_args = "
                         "[\"--verbose\"]\n[pool]\nworkers = 2\n");

  StartOptions opts;
  opts.config_file = path.string();
  opts.agents = 4;
  opts.model = "opus";
  opts.auto_approve = true;
  opts.log_level = "debug";
  opts.agent_args = {"--output-format", "text"};

  auto cfg = resolve_config(opts);
  ASSERT_TRUE(cfg.has_value()) << cfg.error().message();
  EXPECT_EQ(cfg->pool.workers, 4);
  EXPECT_EQ(cfg->agent.model, std::optional<std::string>{"opus"});
  EXPECT_TRUE(cfg->agent.auto_approve);
  EXPECT_FALSE(cfg->agent.interactive);
  EXPECT_EQ(cfg->log.level, "debug");
  EXPECT_EQ(cfg->agent.additional_args,
            (std::vector<std::string>{"--verbose", "--output-format", "text"}));
}

TEST(CLITest, ResolveConfig_DefaultsWithoutFile) {
  StartOptions opts;
  auto cfg = resolve_config(opts);
  ASSERT_TRUE(cfg.has_value()) << cfg.error().message();
  EXPECT_EQ(cfg->pool.workers, 1);
  EXPECT_EQ(cfg->agent.command, "claude");
}

TEST(CLITest, ResolveConfig_RejectsZeroAgents) {
  StartOptions opts;
  opts.agents = 0;
  auto cfg = resolve_config(opts);
  ASSERT_FALSE(cfg.has_value());
  EXPECT_EQ(cfg.error(), make_error_code(Error::InvalidArgument));
}

TEST(CLITest, ResolveConfig_FlagRescuesInvalidFileValue) {
  test::TempDir dir;
  const auto path = dir.path() / "aoa.toml";
  test::write_file(path, "[pool]\nworkers = 0\n");

  StartOptions opts;
  opts.config_file = path.string();
  auto rejected = resolve_config(opts);
  ASSERT_FALSE(rejected.has_value());
  EXPECT_EQ(rejected.error(), make_error_code(Error::InvalidArgument));

  opts.agents = 3;
  auto cfg = resolve_config(opts);
  ASSERT_TRUE(cfg.has_value()) << cfg.error().message();
  EXPECT_EQ(cfg->pool.workers, 3);
}

TEST(CLITest, ResolveWorkspace_ExistingDirectoryIsAbsolute) {
  test::TempDir dir;
  auto ws = resolve_workspace(dir.path().string());
  ASSERT_TRUE(ws.has_value());
  EXPECT_TRUE(ws->is_absolute());
  EXPECT_TRUE(std::filesystem::equivalent(*ws, dir.path()));
}

TEST(CLITest, ResolveWorkspace_MissingDirectory) {
  auto ws = resolve_workspace("/nonexistent/aoa-workspace");
  ASSERT_FALSE(ws.has_value());
  EXPECT_EQ(ws.error(), make_error_code(Error::NotADirectory));
}

TEST(CLITest, ResolveWorkspace_FileIsNotADirectory) {
  test::TempDir dir;
  test::write_file(dir.path() / "file", "x");
  auto ws = resolve_workspace((dir.path() / "file").string());
  ASSERT_FALSE(ws.has_value());
  EXPECT_EQ(ws.error(), make_error_code(Error::NotADirectory));
}

TEST(CLITest, TaskRunnerOptions_FromConfig) {
  AppConfig cfg;
  cfg.pool.branch_prefix = "bot-";
  cfg.pool.worktree_dir = "wt";
  cfg.pool.remote = "upstream";
  cfg.agent.command = "my-agent";

  auto opts = task_runner_options(cfg, "/repo");
  EXPECT_EQ(opts.layout.repo_root, "/repo");
  EXPECT_EQ(opts.layout.worktree_dir, "wt");
  EXPECT_EQ(opts.layout.branch_prefix, "bot-");
  EXPECT_EQ(opts.remote, "upstream");
  EXPECT_EQ(opts.agent.command, "my-agent");
}

TEST(CLITest, ExitCode_AllSucceeded) {
  PoolReport report;
  report.reports = {dispatched(TaskOutcome::Success),
                    dispatched(TaskOutcome::NoChange)};
  EXPECT_EQ(exit_code_for(report), 0);
}

TEST(CLITest, ExitCode_EmptyRunSucceeds) {
  EXPECT_EQ(exit_code_for(PoolReport{}), 0);
}

TEST(CLITest, ExitCode_AnyFailureIsOne) {
  PoolReport report;
  report.reports = {dispatched(TaskOutcome::Success),
                    dispatched(TaskOutcome::Failure)};
  EXPECT_EQ(exit_code_for(report), 1);
}

TEST(CLITest, ExitCode_InterruptedIs130) {
  PoolReport report;
  report.reports = {dispatched(TaskOutcome::Success), TaskReport{}};
  report.interrupted = true;
  EXPECT_EQ(exit_code_for(report), 130);
}

TEST(CLITest, ExitCode_FailureWinsOverInterrupt) {
  PoolReport report;
  report.reports = {dispatched(TaskOutcome::Failure), TaskReport{}};
  report.interrupted = true;
  EXPECT_EQ(exit_code_for(report), 1);
}

TEST(CLITest, OutcomeLabels) {
  EXPECT_EQ(visible(fmt::outcome_label(dispatched(TaskOutcome::Success))),
            std::string("merged").size());
  EXPECT_EQ(visible(fmt::outcome_label(dispatched(TaskOutcome::NoChange))),
            std::string("no change").size());
  EXPECT_EQ(visible(fmt::outcome_label(dispatched(TaskOutcome::Failure))),
            std::string("failed").size());
  EXPECT_EQ(visible(fmt::outcome_label(TaskReport{})),
            std::string("not run").size());
}

TEST(CLITest, FormatElapsed) {
  EXPECT_EQ(fmt::format_elapsed(0ms), "-");
  EXPECT_EQ(fmt::format_elapsed(250ms), "250ms");
  EXPECT_EQ(fmt::format_elapsed(12s), "12s");
  EXPECT_EQ(fmt::format_elapsed(125s), "2m 5s");
  EXPECT_EQ(fmt::format_elapsed(std::chrono::hours(1) + 2min), "1h 2m");
}
