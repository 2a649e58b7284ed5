#include "aoa/orchestrator/worker_pool.hpp"

#include "aoa/orchestrator/task_queue.hpp"

#include "test_utils.hpp"

#include <boost/asio/io_context.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <format>
#include <memory>
#include <set>
#include <string>
#include <tuple>
#include <vector>

#include "gtest/gtest.h"

using namespace aoa;
using namespace std::chrono_literals;
using aoa::test::FakeProcessRunner;
using aoa::test::RecordingTaskRunner;
using aoa::test::make_tasks;

namespace {

auto numbered_tasks(std::size_t n) -> std::vector<Task> {
  std::vector<std::string> texts;
  for (std::size_t i = 0; i < n; ++i) {
    texts.push_back(std::format("task {}", i));
  }
  return make_tasks(std::move(texts));
}

} // namespace

TEST(TaskQueueTest, ClaimsInOrderThenDrains) {
  TaskQueue queue(make_tasks({"a", "b"}));
  auto first = queue.claim();
  auto second = queue.claim();
  ASSERT_TRUE(first && second);
  EXPECT_EQ((*first)->text, "a");
  EXPECT_EQ((*second)->text, "b");
  EXPECT_FALSE(queue.claim().has_value());
  EXPECT_FALSE(queue.claim().has_value());
}

TEST(TaskQueueTest, CloseStopsClaims) {
  TaskQueue queue(make_tasks({"a", "b"}));
  ASSERT_TRUE(queue.claim().has_value());
  queue.close();
  EXPECT_TRUE(queue.closed());
  EXPECT_FALSE(queue.claim().has_value());
}

class WorkerPoolExactlyOnceTest
    : public ::testing::TestWithParam<std::tuple<int, std::size_t>> {};

TEST_P(WorkerPoolExactlyOnceTest, EveryTaskDispatchedExactlyOnce) {
  const auto [workers, count] = GetParam();
  boost::asio::io_context io;
  RecordingTaskRunner runner;
  WorkerPool pool(io, runner, workers);

  auto report = pool.run(numbered_tasks(count));
  ASSERT_TRUE(report.has_value());

  ASSERT_EQ(runner.started.size(), count);
  std::set<std::size_t> unique(runner.started.begin(), runner.started.end());
  EXPECT_EQ(unique.size(), count);
  EXPECT_EQ(runner.reentrant_workers, 0);

  for (auto worker : runner.started_by) {
    EXPECT_LT(worker, static_cast<WorkerId>(workers));
  }

  ASSERT_EQ(report->reports.size(), count);
  for (std::size_t i = 0; i < count; ++i) {
    EXPECT_EQ(report->reports[i].task.index, i);
    EXPECT_TRUE(report->reports[i].dispatched);
  }
  EXPECT_EQ(report->succeeded_count(), count);
  EXPECT_TRUE(report->to_result().has_value());
}

INSTANTIATE_TEST_SUITE_P(
    WorkerAndTaskCounts, WorkerPoolExactlyOnceTest,
    ::testing::Combine(::testing::Values(1, 2, 5),
                       ::testing::Values(std::size_t{0}, std::size_t{1},
                                         std::size_t{10})));

TEST(WorkerPoolTest, SingleWorker_RunsTasksInInputOrder) {
  boost::asio::io_context io;
  RecordingTaskRunner runner;
  WorkerPool pool(io, runner, 1);

  auto report = pool.run(make_tasks({"a", "b", "c"}));
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(runner.started, (std::vector<std::size_t>{0, 1, 2}));
  EXPECT_EQ(runner.started_by, (std::vector<WorkerId>{0, 0, 0}));
}

TEST(WorkerPoolTest, MoreWorkersThanTasks_IdleWorkersExit) {
  boost::asio::io_context io;
  RecordingTaskRunner runner;
  WorkerPool pool(io, runner, 5);

  auto report = pool.run(make_tasks({"only"}));
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(runner.started.size(), 1u);
  EXPECT_FALSE(report->interrupted);
}

TEST(WorkerPoolTest, InvalidWorkerCount_IsRejected) {
  boost::asio::io_context io;
  RecordingTaskRunner runner;
  WorkerPool pool(io, runner, 0);

  auto report = pool.run(make_tasks({"a"}));
  ASSERT_FALSE(report.has_value());
  EXPECT_EQ(report.error(), make_error_code(Error::InvalidArgument));
  EXPECT_TRUE(runner.started.empty());
}

TEST(WorkerPoolTest, FailureDoesNotStopOtherTasks) {
  boost::asio::io_context io;
  RecordingTaskRunner runner;
  runner.fails = [](const Task &t) { return t.text == "bad"; };
  WorkerPool pool(io, runner, 2);

  auto report = pool.run(make_tasks({"good", "bad", "good", "good"}));
  ASSERT_TRUE(report.has_value());

  EXPECT_EQ(runner.started.size(), 4u);
  EXPECT_EQ(report->failed_count(), 1u);
  EXPECT_EQ(report->succeeded_count(), 3u);
  ASSERT_NE(report->first_failure(), nullptr);
  EXPECT_EQ(report->first_failure()->task.text, "bad");

  auto verdict = report->to_result();
  ASSERT_FALSE(verdict.has_value());
  EXPECT_EQ(verdict.error(), make_error_code(Error::TaskFailed));
}

TEST(WorkerPoolTest, ThrowingTask_FailsAloneAndReportIsReturned) {
  boost::asio::io_context io;
  RecordingTaskRunner runner;
  runner.throws = [](const Task &t) { return t.text == "a"; };
  WorkerPool pool(io, runner, 1);

  auto report = pool.run(make_tasks({"a", "b", "c"}));
  ASSERT_TRUE(report.has_value());

  EXPECT_EQ(runner.started, (std::vector<std::size_t>{0, 1, 2}));
  ASSERT_EQ(report->reports.size(), 3u);
  const auto &thrown = report->reports[0];
  EXPECT_TRUE(thrown.dispatched);
  EXPECT_EQ(thrown.outcome, TaskOutcome::Failure);
  EXPECT_EQ(thrown.phase, TaskPhase::Failed);
  EXPECT_EQ(thrown.error, "failed: runner broke on a");
  EXPECT_EQ(report->reports[1].outcome, TaskOutcome::Success);
  EXPECT_EQ(report->reports[2].outcome, TaskOutcome::Success);

  EXPECT_EQ(report->failed_count(), 1u);
  EXPECT_EQ(report->undispatched_count(), 0u);
  ASSERT_NE(report->first_failure(), nullptr);
  EXPECT_EQ(report->first_failure()->task.text, "a");
  EXPECT_FALSE(report->interrupted);
}

TEST(WorkerPoolTest, RequestStop_LeavesRemainingTasksUndispatched) {
  boost::asio::io_context io;
  RecordingTaskRunner runner;
  WorkerPool pool(io, runner, 1);
  runner.fails = [&pool](const Task &t) {
    if (t.index == 1) {
      pool.request_stop();
    }
    return false;
  };

  auto report = pool.run(numbered_tasks(5));
  ASSERT_TRUE(report.has_value());

  EXPECT_EQ(runner.started, (std::vector<std::size_t>{0, 1}));
  EXPECT_TRUE(report->interrupted);
  EXPECT_EQ(report->succeeded_count(), 2u);
  EXPECT_EQ(report->undispatched_count(), 3u);
  EXPECT_FALSE(report->reports[4].dispatched);

  auto verdict = report->to_result();
  ASSERT_FALSE(verdict.has_value());
  EXPECT_EQ(verdict.error(), make_error_code(Error::Interrupted));
}

TEST(WorkerPoolTest, PoolIsReusableAfterRun) {
  boost::asio::io_context io;
  RecordingTaskRunner runner;
  WorkerPool pool(io, runner, 2);

  ASSERT_TRUE(pool.run(make_tasks({"a", "b"})).has_value());
  ASSERT_TRUE(pool.run(make_tasks({"c"})).has_value());
  EXPECT_EQ(runner.started.size(), 3u);
}

class WorkerPoolEndToEndTest : public ::testing::Test {
protected:
  auto make_runner() -> std::unique_ptr<TaskRunner> {
    AgentConfig agent;
    agent.command = "agent";
    return std::make_unique<TaskRunner>(
        fake_, gate_,
        TaskRunnerOptions{
            .layout = WorkspaceLayout{.repo_root = repo_.path(),
                                      .worktree_dir = ".worktrees",
                                      .branch_prefix = "agent-"},
            .agent = agent,
            .remote = "origin"});
  }

  boost::asio::io_context io_;
  MergeGate gate_{io_.get_executor()};
  FakeProcessRunner fake_;
  test::TempDir repo_;
};

TEST_F(WorkerPoolEndToEndTest, OneFailureOneSuccess) {
  fake_.agent_exit = [](std::string_view t) { return t == "fail-task" ? 1 : 0; };
  auto runner = make_runner();
  WorkerPool pool(io_, *runner, 2);

  auto report = pool.run(make_tasks({"ok-task", "fail-task"}));
  ASSERT_TRUE(report.has_value());

  EXPECT_EQ(report->succeeded_count(), 1u);
  EXPECT_EQ(report->failed_count(), 1u);
  EXPECT_EQ(report->reports[0].outcome, TaskOutcome::Success);
  EXPECT_EQ(report->reports[1].outcome, TaskOutcome::Failure);
  EXPECT_EQ(report->reports[1].phase, TaskPhase::Executing);

  EXPECT_EQ(fake_.commit_messages.size(), 1u);
  EXPECT_EQ(fake_.count("merge"), 1);
  EXPECT_TRUE(fake_.live_workspaces.empty());
  EXPECT_FALSE(std::filesystem::exists(repo_.path() / ".worktrees" / "agent-0"));
  EXPECT_FALSE(std::filesystem::exists(repo_.path() / ".worktrees" / "agent-1"));
}

TEST_F(WorkerPoolEndToEndTest, MergesAreSerializedAndWorkspacesNeverShared) {
  fake_.agent_delay = 3ms;
  fake_.merge_delay = 5ms;
  auto runner = make_runner();
  WorkerPool pool(io_, *runner, 5);

  auto report = pool.run(numbered_tasks(10));
  ASSERT_TRUE(report.has_value());

  EXPECT_EQ(report->succeeded_count(), 10u);
  EXPECT_EQ(fake_.agent_runs(), 10);
  EXPECT_EQ(fake_.count("merge"), 10);
  EXPECT_EQ(fake_.max_merges_in_flight, 1);
  EXPECT_EQ(fake_.overlap_violations, 0);
  EXPECT_EQ(gate_.acquisitions(), 10u);
  EXPECT_TRUE(fake_.live_workspaces.empty());

  std::multiset<std::string> seen(fake_.agent_tasks.begin(),
                                  fake_.agent_tasks.end());
  for (std::size_t i = 0; i < 10; ++i) {
    EXPECT_EQ(seen.count(std::format("task {}", i)), 1u);
  }
}

TEST_F(WorkerPoolEndToEndTest, NoChangeTasksCountAsSucceeded) {
  fake_.agent_modifies = [](std::string_view) { return false; };
  auto runner = make_runner();
  WorkerPool pool(io_, *runner, 3);

  auto report = pool.run(numbered_tasks(4));
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->succeeded_count(), 4u);
  EXPECT_TRUE(report->to_result().has_value());
  EXPECT_EQ(fake_.count("commit"), 0);
}
