#pragma once

#include "aoa/agent/agent_command.hpp"
#include "aoa/core/coroutine.hpp"
#include "aoa/core/error.hpp"
#include "aoa/orchestrator/merge_gate.hpp"
#include "aoa/orchestrator/task.hpp"
#include "aoa/process/process_runner.hpp"
#include "aoa/vcs/git.hpp"
#include "aoa/workspace/provisioner.hpp"
#include "aoa/workspace/remote_sync.hpp"

#include <filesystem>
#include <string>

namespace aoa {

class ITaskRunner {
public:
  virtual ~ITaskRunner() = default;

  /// Runs one task to a terminal state. Failures are reported in the
  /// returned report, not thrown.
  [[nodiscard]] virtual auto run(const Task &task, WorkerId worker)
      -> aoa::task<TaskReport> = 0;

  [[nodiscard]] virtual auto working_directory() const
      -> const std::filesystem::path & = 0;
};

struct TaskRunnerOptions {
  WorkspaceLayout layout;
  AgentConfig agent;
  std::string remote{"origin"};
};

[[nodiscard]] auto commit_message(WorkerId worker, std::string_view task)
    -> std::string;

/// Provision → sync → agent → stage → commit → merge back → teardown, one
/// task at a time for one worker identity.
class TaskRunner final : public ITaskRunner {
public:
  TaskRunner(IProcessRunner &processes, MergeGate &gate,
             TaskRunnerOptions options);

  TaskRunner(const TaskRunner &) = delete;
  TaskRunner &operator=(const TaskRunner &) = delete;

  [[nodiscard]] auto run(const Task &task, WorkerId worker)
      -> aoa::task<TaskReport> override;

  [[nodiscard]] auto working_directory() const
      -> const std::filesystem::path & override {
    return provisioner_.repo_root();
  }

private:
  struct Step {
    TaskPhase phase{TaskPhase::Done};
    Result<TaskOutcome> outcome;
  };

  [[nodiscard]] auto drive(const Task &task, const Workspace &ws,
                           TaskReport &report) -> aoa::task<Step>;
  [[nodiscard]] auto commit_identity(const Workspace &ws)
      -> task<std::optional<CommitIdentity>>;
  [[nodiscard]] auto merge_back(const Workspace &ws) -> task<Result<void>>;

  IProcessRunner *processes_;
  MergeGate *gate_;
  Git git_;
  WorkspaceProvisioner provisioner_;
  RemoteSync sync_;
  AgentConfig agent_;
};

} // namespace aoa
