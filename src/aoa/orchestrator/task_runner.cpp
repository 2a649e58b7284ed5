#include "aoa/orchestrator/task_runner.hpp"

#include "aoa/util/log.hpp"
#include "aoa/util/shell.hpp"

#include <chrono>
#include <exception>
#include <string>
#include <format>
#include <optional>
#include <utility>

namespace aoa {

auto commit_message(WorkerId worker, std::string_view task) -> std::string {
  return std::format("agent-{}: {}", worker, task);
}

TaskRunner::TaskRunner(IProcessRunner &processes, MergeGate &gate,
                       TaskRunnerOptions options)
    : processes_(&processes), gate_(&gate), git_(processes),
      provisioner_(git_, std::move(options.layout)),
      sync_(git_, provisioner_.repo_root(), std::move(options.remote)),
      agent_(std::move(options.agent)) {}

auto TaskRunner::run(const Task &task, WorkerId worker) -> aoa::task<TaskReport> {
  const auto started = std::chrono::steady_clock::now();
  TaskReport report{.task = task,
                    .worker = worker,
                    .dispatched = true,
                    .outcome = TaskOutcome::Failure,
                    .phase = TaskPhase::Provisioning,
                    .error = {},
                    .sync = {},
                    .elapsed = {}};
  auto elapsed = [&started] {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
  };

  auto ws = co_await provisioner_.provision(worker);
  if (!ws) {
    // Nothing was created, so there is nothing to tear down.
    report.error = std::format("{}: {}", to_string_view(report.phase),
                               ws.error().message());
    report.elapsed = elapsed();
    log::error("agent {} failed task: {} ({})", worker, preview(task.text),
               report.error);
    co_return report;
  }

  Step step;
  std::optional<std::string> escaped;
  std::exception_ptr foreign;
  try {
    step = co_await drive(task, *ws, report);
  } catch (const std::exception &ex) {
    // Reported as a failure of the phase it escaped from, after teardown.
    escaped = ex.what();
  } catch (...) {
    foreign = std::current_exception();
  }

  log::debug("agent {} tearing down {}", worker, ws->path.string());
  if (auto removed = co_await provisioner_.teardown(*ws); !removed) {
    log::warn("agent {}: teardown of {} failed: {}", worker,
              ws->path.string(), removed.error().message());
  }
  if (foreign) {
    std::rethrow_exception(foreign);
  }

  report.elapsed = elapsed();
  if (escaped) {
    report.outcome = TaskOutcome::Failure;
    report.error = std::format("{}: {}", to_string_view(report.phase), *escaped);
    log::error("agent {} failed task: {} ({})", worker, preview(task.text),
               report.error);
  } else if (step.outcome) {
    report.outcome = *step.outcome;
    report.phase = TaskPhase::Done;
    log::info("agent {} finished task: {} ({}, {} ms)", worker,
              preview(task.text), to_string_view(report.outcome),
              report.elapsed.count());
  } else {
    report.outcome = TaskOutcome::Failure;
    report.phase = step.phase;
    report.error = std::format("{}: {}", to_string_view(step.phase),
                               step.outcome.error().message());
    log::error("agent {} failed task: {} ({})", worker, preview(task.text),
               report.error);
  }
  co_return report;
}

auto TaskRunner::drive(const Task &task, const Workspace &ws,
                       TaskReport &report) -> aoa::task<Step> {
  report.phase = TaskPhase::Syncing;
  try {
    report.sync = co_await sync_.sync(ws);
  } catch (const std::exception &ex) {
    report.sync = SyncOutcome{.status = SyncStatus::Warning,
                              .detail = ex.what()};
  }
  if (report.sync.status == SyncStatus::Warning) {
    log::warn("agent {}: sync skipped ({}); continuing", ws.worker,
              report.sync.detail);
  } else {
    log::debug("agent {}: sync {} ({})", ws.worker,
               to_string_view(report.sync.status), report.sync.detail);
  }

  report.phase = TaskPhase::Executing;
  auto spec = build_agent_spec(agent_, task.text, ws.path, ws.worker);
  log::debug("agent {} exec: {}", ws.worker, preview(spec.command_line()));
  if (auto agent = co_await processes_->run_checked(std::move(spec)); !agent) {
    co_return Step{.phase = TaskPhase::Executing,
                   .outcome = fail(agent.error())};
  }

  report.phase = TaskPhase::Staging;
  if (auto staged = co_await git_.stage_all(ws.path); !staged) {
    co_return Step{.phase = TaskPhase::Staging,
                   .outcome = fail(Error::StageFailed)};
  }
  auto changed = co_await git_.has_staged_changes(ws.path);
  if (!changed) {
    co_return Step{.phase = TaskPhase::Staging,
                   .outcome = fail(Error::StageFailed)};
  }
  if (!*changed) {
    log::info("agent {}: no changes to commit", ws.worker);
    co_return Step{.phase = TaskPhase::Done, .outcome = TaskOutcome::NoChange};
  }

  report.phase = TaskPhase::Committing;
  auto identity = co_await commit_identity(ws);
  if (auto committed = co_await git_.commit(
          ws.path, commit_message(ws.worker, task.text), identity);
      !committed) {
    co_return Step{.phase = TaskPhase::Committing,
                   .outcome = fail(Error::CommitFailed)};
  }

  report.phase = TaskPhase::MergingBack;
  if (auto merged = co_await merge_back(ws); !merged) {
    co_return Step{.phase = TaskPhase::MergingBack,
                   .outcome = fail(merged.error())};
  }
  co_return Step{.phase = TaskPhase::Done, .outcome = TaskOutcome::Success};
}

auto TaskRunner::commit_identity(const Workspace &ws)
    -> aoa::task<std::optional<CommitIdentity>> {
  auto name = co_await git_.config_value(ws.path, "user.name");
  auto email = co_await git_.config_value(ws.path, "user.email");
  if (name && email) {
    co_return std::nullopt;
  }
  CommitIdentity identity{
      .name = name.value_or(std::format("aoa agent-{}", ws.worker)),
      .email = email.value_or(std::format("agent-{}@aoa.local", ws.worker))};
  log::debug("agent {}: committing as {} <{}>", ws.worker, identity.name,
             identity.email);
  co_return identity;
}

auto TaskRunner::merge_back(const Workspace &ws) -> aoa::task<Result<void>> {
  auto guard = co_await gate_->acquire();
  log::debug("agent {} merging {} into {}", ws.worker, ws.branch,
             ws.base_branch);
  auto merged = co_await git_.merge_ff_only(provisioner_.repo_root(), ws.branch);
  guard.release();

  if (!merged) {
    log::error("agent {}: {} cannot be fast-forwarded onto {} ({}); the "
               "shared branch moved since the workspace was created",
               ws.worker, ws.branch, ws.base_branch, merged.error().message());
    co_return fail(Error::MergeRejected);
  }
  co_return ok();
}

} // namespace aoa
