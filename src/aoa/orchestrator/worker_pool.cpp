#include "aoa/orchestrator/worker_pool.hpp"

#include "aoa/util/log.hpp"
#include "aoa/util/shell.hpp"

#include <algorithm>
#include <csignal>
#include <exception>
#include <format>
#include <utility>

namespace aoa {

auto PoolReport::failed_count() const noexcept -> std::size_t {
  return static_cast<std::size_t>(
      std::ranges::count_if(reports, [](const TaskReport &r) {
        return r.dispatched && !r.ok();
      }));
}

auto PoolReport::succeeded_count() const noexcept -> std::size_t {
  return static_cast<std::size_t>(
      std::ranges::count_if(reports, [](const TaskReport &r) {
        return r.dispatched && r.ok();
      }));
}

auto PoolReport::undispatched_count() const noexcept -> std::size_t {
  return static_cast<std::size_t>(std::ranges::count_if(
      reports, [](const TaskReport &r) { return !r.dispatched; }));
}

auto PoolReport::first_failure() const noexcept -> const TaskReport * {
  if (!first_failure_index || *first_failure_index >= reports.size()) {
    return nullptr;
  }
  return &reports[*first_failure_index];
}

auto PoolReport::to_result() const -> Result<void> {
  if (failed_count() > 0) {
    return fail(Error::TaskFailed);
  }
  if (undispatched_count() > 0) {
    return fail(Error::Interrupted);
  }
  return ok();
}

auto WorkerPool::run(std::vector<Task> tasks) -> Result<PoolReport> {
  if (workers_ < 1) {
    log::error("worker count must be at least 1 (got {})", workers_);
    return fail(Error::InvalidArgument);
  }

  log::info("working directory: {}", runner_->working_directory().string());
  log::info("dispatching {} task(s) to {} agent(s)", tasks.size(), workers_);

  PoolReport report;
  report.reports.reserve(tasks.size());
  for (const auto &t : tasks) {
    report.reports.push_back(TaskReport{.task = t,
                                        .worker = 0,
                                        .dispatched = false,
                                        .outcome = TaskOutcome::Failure,
                                        .phase = TaskPhase::Pending,
                                        .error = "not dispatched",
                                        .sync = {},
                                        .elapsed = {}});
  }
  queue_ = std::make_unique<TaskQueue>(std::move(tasks));

  if (stop_on_signal_) {
    watch_signals();
  }

  std::exception_ptr first_error;
  active_workers_ = workers_;
  for (WorkerId id = 0; id < static_cast<WorkerId>(workers_); ++id) {
    co_spawn(*io_, worker_loop(id, report),
             [this, id, &first_error](std::exception_ptr ep) {
               if (ep) {
                 log::error("agent {} stopped unexpectedly", id);
                 if (!first_error) {
                   first_error = ep;
                 }
               }
               on_worker_exit();
             });
  }

  io_->run();
  io_->restart();

  report.interrupted = queue_->closed();
  queue_.reset();
  signals_.reset();

  if (first_error) {
    std::rethrow_exception(first_error);
  }
  return ok(std::move(report));
}

auto WorkerPool::request_stop() noexcept -> void {
  if (queue_ && !queue_->closed()) {
    log::warn("stop requested; finishing in-flight tasks, dispatching no more");
    queue_->close();
  }
}

auto WorkerPool::worker_loop(WorkerId id, PoolReport &report) -> task<void> {
  while (auto claimed = queue_->claim()) {
    const Task &t = **claimed;
    const auto slot = static_cast<std::size_t>(&t - queue_->tasks().data());
    log::info("agent {} running task: {}", id, preview(t.text));

    TaskReport result;
    try {
      result = co_await runner_->run(t, id);
    } catch (const std::exception &ex) {
      // A runner that throws fails its own task only.
      log::error("agent {} task raised: {}", id, ex.what());
      result = TaskReport{.task = t,
                          .worker = id,
                          .dispatched = true,
                          .outcome = TaskOutcome::Failure,
                          .phase = TaskPhase::Failed,
                          .error = std::format("{}: {}",
                                               to_string_view(TaskPhase::Failed),
                                               ex.what()),
                          .sync = {},
                          .elapsed = {}};
    }
    result.dispatched = true;
    result.worker = id;
    if (!result.ok() && !report.first_failure_index) {
      report.first_failure_index = slot;
    }
    report.reports[slot] = std::move(result);
  }
  log::debug("agent {} has no more tasks", id);
}

auto WorkerPool::watch_signals() -> void {
  signals_.emplace(*io_, SIGINT, SIGTERM);
  signals_->async_wait([this](const boost::system::error_code &ec, int signo) {
    if (ec) {
      return;
    }
    log::warn("received signal {}", signo);
    request_stop();
  });
}

auto WorkerPool::on_worker_exit() -> void {
  if (--active_workers_ == 0 && signals_) {
    // Last worker done: stop waiting for signals so io_context::run returns.
    signals_->cancel();
  }
}

} // namespace aoa
