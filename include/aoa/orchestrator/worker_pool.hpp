#pragma once

#include "aoa/core/coroutine.hpp"
#include "aoa/core/error.hpp"
#include "aoa/orchestrator/task.hpp"
#include "aoa/orchestrator/task_queue.hpp"
#include "aoa/orchestrator/task_runner.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace aoa {

struct PoolReport {
  // One entry per input task, in input order.
  std::vector<TaskReport> reports;
  // Index of the task that failed first, in completion order.
  std::optional<std::size_t> first_failure_index;
  bool interrupted{false};

  [[nodiscard]] auto failed_count() const noexcept -> std::size_t;
  [[nodiscard]] auto succeeded_count() const noexcept -> std::size_t;
  [[nodiscard]] auto undispatched_count() const noexcept -> std::size_t;

  [[nodiscard]] auto first_failure() const noexcept -> const TaskReport *;

  /// Aggregate verdict: TaskFailed if any dispatched task failed,
  /// Interrupted if tasks were left undispatched, success otherwise.
  [[nodiscard]] auto to_result() const -> Result<void>;
};

/// Runs `workers` concurrent loops on one io_context. Each loop claims the
/// next task from a shared cursor and awaits its full completion before
/// claiming another. Worker identities are 0..workers-1.
class WorkerPool {
public:
  WorkerPool(boost::asio::io_context &io, ITaskRunner &runner, int workers)
      : io_(&io), runner_(&runner), workers_(workers) {}

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  /// Close the queue on SIGINT/SIGTERM while run() is in progress.
  auto set_stop_on_signal(bool enabled) noexcept -> void {
    stop_on_signal_ = enabled;
  }

  /// Blocks until every dispatched task has finished. Fails only for an
  /// invalid worker count; per-task failures are in the report.
  [[nodiscard]] auto run(std::vector<Task> tasks) -> Result<PoolReport>;

  /// Stop dispatching. In-flight tasks run to completion (and teardown).
  auto request_stop() noexcept -> void;

  [[nodiscard]] auto workers() const noexcept -> int { return workers_; }

private:
  auto worker_loop(WorkerId id, PoolReport &report) -> task<void>;
  auto watch_signals() -> void;
  auto on_worker_exit() -> void;

  boost::asio::io_context *io_;
  ITaskRunner *runner_;
  int workers_;
  bool stop_on_signal_{false};
  int active_workers_{0};
  std::unique_ptr<TaskQueue> queue_;
  std::optional<boost::asio::signal_set> signals_;
};

} // namespace aoa
