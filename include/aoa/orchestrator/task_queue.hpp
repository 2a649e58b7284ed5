#pragma once

#include "aoa/orchestrator/task.hpp"

#include <atomic>
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace aoa {

/// Fixed sequence of tasks handed out in input order. Each task is claimed
/// by exactly one worker; claiming never blocks.
class TaskQueue {
public:
  explicit TaskQueue(std::vector<Task> tasks) : tasks_(std::move(tasks)) {}

  TaskQueue(const TaskQueue &) = delete;
  TaskQueue &operator=(const TaskQueue &) = delete;

  /// Next unclaimed task, or nullopt once the queue is drained or closed.
  [[nodiscard]] auto claim() noexcept -> std::optional<const Task *> {
    if (closed_.load(std::memory_order_acquire)) {
      return std::nullopt;
    }
    const auto idx = cursor_.fetch_add(1, std::memory_order_acq_rel);
    if (idx >= tasks_.size()) {
      return std::nullopt;
    }
    return &tasks_[idx];
  }

  /// Stop handing out tasks. Tasks already claimed are unaffected.
  auto close() noexcept -> void {
    closed_.store(true, std::memory_order_release);
  }

  [[nodiscard]] auto closed() const noexcept -> bool {
    return closed_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return tasks_.size();
  }

  [[nodiscard]] auto tasks() const noexcept -> const std::vector<Task> & {
    return tasks_;
  }

private:
  std::vector<Task> tasks_;
  std::atomic<std::size_t> cursor_{0};
  std::atomic<bool> closed_{false};
};

} // namespace aoa
