#pragma once

#include "aoa/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace aoa {

using WorkerId = std::uint32_t;

/// One instruction for an agent plus its position in the input sequence.
struct Task {
  std::size_t index{0};
  std::string text;
};

enum class TaskOutcome : std::uint8_t {
  Success,
  NoChange,
  Failure,
};
BOOST_DESCRIBE_ENUM(TaskOutcome, Success, NoChange, Failure)
AOA_DEFINE_ENUM_SERDE(TaskOutcome, TaskOutcome::Failure)

enum class TaskPhase : std::uint8_t {
  Pending,
  Provisioning,
  Syncing,
  Executing,
  Staging,
  Committing,
  MergingBack,
  TearingDown,
  Done,
  Failed,
};
BOOST_DESCRIBE_ENUM(TaskPhase, Pending, Provisioning, Syncing, Executing,
                    Staging, Committing, MergingBack, TearingDown, Done,
                    Failed)
AOA_DEFINE_ENUM_SERDE(TaskPhase, TaskPhase::Pending)

enum class SyncStatus : std::uint8_t {
  Synced,
  Skipped,
  Warning,
};
BOOST_DESCRIBE_ENUM(SyncStatus, Synced, Skipped, Warning)
AOA_DEFINE_ENUM_SERDE(SyncStatus, SyncStatus::Skipped)

/// Result of the best-effort sync step. Never an error: a failed sync is a
/// Warning and the task carries on.
struct SyncOutcome {
  SyncStatus status{SyncStatus::Skipped};
  std::string detail;
};

struct TaskReport {
  Task task;
  WorkerId worker{0};
  bool dispatched{false};
  TaskOutcome outcome{TaskOutcome::Failure};
  // Phase the task was in when it failed; Done otherwise.
  TaskPhase phase{TaskPhase::Pending};
  std::string error;
  SyncOutcome sync;
  std::chrono::milliseconds elapsed{0};

  [[nodiscard]] auto ok() const noexcept -> bool {
    return outcome != TaskOutcome::Failure;
  }
};

} // namespace aoa
