#pragma once

#include "aoa/config/app_config.hpp"
#include "aoa/core/error.hpp"
#include "aoa/orchestrator/task_runner.hpp"
#include "aoa/orchestrator/worker_pool.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aoa::cli {

struct StartOptions {
  std::string tasks_file;
  std::string config_file;
  std::optional<int> agents;
  std::optional<std::string> directory;
  std::optional<std::string> model;
  bool interactive{false};
  bool auto_approve{false};
  std::optional<std::string> log_level;
  std::optional<std::string> log_file;
  std::vector<std::string> agent_args; // everything after `--`
};

struct ValidateOptions {
  std::string tasks_file;
  std::string config_file;
};

/// Config file (or defaults), then environment, then the flags in `opts`,
/// validated as a whole.
[[nodiscard]] auto resolve_config(const StartOptions &opts)
    -> Result<AppConfig>;

/// Absolute path of the shared workspace; NotADirectory unless it is an
/// existing directory.
[[nodiscard]] auto resolve_workspace(std::string_view directory)
    -> Result<std::filesystem::path>;

[[nodiscard]] auto task_runner_options(const AppConfig &config,
                                       const std::filesystem::path &repo_root)
    -> TaskRunnerOptions;

/// Process exit code for a finished pool run.
[[nodiscard]] auto exit_code_for(const PoolReport &report) -> int;

auto print_summary(const PoolReport &report) -> void;

[[nodiscard]] auto cmd_start(const StartOptions &opts) -> int;
[[nodiscard]] auto cmd_validate(const ValidateOptions &opts) -> int;

} // namespace aoa::cli
