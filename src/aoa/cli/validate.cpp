#include "aoa/agent/agent_command.hpp"
#include "aoa/cli/commands.hpp"
#include "aoa/cli/formatting.hpp"
#include "aoa/config/task_file_loader.hpp"
#include "aoa/util/log.hpp"
#include "aoa/util/shell.hpp"

#include <format>
#include <print>

namespace aoa::cli {

auto cmd_validate(const ValidateOptions &opts) -> int {
  log::set_output_stderr();

  auto config = resolve_config(StartOptions{.tasks_file = opts.tasks_file,
                                            .config_file = opts.config_file});
  if (!config) {
    std::println("{} configuration: {}", fmt::ansi::red("✗"),
                 config.error().message());
    return 1;
  }
  std::println("{} configuration: {} agent(s), command '{}'",
               fmt::ansi::green("✓"), config->pool.workers,
               config->agent.command);

  auto repo_root = resolve_workspace(config->pool.directory);
  if (!repo_root) {
    std::println("{} directory {}: {}", fmt::ansi::red("✗"),
                 config->pool.directory, repo_root.error().message());
    return 1;
  }
  std::println("{} directory: {}", fmt::ansi::green("✓"),
               repo_root->string());

  auto tasks = TaskFileLoader::load(opts.tasks_file);
  if (!tasks) {
    std::println("{} tasks {}: {}", fmt::ansi::red("✗"), opts.tasks_file,
                 tasks.error().message());
    return 1;
  }
  std::println("{} tasks: {} loaded from {}", fmt::ansi::green("✓"),
               tasks->size(), opts.tasks_file);

  if (!tasks->empty()) {
    const auto &first = tasks->front();
    auto spec = build_agent_spec(config->agent, first.text,
                                 *repo_root / config->pool.worktree_dir /
                                     std::format("{}0",
                                                 config->pool.branch_prefix),
                                 0);
    std::println("\nfirst task would run as:\n  {}",
                 fmt::ansi::dim(spec.command_line()));
  }
  return 0;
}

} // namespace aoa::cli
