#include "aoa/cli/commands.hpp"
#include "aoa/cli/formatting.hpp"
#include "aoa/config/config.hpp"
#include "aoa/util/log.hpp"
#include "aoa/util/shell.hpp"

#include <format>
#include <print>

namespace aoa::cli {

auto resolve_config(const StartOptions &opts) -> Result<AppConfig> {
  auto loaded = opts.config_file.empty()
                    ? ConfigLoader::load_defaults()
                    : ConfigLoader::load_from_file(opts.config_file);
  if (!loaded) {
    return fail(loaded.error());
  }
  auto &cfg = *loaded;

  if (opts.agents) {
    cfg.pool.workers = *opts.agents;
  }
  if (opts.directory) {
    cfg.pool.directory = *opts.directory;
  }
  if (opts.model) {
    cfg.agent.model = *opts.model;
  }
  if (opts.interactive) {
    cfg.agent.interactive = true;
  }
  if (opts.auto_approve) {
    cfg.agent.auto_approve = true;
  }
  if (opts.log_level) {
    cfg.log.level = *opts.log_level;
  }
  if (opts.log_file) {
    cfg.log.file = *opts.log_file;
  }
  cfg.agent.additional_args.insert(cfg.agent.additional_args.end(),
                                   opts.agent_args.begin(),
                                   opts.agent_args.end());

  if (auto valid = ConfigLoader::validate(cfg); !valid) {
    return fail(valid.error());
  }
  return loaded;
}

auto resolve_workspace(std::string_view directory)
    -> Result<std::filesystem::path> {
  std::error_code ec;
  const std::filesystem::path dir(directory.empty() ? "." : directory);
  if (!std::filesystem::is_directory(dir, ec)) {
    log::error("{} is not a directory", dir.string());
    return fail(Error::NotADirectory);
  }
  auto absolute = std::filesystem::weakly_canonical(dir, ec);
  if (ec) {
    log::error("cannot resolve {}: {}", dir.string(), ec.message());
    return fail(Error::NotADirectory);
  }
  return ok(std::move(absolute));
}

auto task_runner_options(const AppConfig &config,
                         const std::filesystem::path &repo_root)
    -> TaskRunnerOptions {
  return TaskRunnerOptions{
      .layout = WorkspaceLayout{.repo_root = repo_root,
                                .worktree_dir = config.pool.worktree_dir,
                                .branch_prefix = config.pool.branch_prefix},
      .agent = config.agent,
      .remote = config.pool.remote};
}

auto exit_code_for(const PoolReport &report) -> int {
  auto verdict = report.to_result();
  if (verdict) {
    return 0;
  }
  return verdict.error() == make_error_code(Error::Interrupted) ? 130 : 1;
}

auto print_summary(const PoolReport &report) -> void {
  if (report.reports.empty()) {
    std::println("No tasks.");
    return;
  }

  fmt::Table table({{"#", 4, true},
                    {"AGENT", 6, true},
                    {"RESULT", 10},
                    {"TIME", 8, true},
                    {"TASK", 50}});
  std::println("");
  table.print_header();
  for (const auto &r : report.reports) {
    table.print_row({std::format("{}", r.task.index),
                     r.dispatched ? std::format("{}", r.worker) : "-",
                     fmt::outcome_label(r), fmt::format_elapsed(r.elapsed),
                     preview(r.task.text)});
  }

  for (const auto &r : report.reports) {
    if (r.dispatched && !r.ok()) {
      std::println("  {} task {}: {}", fmt::ansi::red("error"), r.task.index,
                   r.error);
    }
  }

  std::println("\n{} succeeded, {} failed, {} not run",
               fmt::ansi::green(std::format("{}", report.succeeded_count())),
               report.failed_count() > 0
                   ? fmt::ansi::red(std::format("{}", report.failed_count()))
                   : std::format("{}", report.failed_count()),
               report.undispatched_count());
}

} // namespace aoa::cli
