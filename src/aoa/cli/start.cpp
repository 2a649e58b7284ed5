#include "aoa/cli/commands.hpp"
#include "aoa/config/task_file_loader.hpp"
#include "aoa/orchestrator/merge_gate.hpp"
#include "aoa/orchestrator/task_runner.hpp"
#include "aoa/orchestrator/worker_pool.hpp"
#include "aoa/process/process_runner.hpp"
#include "aoa/util/log.hpp"

#include <boost/asio/io_context.hpp>

#include <cstdio>
#include <exception>
#include <print>
#include <utility>

namespace aoa::cli {

namespace {

auto setup_logging(const LogConfig &config) -> bool {
  log::set_output_stdout();
  log::set_level(config.level);
  if (!config.file.empty() && !log::set_output_file(config.file)) {
    std::println(stderr, "Error: cannot open log file {}", config.file);
    return false;
  }
  log::start();
  return true;
}

} // namespace

auto cmd_start(const StartOptions &opts) -> int {
  auto config = resolve_config(opts);
  if (!config) {
    std::println(stderr, "Error: invalid configuration: {}",
                 config.error().message());
    return 1;
  }

  auto repo_root = resolve_workspace(config->pool.directory);
  if (!repo_root) {
    std::println(stderr, "Error: {}: {}", config->pool.directory,
                 repo_root.error().message());
    return 1;
  }

  auto tasks = TaskFileLoader::load(opts.tasks_file);
  if (!tasks) {
    std::println(stderr, "Error: cannot load tasks from {}: {}",
                 opts.tasks_file, tasks.error().message());
    return 1;
  }

  if (!setup_logging(config->log)) {
    return 1;
  }
  if (config->agent.interactive && config->pool.workers > 1) {
    log::warn("interactive mode with {} agents: terminals will be shared",
              config->pool.workers);
  }

  Result<PoolReport> report = fail(Error::Unknown);
  try {
    boost::asio::io_context io;
    auto processes = create_process_runner();
    MergeGate gate(io.get_executor());
    TaskRunner runner(*processes, gate,
                      task_runner_options(*config, *repo_root));
    WorkerPool pool(io, runner, config->pool.workers);
    pool.set_stop_on_signal(true);
    report = pool.run(std::move(*tasks));
  } catch (const std::exception &e) {
    log::error("orchestrator aborted: {}", e.what());
    log::stop();
    return 1;
  }
  log::stop();

  if (!report) {
    std::println(stderr, "Error: {}", report.error().message());
    return 1;
  }
  print_summary(*report);
  return exit_code_for(*report);
}

} // namespace aoa::cli
