#include "aoa/cli/commands.hpp"
#include "aoa/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <string>

namespace {
auto default_config() -> std::string {
  if (const char *env = std::getenv("AOA_CONFIG"); env && *env) {
    return env;
  }
  return {};
}
} // namespace

int main(int argc, char *argv[]) {
  // Until a command configures logging, only problems are worth printing.
  aoa::log::set_output_stderr();
  aoa::log::set_level(aoa::log::Level::Warn);

  CLI::App app{"aoa",
               "Run coding agents in parallel, one git worktree per agent"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  aoa start tasks.json -n 3\n"
             "  aoa start tasks.txt -c aoa.toml -- --verbose\n"
             "\nTip: Set AOA_CONFIG=aoa.toml to skip -c on every command.");

  const std::string env_config = default_config();

  aoa::cli::StartOptions start_opts;
  auto *start = app.add_subcommand("start", "Dispatch tasks to agents");
  start->footer("\nArguments after `--` are passed to every agent "
                "invocation unchanged.");
  start_opts.config_file = env_config;
  start->add_option("tasks", start_opts.tasks_file,
                    "Task file: JSON array of strings, or one task per line")
      ->required()
      ->check(CLI::ExistingFile);
  start->add_option("agent_args", start_opts.agent_args,
                    "Extra agent flags (after --)");
  start
      ->add_option("-c,--config", start_opts.config_file,
                   "Config file (.toml or .json)")
      ->check(CLI::ExistingFile);
  start->add_option("-n,--agents", start_opts.agents,
                    "Number of parallel agents")
      ->check(CLI::PositiveNumber);
  start
      ->add_option("-C,--directory", start_opts.directory,
                   "Shared repository (default: current directory)")
      ->check(CLI::ExistingDirectory);
  start->add_option("--model", start_opts.model, "Agent model");
  start->add_flag("--interactive", start_opts.interactive,
                  "Attach agents to the terminal instead of batch mode");
  start->add_flag("-y,--auto-approve", start_opts.auto_approve,
                  "Let agents act without permission prompts");
  start
      ->add_option("--log-level", start_opts.log_level,
                   "Log level: trace|debug|info|warn|error")
      ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}));
  start->add_option("--log-file", start_opts.log_file, "Log file path");
  start->callback(
      [&start_opts]() { std::exit(aoa::cli::cmd_start(start_opts)); });

  aoa::cli::ValidateOptions validate_opts;
  auto *validate = app.add_subcommand(
      "validate", "Check config and task file without running anything");
  validate_opts.config_file = env_config;
  validate
      ->add_option("tasks", validate_opts.tasks_file, "Task file")
      ->required()
      ->check(CLI::ExistingFile);
  validate
      ->add_option("-c,--config", validate_opts.config_file,
                   "Config file (.toml or .json)")
      ->check(CLI::ExistingFile);
  validate->callback([&validate_opts]() {
    std::exit(aoa::cli::cmd_validate(validate_opts));
  });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
