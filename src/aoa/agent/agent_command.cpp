#include "aoa/agent/agent_command.hpp"

#include <format>

namespace aoa {

auto build_agent_args(const AgentConfig &config, std::string_view task)
    -> std::vector<std::string> {
  std::vector<std::string> args;
  args.reserve(config.additional_args.size() + 12);

  if (!config.interactive && !config.print_flag.empty()) {
    args.push_back(config.print_flag);
  }
  if (config.model && !config.model->empty()) {
    args.insert(args.end(), {"--model", *config.model});
  }
  // Zero means "no limit" and is left to the agent's default.
  if (config.max_tokens && *config.max_tokens > 0) {
    args.insert(args.end(),
                {"--max-tokens", std::to_string(*config.max_tokens)});
  }
  if (config.temperature) {
    args.insert(args.end(),
                {"--temperature", std::format("{}", *config.temperature)});
  }
  if (config.timeout && !config.timeout->empty()) {
    args.insert(args.end(), {"--timeout", *config.timeout});
  }
  if (config.auto_approve && !config.auto_approve_flag.empty()) {
    args.push_back(config.auto_approve_flag);
  }
  args.insert(args.end(), config.additional_args.begin(),
              config.additional_args.end());
  args.emplace_back(task);
  return args;
}

auto build_agent_spec(const AgentConfig &config, std::string_view task,
                      const std::filesystem::path &workspace, WorkerId worker)
    -> ProcessSpec {
  return ProcessSpec{
      .program = config.command,
      .args = build_agent_args(config, task),
      .working_dir = workspace,
      .mode = config.interactive ? StreamMode::Inherit : StreamMode::Prefixed,
      .tag = std::format("[agent-{}]", worker)};
}

} // namespace aoa
