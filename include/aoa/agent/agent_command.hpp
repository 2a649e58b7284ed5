#pragma once

#include "aoa/orchestrator/task.hpp"
#include "aoa/process/process_runner.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aoa {

struct AgentConfig {
  std::string command{"claude"};
  std::optional<std::string> model;
  std::optional<int> max_tokens;
  std::optional<double> temperature;
  // Handed to the agent untouched; the orchestrator enforces no timeout.
  std::optional<std::string> timeout;
  std::vector<std::string> additional_args;
  bool interactive{false};
  bool auto_approve{false};
  std::string print_flag{"-p"};
  std::string auto_approve_flag{"--dangerously-skip-permissions"};

  auto operator==(const AgentConfig &) const -> bool = default;
};

/// Argument vector for one agent run. The task text is always the final
/// element and is never split or interpreted.
[[nodiscard]] auto build_agent_args(const AgentConfig &config,
                                    std::string_view task)
    -> std::vector<std::string>;

/// Interactive agents share our terminal; batch agents are captured and
/// their lines re-emitted with an `[agent-<id>]` prefix.
[[nodiscard]] auto build_agent_spec(const AgentConfig &config,
                                    std::string_view task,
                                    const std::filesystem::path &workspace,
                                    WorkerId worker) -> ProcessSpec;

} // namespace aoa
