#pragma once

#include "aoa/agent/agent_command.hpp"
#include "aoa/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <string>

namespace aoa {

enum class ConfigFormat : std::uint8_t { Toml, Json };
BOOST_DESCRIBE_ENUM(ConfigFormat, Toml, Json)
AOA_DEFINE_ENUM_SERDE(ConfigFormat, ConfigFormat::Toml)

struct PoolConfig {
  int workers{1};
  std::string directory{"."}; // shared workspace
  std::string worktree_dir{".worktrees"};
  std::string branch_prefix{"agent-"};
  std::string remote{"origin"};

  auto operator==(const PoolConfig &) const -> bool = default;
};

struct LogConfig {
  std::string level{"info"};
  std::string file; // empty = stdout

  auto operator==(const LogConfig &) const -> bool = default;
};

struct AppConfig {
  AgentConfig agent;
  PoolConfig pool;
  LogConfig log;

  auto operator==(const AppConfig &) const -> bool = default;
};

} // namespace aoa
