#include "aoa/config/config.hpp"
#include "aoa/config/toml_util.hpp"

#include "aoa/core/error.hpp"
#include "aoa/util/log.hpp"

#include <boost/lexical_cast.hpp>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aoa {
namespace detail {

// Unset numeric keys keep these sentinels.
inline constexpr int kUnsetInt = std::numeric_limits<int>::min();
inline constexpr double kUnsetDouble = std::numeric_limits<double>::quiet_NaN();

struct AgentToml {
  std::string command{"claude"};
  std::string model;
  int max_tokens{kUnsetInt};
  double temperature{kUnsetDouble};
  std::string timeout;
  std::vector<std::string> additional_args;
  bool interactive{false};
  bool auto_approve{false};
  std::string print_flag{"-p"};
  std::string auto_approve_flag{"--dangerously-skip-permissions"};
};

struct PoolToml {
  int workers{1};
  std::string directory{"."};
  std::string worktree_dir{".worktrees"};
  std::string branch_prefix{"agent-"};
  std::string remote{"origin"};
};

struct LogToml {
  std::string level{"info"};
  std::string file;
};

struct AppToml {
  AgentToml agent{};
  PoolToml pool{};
  LogToml log{};
};

// {"claude": {...}, "workers": N}
struct ClaudeJson {
  std::optional<std::string> command;
  std::optional<std::string> model;
  std::optional<int> maxTokens;
  std::optional<double> temperature;
  std::optional<double> timeout;
  std::vector<std::string> additionalArgs;
};

struct AppJson {
  ClaudeJson claude{};
  std::optional<int> workers;
};

} // namespace detail
} // namespace aoa

namespace glz {
template <> struct meta<aoa::detail::AgentToml> {
  using T = aoa::detail::AgentToml;
  static constexpr auto value = object(
      "command", &T::command, "model", &T::model, "max_tokens", &T::max_tokens,
      "temperature", &T::temperature, "timeout", &T::timeout,
      "additional_args", &T::additional_args, "interactive", &T::interactive,
      "auto_approve", &T::auto_approve, "print_flag", &T::print_flag,
      "auto_approve_flag", &T::auto_approve_flag);
};

template <> struct meta<aoa::detail::PoolToml> {
  using T = aoa::detail::PoolToml;
  static constexpr auto value =
      object("workers", &T::workers, "directory", &T::directory,
             "worktree_dir", &T::worktree_dir, "branch_prefix",
             &T::branch_prefix, "remote", &T::remote);
};

template <> struct meta<aoa::detail::LogToml> {
  using T = aoa::detail::LogToml;
  static constexpr auto value = object("level", &T::level, "file", &T::file);
};

template <> struct meta<aoa::detail::AppToml> {
  using T = aoa::detail::AppToml;
  static constexpr auto value =
      object("agent", &T::agent, "pool", &T::pool, "log", &T::log);
};

template <> struct meta<aoa::detail::ClaudeJson> {
  using T = aoa::detail::ClaudeJson;
  static constexpr auto value =
      object("command", &T::command, "model", &T::model, "maxTokens",
             &T::maxTokens, "temperature", &T::temperature, "timeout",
             &T::timeout, "additionalArgs", &T::additionalArgs);
};

template <> struct meta<aoa::detail::AppJson> {
  using T = aoa::detail::AppJson;
  static constexpr auto value =
      object("claude", &T::claude, "workers", &T::workers);
};
} // namespace glz

namespace aoa {
namespace {

[[nodiscard]] auto non_empty(std::optional<std::string> value)
    -> std::optional<std::string> {
  if (value && value->empty()) {
    return std::nullopt;
  }
  return value;
}

[[nodiscard]] auto convert_toml(std::string_view text) -> Result<AppConfig> {
  auto raw_result = toml_util::parse_toml<detail::AppToml>(text);
  if (!raw_result)
    return fail(raw_result.error());
  auto &raw = *raw_result;

  AppConfig cfg{};
  cfg.agent.command = std::move(raw.agent.command);
  cfg.agent.model = non_empty(std::move(raw.agent.model));
  if (raw.agent.max_tokens != detail::kUnsetInt) {
    cfg.agent.max_tokens = raw.agent.max_tokens;
  }
  if (!std::isnan(raw.agent.temperature)) {
    cfg.agent.temperature = raw.agent.temperature;
  }
  cfg.agent.timeout = non_empty(std::move(raw.agent.timeout));
  cfg.agent.additional_args = std::move(raw.agent.additional_args);
  cfg.agent.interactive = raw.agent.interactive;
  cfg.agent.auto_approve = raw.agent.auto_approve;
  cfg.agent.print_flag = std::move(raw.agent.print_flag);
  cfg.agent.auto_approve_flag = std::move(raw.agent.auto_approve_flag);

  cfg.pool.workers = raw.pool.workers;
  cfg.pool.directory = std::move(raw.pool.directory);
  cfg.pool.worktree_dir = std::move(raw.pool.worktree_dir);
  cfg.pool.branch_prefix = std::move(raw.pool.branch_prefix);
  cfg.pool.remote = std::move(raw.pool.remote);

  cfg.log.level = std::move(raw.log.level);
  cfg.log.file = std::move(raw.log.file);
  return ok(std::move(cfg));
}

[[nodiscard]] auto convert_json(std::string_view text) -> Result<AppConfig> {
  auto raw_result = toml_util::parse_json<detail::AppJson>(text);
  if (!raw_result)
    return fail(raw_result.error());
  auto &raw = *raw_result;

  AppConfig cfg{};
  if (raw.claude.command) {
    cfg.agent.command = std::move(*raw.claude.command);
  }
  cfg.agent.model = non_empty(std::move(raw.claude.model));
  cfg.agent.max_tokens = raw.claude.maxTokens;
  cfg.agent.temperature = raw.claude.temperature;
  if (raw.claude.timeout) {
    cfg.agent.timeout = std::format("{}", *raw.claude.timeout);
  }
  cfg.agent.additional_args = std::move(raw.claude.additionalArgs);
  if (raw.workers) {
    cfg.pool.workers = *raw.workers;
  }
  return ok(std::move(cfg));
}

[[nodiscard]] auto finish(Result<AppConfig> parsed) -> Result<AppConfig> {
  if (!parsed) {
    return fail(parsed.error());
  }
  if (auto env = ConfigLoader::apply_env_overrides(*parsed); !env) {
    return fail(env.error());
  }
  // Not validated here: command-line flags may still override these values.
  return parsed;
}

} // namespace

auto ConfigLoader::format_for(std::string_view path) -> ConfigFormat {
  return std::filesystem::path(path).extension() == ".json"
             ? ConfigFormat::Json
             : ConfigFormat::Toml;
}

auto ConfigLoader::load_from_file(std::string_view path) -> Result<AppConfig> {
  auto text = toml_util::read_file(path);
  if (!text) {
    log::error("cannot read config file {}", path);
    return fail(text.error());
  }
  return load_from_string(*text, format_for(path));
}

auto ConfigLoader::load_from_string(std::string_view text, ConfigFormat format)
    -> Result<AppConfig> {
  try {
    return finish(format == ConfigFormat::Json ? convert_json(text)
                                               : convert_toml(text));
  } catch (const std::exception &e) {
    log::error("Failed to parse {} configuration: {}", to_string_view(format),
               e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::load_defaults() -> Result<AppConfig> {
  return finish(ok(AppConfig{}));
}

auto ConfigLoader::apply_env_overrides(AppConfig &cfg) -> Result<void> {
  try {
    if (const char *v = std::getenv("AOA_WORKERS"); v != nullptr) {
      cfg.pool.workers = boost::lexical_cast<int>(v);
    }
    if (const char *v = std::getenv("AOA_AGENT_COMMAND"); v != nullptr) {
      cfg.agent.command = v;
    }
    if (const char *v = std::getenv("AOA_MODEL"); v != nullptr) {
      cfg.agent.model = non_empty(std::string(v));
    }
    if (const char *v = std::getenv("AOA_LOG_LEVEL"); v != nullptr) {
      cfg.log.level = v;
    }
    if (const char *v = std::getenv("AOA_DIRECTORY"); v != nullptr) {
      cfg.pool.directory = v;
    }
  } catch (const boost::bad_lexical_cast &e) {
    log::error("invalid AOA_WORKERS value: {}", e.what());
    return fail(Error::ParseError);
  }
  return ok();
}

auto ConfigLoader::validate(const AppConfig &cfg) -> Result<void> {
  if (cfg.pool.workers < 1) {
    log::error("workers must be at least 1 (got {})", cfg.pool.workers);
    return fail(Error::InvalidArgument);
  }
  if (cfg.agent.command.empty()) {
    log::error("agent command must not be empty");
    return fail(Error::InvalidArgument);
  }
  if (cfg.agent.max_tokens && *cfg.agent.max_tokens < 0) {
    log::error("max_tokens must not be negative (got {})",
               *cfg.agent.max_tokens);
    return fail(Error::InvalidArgument);
  }
  if (cfg.agent.temperature &&
      (*cfg.agent.temperature < 0.0 || *cfg.agent.temperature > 2.0)) {
    log::error("temperature must be within [0, 2] (got {})",
               *cfg.agent.temperature);
    return fail(Error::InvalidArgument);
  }
  if (cfg.pool.branch_prefix.empty()) {
    log::error("branch_prefix must not be empty");
    return fail(Error::InvalidArgument);
  }
  if (!log::parse_level(cfg.log.level)) {
    log::error("unknown log level '{}'", cfg.log.level);
    return fail(Error::InvalidArgument);
  }
  return ok();
}

} // namespace aoa
