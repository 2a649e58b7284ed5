#pragma once

#include <array>
#include <cerrno>
#include <concepts>
#include <cstdint>
#include <expected>
#include <format>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace aoa {

enum class Error : std::uint8_t {
  Success,
  FileNotFound,
  ParseError,
  InvalidArgument,
  NotADirectory,
  NotARepository,
  AlreadyExists,
  ProcessSpawnFailed,
  WorkspaceSetupFailed,
  TeardownFailed,
  StageFailed,
  CommitFailed,
  MergeRejected,
  TaskFailed,
  Interrupted,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::array<std::string_view, 16> messages = {
      "success",
      "file not found",
      "parse error",
      "invalid argument",
      "not a directory",
      "not a git repository",
      "already exists",
      "failed to spawn process",
      "failed to set up workspace",
      "failed to tear down workspace",
      "failed to stage changes",
      "commit failed",
      "fast-forward merge rejected",
      "one or more tasks failed",
      "interrupted",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "aoa";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      std::unreachable();
    }
    return std::string{messages.at(idx)};
  }
};

inline auto error_category() -> const ErrorCategory & {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

/// Exit status of a child process that terminated unsuccessfully. The error
/// value is the raw exit code, so `ec.value()` is what the process returned.
class ExitStatusCategory : public std::error_category {
public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "exit_status";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    return std::format("process exited with status {}", ev);
  }
};

inline auto exit_status_category() -> const ExitStatusCategory & {
  static const ExitStatusCategory instance;
  return instance;
}

[[nodiscard]] inline auto make_exit_status(int exit_code) -> std::error_code {
  return {exit_code, exit_status_category()};
}

[[nodiscard]] inline auto is_exit_status(const std::error_code &ec) noexcept
    -> bool {
  return ec.category() == exit_status_category();
}

// Concept for types that can be used with Result<T>
template <typename T>
concept ResultValue = std::destructible<T> || std::is_void_v<T>;

template <typename T> using Result = std::expected<T, std::error_code>;

template <typename T>
  requires ResultValue<std::decay_t<T>>
[[nodiscard]] constexpr auto ok(T &&value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> { return {}; }

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

} // namespace aoa

template <> struct std::is_error_code_enum<aoa::Error> : std::true_type {};
