#pragma once

#include "aoa/core/coroutine.hpp"
#include "aoa/core/error.hpp"
#include "aoa/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace aoa {

enum class StreamMode : std::uint8_t {
  Inherit,  // child shares our stdin/stdout/stderr
  Capture,  // stdout/stderr collected silently
  Prefixed, // stdout/stderr collected and re-emitted line by line with a tag
};
BOOST_DESCRIBE_ENUM(StreamMode, Inherit, Capture, Prefixed)
AOA_DEFINE_ENUM_SERDE(StreamMode, StreamMode::Inherit)

inline constexpr std::size_t kMaxCapturedOutput = 10UZ * 1024 * 1024;

/// One external command. `args` never pass through a shell, so every
/// element reaches the child as exactly one argv entry.
struct ProcessSpec {
  std::string program;
  std::vector<std::string> args;
  std::filesystem::path working_dir;
  StreamMode mode{StreamMode::Inherit};
  std::string tag; // line prefix for StreamMode::Prefixed

  [[nodiscard]] auto command_line() const -> std::string;
};

struct ProcessResult {
  int exit_code{0};
  std::string stdout_output;
  std::string stderr_output;

  [[nodiscard]] auto succeeded() const noexcept -> bool {
    return exit_code == 0;
  }
};

class IProcessRunner {
public:
  virtual ~IProcessRunner() = default;

  /// Run to completion. Fails only when the process could not be started;
  /// any exit status, zero or not, is reported in the result.
  [[nodiscard]] virtual auto run(ProcessSpec spec)
      -> task<Result<ProcessResult>> = 0;

  /// Run to completion and fail with the exit status (exit_status category)
  /// unless the process exited with 0.
  [[nodiscard]] auto run_checked(ProcessSpec spec)
      -> task<Result<ProcessResult>>;
};

[[nodiscard]] auto create_process_runner() -> std::unique_ptr<IProcessRunner>;

} // namespace aoa
