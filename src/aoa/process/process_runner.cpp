#include "aoa/process/process_runner.hpp"

#include "aoa/core/asio_awaitable.hpp"
#include "aoa/process/line_prefixer.hpp"
#include "aoa/util/log.hpp"
#include "aoa/util/shell.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/process/v2/start_dir.hpp>
#include <boost/process/v2/stdio.hpp>

#include <algorithm>
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace aoa {

auto ProcessSpec::command_line() const -> std::string {
  return join_command_line(program, args);
}

auto IProcessRunner::run_checked(ProcessSpec spec)
    -> task<Result<ProcessResult>> {
  auto result = co_await run(std::move(spec));
  if (!result) {
    co_return fail(result.error());
  }
  if (!result->succeeded()) {
    co_return fail(make_exit_status(result->exit_code));
  }
  co_return result;
}

namespace {

namespace bp = boost::process::v2;

inline constexpr std::size_t kReadBufferSize = 4096;
inline constexpr std::size_t kInitialOutputReserve = 8192;

[[nodiscard]] auto resolve_program(const std::string &program)
    -> std::string {
  if (program.find('/') != std::string::npos) {
    return program;
  }
  return bp::environment::find_executable(program).string();
}

[[nodiscard]] auto read_pipe_all(boost::asio::readable_pipe &pipe,
                                 std::string &out, LinePrefixer *prefixer)
    -> task<void> {
  std::array<char, kReadBufferSize> buffer{};
  for (;;) {
    auto [ec, bytes] = co_await pipe.async_read_some(
        boost::asio::buffer(buffer.data(), buffer.size()), use_nothrow);
    if (bytes > 0) {
      const std::string_view chunk(buffer.data(), bytes);
      if (out.size() < kMaxCapturedOutput) {
        out.append(chunk.substr(
            0, std::min(chunk.size(), kMaxCapturedOutput - out.size())));
      }
      if (prefixer != nullptr) {
        prefixer->feed(chunk);
      }
    }
    if (ec) {
      break;
    }
  }
  if (prefixer != nullptr) {
    prefixer->flush();
  }
}

[[nodiscard]] auto wait_exit(bp::process &proc) -> task<Result<int>> {
  co_return as_result(co_await proc.async_wait(use_nothrow));
}

class BoostProcessRunner final : public IProcessRunner {
public:
  auto run(ProcessSpec spec) -> task<Result<ProcessResult>> override {
    const auto exe = resolve_program(spec.program);
    if (exe.empty()) {
      log::error("'{}' not found on PATH", spec.program);
      co_return fail(Error::ProcessSpawnFailed);
    }
    const auto dir = spec.working_dir.empty()
                         ? std::filesystem::current_path().string()
                         : spec.working_dir.string();

    log::debug("exec ({}) in {}: {}", to_string_view(spec.mode), dir,
               preview(spec.command_line()));

    if (spec.mode == StreamMode::Inherit) {
      co_return co_await run_inherited(exe, dir, spec);
    }
    co_return co_await run_captured(exe, dir, spec);
  }

private:
  static auto run_inherited(const std::string &exe, const std::string &dir,
                            const ProcessSpec &spec)
      -> task<Result<ProcessResult>> {
    auto executor = co_await boost::asio::this_coro::executor;
    std::optional<bp::process> proc;
    try {
      proc.emplace(executor, exe, spec.args, bp::process_start_dir{dir});
    } catch (const std::exception &ex) {
      log::error("failed to start '{}' in {}: {}", spec.program, dir,
                 ex.what());
      co_return fail(Error::ProcessSpawnFailed);
    }

    auto exit_code = co_await wait_exit(*proc);
    if (!exit_code) {
      log::error("waiting for '{}' failed: {}", spec.program,
                 exit_code.error().message());
      co_return fail(exit_code.error());
    }
    co_return ok(ProcessResult{.exit_code = *exit_code});
  }

  static auto run_captured(const std::string &exe, const std::string &dir,
                           const ProcessSpec &spec)
      -> task<Result<ProcessResult>> {
    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::readable_pipe stdout_pipe(executor);
    boost::asio::readable_pipe stderr_pipe(executor);

    ProcessResult result;
    result.stdout_output.reserve(kInitialOutputReserve);

    std::optional<LinePrefixer> out_lines;
    std::optional<LinePrefixer> err_lines;
    if (spec.mode == StreamMode::Prefixed) {
      out_lines.emplace(spec.tag, [](std::string_view line) { log::raw(line); });
      err_lines.emplace(spec.tag, [](std::string_view line) { log::raw(line); });
    }

    std::optional<bp::process> proc;
    try {
      proc.emplace(executor, exe, spec.args,
                   bp::process_stdio{
                       .in = nullptr, .out = stdout_pipe, .err = stderr_pipe},
                   bp::process_start_dir{dir});
    } catch (const std::exception &ex) {
      log::error("failed to start '{}' in {}: {}", spec.program, dir,
                 ex.what());
      co_return fail(Error::ProcessSpawnFailed);
    }

    using namespace awaitable_ops;
    auto exit_code = co_await (
        read_pipe_all(stdout_pipe, result.stdout_output,
                      out_lines ? &*out_lines : nullptr) &&
        read_pipe_all(stderr_pipe, result.stderr_output,
                      err_lines ? &*err_lines : nullptr) &&
        wait_exit(*proc));
    if (!exit_code) {
      log::error("waiting for '{}' failed: {}", spec.program,
                 exit_code.error().message());
      co_return fail(exit_code.error());
    }
    result.exit_code = *exit_code;
    co_return ok(std::move(result));
  }
};

} // namespace

auto create_process_runner() -> std::unique_ptr<IProcessRunner> {
  return std::make_unique<BoostProcessRunner>();
}

} // namespace aoa
