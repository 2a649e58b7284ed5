#pragma once

#include "aoa/core/coroutine.hpp"
#include "aoa/core/error.hpp"
#include "aoa/process/process_runner.hpp"
#include "aoa/util/shell.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aoa {

struct CommitIdentity {
  std::string name;
  std::string email;
};

/// Thin typed wrapper over the git command line. Mutating commands inherit
/// our standard streams; queries are captured.
class Git {
public:
  explicit Git(IProcessRunner &runner, std::string program = "git")
      : runner_(&runner), program_(std::move(program)) {}

  [[nodiscard]] auto is_repository(const std::filesystem::path &dir)
      -> task<bool>;
  [[nodiscard]] auto has_remote(const std::filesystem::path &repo,
                                std::string_view remote) -> task<bool>;
  [[nodiscard]] auto current_branch(const std::filesystem::path &repo)
      -> task<Result<std::string>>;

  [[nodiscard]] auto add_worktree(const std::filesystem::path &repo,
                                  const std::filesystem::path &path,
                                  std::string_view branch,
                                  std::string_view base)
      -> task<Result<void>>;
  [[nodiscard]] auto remove_worktree(const std::filesystem::path &repo,
                                     const std::filesystem::path &path)
      -> task<Result<void>>;
  [[nodiscard]] auto prune_worktrees(const std::filesystem::path &repo)
      -> task<Result<void>>;

  [[nodiscard]] auto stage_all(const std::filesystem::path &dir)
      -> task<Result<void>>;
  /// `git diff --cached --quiet` exits 0 when nothing is staged and 1 when
  /// something is; any other status is an error.
  [[nodiscard]] auto has_staged_changes(const std::filesystem::path &dir)
      -> task<Result<bool>>;
  [[nodiscard]] auto config_value(const std::filesystem::path &dir,
                                  std::string_view key)
      -> task<std::optional<std::string>>;
  /// When `identity` is set it applies to this commit only (`git -c`).
  [[nodiscard]] auto commit(const std::filesystem::path &dir,
                            std::string_view message,
                            const std::optional<CommitIdentity> &identity)
      -> task<Result<void>>;
  [[nodiscard]] auto merge_ff_only(const std::filesystem::path &repo,
                                   std::string_view branch)
      -> task<Result<void>>;

  [[nodiscard]] auto fetch(const std::filesystem::path &dir,
                           std::string_view remote) -> task<Result<void>>;
  [[nodiscard]] auto pull(const std::filesystem::path &dir,
                          std::string_view remote, std::string_view branch)
      -> task<Result<void>>;

private:
  [[nodiscard]] auto spec(const std::filesystem::path &dir,
                          std::vector<std::string> args, StreamMode mode) const
      -> ProcessSpec;
  [[nodiscard]] auto run_mutating(const std::filesystem::path &dir,
                                  std::vector<std::string> args)
      -> task<Result<void>>;

  IProcessRunner *runner_;
  std::string program_;
};

} // namespace aoa
