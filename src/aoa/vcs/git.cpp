#include "aoa/vcs/git.hpp"

#include "aoa/util/shell.hpp"

#include "aoa/util/log.hpp"

#include <format>
#include <utility>

namespace aoa {

auto Git::spec(const std::filesystem::path &dir, std::vector<std::string> args,
               StreamMode mode) const -> ProcessSpec {
  return ProcessSpec{.program = program_,
                     .args = std::move(args),
                     .working_dir = dir,
                     .mode = mode,
                     .tag = {}};
}

auto Git::run_mutating(const std::filesystem::path &dir,
                       std::vector<std::string> args) -> task<Result<void>> {
  auto s = spec(dir, std::move(args), StreamMode::Inherit);
  const auto line = s.command_line();
  auto res = co_await runner_->run_checked(std::move(s));
  if (!res) {
    log::debug("'{}' failed in {}: {}", line, dir.string(),
               res.error().message());
    co_return fail(res.error());
  }
  co_return ok();
}

auto Git::is_repository(const std::filesystem::path &dir) -> task<bool> {
  auto res = co_await runner_->run(
      spec(dir, {"rev-parse", "--is-inside-work-tree"}, StreamMode::Capture));
  co_return res && res->succeeded() &&
      trim_whitespace(res->stdout_output) == "true";
}

auto Git::has_remote(const std::filesystem::path &repo,
                     std::string_view remote) -> task<bool> {
  auto res = co_await runner_->run(spec(
      repo, {"remote", "get-url", std::string(remote)}, StreamMode::Capture));
  co_return res && res->succeeded();
}

auto Git::current_branch(const std::filesystem::path &repo)
    -> task<Result<std::string>> {
  auto res = co_await runner_->run_checked(spec(
      repo, {"rev-parse", "--abbrev-ref", "HEAD"}, StreamMode::Capture));
  if (!res) {
    co_return fail(res.error());
  }
  auto branch = std::string(trim_whitespace(res->stdout_output));
  if (branch.empty() || branch == "HEAD") {
    // Detached HEAD has no branch to fork workspaces from.
    log::error("{} is not on a branch", repo.string());
    co_return fail(Error::InvalidArgument);
  }
  co_return ok(std::move(branch));
}

auto Git::add_worktree(const std::filesystem::path &repo,
                       const std::filesystem::path &path,
                       std::string_view branch, std::string_view base)
    -> task<Result<void>> {
  co_return co_await run_mutating(
      repo, {"worktree", "add", "-B", std::string(branch), path.string(),
             std::string(base)});
}

auto Git::remove_worktree(const std::filesystem::path &repo,
                          const std::filesystem::path &path)
    -> task<Result<void>> {
  co_return co_await run_mutating(
      repo, {"worktree", "remove", "--force", path.string()});
}

auto Git::prune_worktrees(const std::filesystem::path &repo)
    -> task<Result<void>> {
  co_return co_await run_mutating(repo, {"worktree", "prune"});
}

auto Git::stage_all(const std::filesystem::path &dir) -> task<Result<void>> {
  co_return co_await run_mutating(dir, {"add", "-A"});
}

auto Git::has_staged_changes(const std::filesystem::path &dir)
    -> task<Result<bool>> {
  auto res = co_await runner_->run(
      spec(dir, {"diff", "--cached", "--quiet"}, StreamMode::Capture));
  if (!res) {
    co_return fail(res.error());
  }
  switch (res->exit_code) {
  case 0:
    co_return ok(false);
  case 1:
    co_return ok(true);
  default:
    log::error("git diff --cached in {} exited with {}: {}", dir.string(),
               res->exit_code, trim_whitespace(res->stderr_output));
    co_return fail(make_exit_status(res->exit_code));
  }
}

auto Git::config_value(const std::filesystem::path &dir, std::string_view key)
    -> task<std::optional<std::string>> {
  auto res = co_await runner_->run(
      spec(dir, {"config", "--get", std::string(key)}, StreamMode::Capture));
  if (!res || !res->succeeded()) {
    co_return std::nullopt;
  }
  auto value = trim_whitespace(res->stdout_output);
  if (value.empty()) {
    co_return std::nullopt;
  }
  co_return std::string(value);
}

auto Git::commit(const std::filesystem::path &dir, std::string_view message,
                 const std::optional<CommitIdentity> &identity)
    -> task<Result<void>> {
  std::vector<std::string> args;
  if (identity) {
    args.push_back("-c");
    args.push_back(std::format("user.name={}", identity->name));
    args.push_back("-c");
    args.push_back(std::format("user.email={}", identity->email));
  }
  args.insert(args.end(), {"commit", "-m", std::string(message)});
  co_return co_await run_mutating(dir, std::move(args));
}

auto Git::merge_ff_only(const std::filesystem::path &repo,
                        std::string_view branch) -> task<Result<void>> {
  co_return co_await run_mutating(
      repo, {"merge", "--ff-only", std::string(branch)});
}

auto Git::fetch(const std::filesystem::path &dir, std::string_view remote)
    -> task<Result<void>> {
  co_return co_await run_mutating(dir, {"fetch", std::string(remote)});
}

auto Git::pull(const std::filesystem::path &dir, std::string_view remote,
               std::string_view branch) -> task<Result<void>> {
  co_return co_await run_mutating(
      dir, {"pull", "--no-edit", std::string(remote), std::string(branch)});
}

} // namespace aoa
