#pragma once

#include "aoa/core/coroutine.hpp"
#include "aoa/core/error.hpp"
#include "aoa/orchestrator/task.hpp"
#include "aoa/vcs/git.hpp"

#include <filesystem>
#include <string>

namespace aoa {

struct WorkspaceLayout {
  std::filesystem::path repo_root;
  std::filesystem::path worktree_dir{".worktrees"}; // relative to repo_root
  std::string branch_prefix{"agent-"};
};

/// A linked checkout owned by one worker for the duration of one task.
struct Workspace {
  WorkerId worker{0};
  std::filesystem::path path;
  std::string branch;
  std::string base_branch;
};

class WorkspaceProvisioner {
public:
  WorkspaceProvisioner(Git &git, WorkspaceLayout layout);

  [[nodiscard]] auto repo_root() const noexcept
      -> const std::filesystem::path & {
    return layout_.repo_root;
  }
  [[nodiscard]] auto path_for(WorkerId worker) const -> std::filesystem::path;
  [[nodiscard]] auto branch_for(WorkerId worker) const -> std::string;

  /// Fails with NotARepository when the shared workspace is not a git
  /// checkout and with AlreadyExists when the derived path is taken; an
  /// existing directory is never reused.
  [[nodiscard]] auto provision(WorkerId worker) -> task<Result<Workspace>>;

  /// Safe to call on a workspace that is already gone.
  [[nodiscard]] auto teardown(const Workspace &workspace)
      -> task<Result<void>>;

private:
  Git *git_;
  WorkspaceLayout layout_;
};

} // namespace aoa
