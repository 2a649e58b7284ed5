#pragma once

#include "aoa/core/coroutine.hpp"
#include "aoa/orchestrator/task.hpp"
#include "aoa/vcs/git.hpp"
#include "aoa/workspace/provisioner.hpp"

#include <filesystem>
#include <string>

namespace aoa {

/// Pre-task fetch/pull of a fresh workspace against the shared repository's
/// upstream. Skipped when there is no such remote.
class RemoteSync {
public:
  RemoteSync(Git &git, std::filesystem::path repo_root,
             std::string remote = "origin")
      : git_(&git), repo_root_(std::move(repo_root)),
        remote_(std::move(remote)) {}

  [[nodiscard]] auto sync(const Workspace &workspace) -> task<SyncOutcome>;

private:
  Git *git_;
  std::filesystem::path repo_root_;
  std::string remote_;
};

} // namespace aoa
