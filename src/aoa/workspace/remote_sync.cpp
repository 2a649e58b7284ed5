#include "aoa/workspace/remote_sync.hpp"

#include "aoa/util/log.hpp"

#include <format>

namespace aoa {

auto RemoteSync::sync(const Workspace &workspace) -> task<SyncOutcome> {
  if (!co_await git_->has_remote(repo_root_, remote_)) {
    co_return SyncOutcome{.status = SyncStatus::Skipped,
                          .detail = std::format("no remote '{}'", remote_)};
  }
  if (!co_await git_->is_repository(workspace.path)) {
    co_return SyncOutcome{
        .status = SyncStatus::Skipped,
        .detail = std::format("{} is not a repository",
                              workspace.path.string())};
  }

  auto branch = co_await git_->current_branch(repo_root_);
  if (!branch) {
    log::warn("agent {}: cannot determine branch to sync: {}",
              workspace.worker, branch.error().message());
    co_return SyncOutcome{.status = SyncStatus::Warning,
                          .detail = "cannot determine current branch"};
  }

  if (auto fetched = co_await git_->fetch(workspace.path, remote_); !fetched) {
    log::warn("agent {}: git fetch {} failed: {}", workspace.worker, remote_,
              fetched.error().message());
    co_return SyncOutcome{
        .status = SyncStatus::Warning,
        .detail = std::format("fetch failed: {}", fetched.error().message())};
  }
  if (auto pulled = co_await git_->pull(workspace.path, remote_, *branch);
      !pulled) {
    log::warn("agent {}: git pull {} {} failed: {}", workspace.worker, remote_,
              *branch, pulled.error().message());
    co_return SyncOutcome{
        .status = SyncStatus::Warning,
        .detail = std::format("pull failed: {}", pulled.error().message())};
  }

  co_return SyncOutcome{.status = SyncStatus::Synced,
                        .detail = std::format("{}/{}", remote_, *branch)};
}

} // namespace aoa
