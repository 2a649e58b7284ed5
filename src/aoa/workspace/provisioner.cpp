#include "aoa/workspace/provisioner.hpp"

#include "aoa/util/log.hpp"

#include <format>
#include <system_error>
#include <utility>

namespace aoa {

WorkspaceProvisioner::WorkspaceProvisioner(Git &git, WorkspaceLayout layout)
    : git_(&git), layout_(std::move(layout)) {
  if (layout_.worktree_dir.is_relative()) {
    layout_.worktree_dir = layout_.repo_root / layout_.worktree_dir;
  }
}

auto WorkspaceProvisioner::path_for(WorkerId worker) const
    -> std::filesystem::path {
  return layout_.worktree_dir / branch_for(worker);
}

auto WorkspaceProvisioner::branch_for(WorkerId worker) const -> std::string {
  return std::format("{}{}", layout_.branch_prefix, worker);
}

auto WorkspaceProvisioner::provision(WorkerId worker)
    -> task<Result<Workspace>> {
  const auto &root = layout_.repo_root;
  if (!co_await git_->is_repository(root)) {
    log::error("{} is not a git repository", root.string());
    co_return fail(Error::NotARepository);
  }

  Workspace ws{.worker = worker,
               .path = path_for(worker),
               .branch = branch_for(worker),
               .base_branch = {}};

  std::error_code ec;
  if (std::filesystem::exists(ws.path, ec)) {
    log::error("workspace path {} already exists; remove it before retrying",
               ws.path.string());
    co_return fail(Error::AlreadyExists);
  }

  auto base = co_await git_->current_branch(root);
  if (!base) {
    co_return fail(Error::WorkspaceSetupFailed);
  }
  ws.base_branch = std::move(*base);

  std::filesystem::create_directories(layout_.worktree_dir, ec);
  if (ec) {
    log::error("cannot create {}: {}", layout_.worktree_dir.string(),
               ec.message());
    co_return fail(Error::WorkspaceSetupFailed);
  }

  if (auto added =
          co_await git_->add_worktree(root, ws.path, ws.branch, ws.base_branch);
      !added) {
    log::error("git worktree add {} failed: {}", ws.path.string(),
               added.error().message());
    co_return fail(Error::WorkspaceSetupFailed);
  }

  log::debug("provisioned {} on branch {} from {}", ws.path.string(),
             ws.branch, ws.base_branch);
  co_return ok(std::move(ws));
}

auto WorkspaceProvisioner::teardown(const Workspace &workspace)
    -> task<Result<void>> {
  const auto &root = layout_.repo_root;
  std::error_code ec;

  if (!std::filesystem::exists(workspace.path, ec)) {
    log::warn("workspace {} is already removed", workspace.path.string());
    if (auto pruned = co_await git_->prune_worktrees(root); !pruned) {
      log::warn("git worktree prune failed: {}", pruned.error().message());
    }
    co_return ok();
  }

  auto removed = co_await git_->remove_worktree(root, workspace.path);
  if (removed) {
    log::debug("removed workspace {}", workspace.path.string());
    co_return ok();
  }

  // git refused (locked or corrupt worktree); drop the directory ourselves so
  // the worker identity can be reused, then clear the stale metadata.
  log::warn("git worktree remove {} failed ({}); deleting directory",
            workspace.path.string(), removed.error().message());
  std::filesystem::remove_all(workspace.path, ec);
  if (ec) {
    log::error("cannot delete {}: {}", workspace.path.string(), ec.message());
    co_return fail(Error::TeardownFailed);
  }
  if (auto pruned = co_await git_->prune_worktrees(root); !pruned) {
    log::warn("git worktree prune failed: {}", pruned.error().message());
  }
  co_return ok();
}

} // namespace aoa
