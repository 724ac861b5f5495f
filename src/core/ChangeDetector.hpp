#pragma once

#include <string>

#include "core/IVcsAdapter.hpp"
#include "util/Expected.hpp"

namespace gitsync {

/// Snapshot of the working copy, recomputed on every use
struct RepositoryState {
    bool hasStagedChanges{false};
    bool isWorkingTreeDirty{false};
    size_t commitsAhead{0};
    size_t commitsBehind{0};
};

/**
 * @brief Decides whether there is anything to upload or download
 *
 * hasLocalChanges() stages everything first; the upload flow relies on the
 * files already being in the index. Nothing here commits, pushes or touches
 * the working tree.
 */
class ChangeDetector {
public:
    /**
     * @param vcs Adapter bound to the working copy
     * @param remote Remote name, e.g. "origin"
     * @param upstreamBranch Remote branch name; empty means the local branch's name
     */
    ChangeDetector(IVcsAdapter& vcs, std::string remote, std::string upstreamBranch = "");

    /// Stage all, then compare the index with HEAD
    Expected<bool> hasLocalChanges();

    /// Fetch (with prune), then count commits against the upstream ref
    Expected<Divergence> remoteDivergence();

    /// Ahead/behind against the last fetched upstream ref, no network
    Expected<Divergence> trackedDivergence();

    Expected<bool> isWorkingTreeDirty();

    /**
     * @brief Read-only state for reporting
     * @param fetchFirst Refresh the upstream ref before counting
     */
    Expected<RepositoryState> snapshot(bool fetchFirst);

    /// Remote branch to integrate with and push to
    Expected<std::string> upstreamBranchName();

    /// refs/remotes/<remote>/<branch>
    Expected<std::string> upstreamRef();

    const std::string& remote() const { return remote_; }

private:
    IVcsAdapter& vcs_;
    std::string remote_;
    std::string upstreamBranch_;
};

}
