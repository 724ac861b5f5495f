#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

#include "util/Expected.hpp"

namespace gitsync {

/// Commit counts between local HEAD and the upstream tracking ref
struct Divergence {
    size_t ahead{0};
    size_t behind{0};
};

/**
 * @brief A stash created by the download flow
 *
 * commitId is empty when the stash push found nothing to save.
 */
struct StashRecord {
    std::string label;
    std::string commitId;
    std::chrono::system_clock::time_point createdAt{};

    bool created() const { return !commitId.empty(); }
};

/**
 * @brief Strategy interface over the version-control command surface
 *
 * One call per primitive, no retries and no decisions. Failures come back as
 * Error with a code that separates unreachable remotes (NetworkError), pushes
 * refused by the remote (RejectedError), impossible fast-forwards
 * (DivergedHistoryError), conflicting stash restores (RestoreConflictError)
 * and everything else (VcsFailure).
 */
class IVcsAdapter {
public:
    virtual ~IVcsAdapter() = default;

    /// Absolute top-level directory of the working copy
    virtual Expected<std::filesystem::path> topLevel() = 0;

    /// Absolute path of a file inside the VCS metadata directory
    virtual Expected<std::filesystem::path> metadataPath(const std::string& name) = 0;

    /// Stage every change, honouring ignore rules
    virtual Expected<void> stageAll() = 0;

    /// True when the index differs from HEAD
    virtual Expected<bool> hasStagedChanges() = 0;

    /// True when tracked files differ from HEAD, staged or not
    virtual Expected<bool> isWorkingTreeDirty() = 0;

    virtual Expected<void> commit(const std::string& message) = 0;

    /// Name of the checked-out branch; VcsFailure on detached HEAD
    virtual Expected<std::string> currentBranch() = 0;

    /// Commit id of HEAD, empty string before the first commit
    virtual Expected<std::string> headCommit() = 0;

    virtual Expected<void> push(const std::string& remote, const std::string& localBranch,
                                const std::string& remoteBranch) = 0;

    /// Fetch with pruning of stale remote-tracking refs
    virtual Expected<void> fetch(const std::string& remote) = 0;

    virtual Expected<bool> refExists(const std::string& ref) = 0;

    /// Ahead/behind of HEAD relative to ref
    virtual Expected<Divergence> aheadBehind(const std::string& ref) = 0;

    /// Number of commits reachable from ref
    virtual Expected<size_t> countCommits(const std::string& ref) = 0;

    /// Fast-forward-only integration of ref into the current branch
    virtual Expected<void> fastForward(const std::string& ref) = 0;

    virtual Expected<StashRecord> stashPush(const std::string& label) = 0;
    virtual Expected<void> stashApply(const StashRecord& record) = 0;
    virtual Expected<void> stashDrop(const StashRecord& record) = 0;
};

}
