#pragma once

#include <string>

#include "core/ChangeDetector.hpp"
#include "core/IVcsAdapter.hpp"
#include "util/Expected.hpp"

namespace gitsync {

enum class UploadOutcome {
    NoOp,          // nothing staged, nothing waiting to be pushed
    Committed,     // new sync commit created and pushed
    PushedPending  // no new commit, earlier unpushed commits pushed
};

const char* uploadOutcomeName(UploadOutcome outcome);

struct UploadResult {
    UploadOutcome outcome{UploadOutcome::NoOp};
    std::string branch;
    std::string commitId;   // set for Committed
};

/**
 * @brief Local -> remote half of a cycle
 *
 * Caller must hold the sync lock. Steps:
 *   1. stage all (via ChangeDetector::hasLocalChanges)
 *   2. nothing staged: push any commits a previous cycle failed to push,
 *      otherwise NoOp
 *   3. commit with the sync message (prefix + loop-prevention marker)
 *   4. push <branch>:<upstream branch> to the configured remote
 *
 * A failed push is returned as RejectedError or NetworkError and not
 * retried here; the commit stays local and step 2 pushes it next cycle
 * without creating a second commit.
 */
class UploadFlow {
public:
    /**
     * @param vcs Adapter bound to the working copy
     * @param detector Detector sharing the same adapter
     * @param commitContext Optional text appended to the commit message
     */
    UploadFlow(IVcsAdapter& vcs, ChangeDetector& detector, std::string commitContext = "");

    Expected<UploadResult> run();

    /// Sync commit message; always carries the loop-prevention marker
    static std::string buildCommitMessage(const std::string& context);

private:
    Expected<void> pushBranch(const std::string& branch);

    IVcsAdapter& vcs_;
    ChangeDetector& detector_;
    std::string context_;
};

}
