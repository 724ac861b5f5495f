#include "core/UploadFlow.hpp"

#include <utility>

#include "core/Constants.hpp"
#include "util/Logger.hpp"

namespace gitsync {

const char* uploadOutcomeName(UploadOutcome outcome) {
    switch (outcome) {
        case UploadOutcome::NoOp: return "NoOp";
        case UploadOutcome::Committed: return "Committed";
        case UploadOutcome::PushedPending: return "PushedPending";
    }
    return "Unknown";
}

UploadFlow::UploadFlow(IVcsAdapter& vcs, ChangeDetector& detector, std::string commitContext)
    : vcs_(vcs), detector_(detector), context_(std::move(commitContext)) {}

std::string UploadFlow::buildCommitMessage(const std::string& context) {
    std::string message = std::string(Constants::COMMIT_PREFIX) + " " + Constants::COMMIT_SUMMARY +
                          " " + Constants::LOOP_MARKER;
    if (!context.empty()) {
        message += "\n\n" + context;
    }
    return message;
}

Expected<void> UploadFlow::pushBranch(const std::string& branch) {
    auto upstream = detector_.upstreamBranchName();
    if (!upstream) return upstream.error();
    return vcs_.push(detector_.remote(), branch, upstream.value());
}

Expected<UploadResult> UploadFlow::run() {
    auto& log = Logger::instance();

    // Resolve first so a detached HEAD never gets a commit
    auto branch = vcs_.currentBranch();
    if (!branch) return branch.error();

    UploadResult result;
    result.branch = branch.value();

    auto changed = detector_.hasLocalChanges();
    if (!changed) return changed.error();

    if (!changed.value()) {
        auto div = detector_.trackedDivergence();
        if (!div) return div.error();
        if (div.value().ahead == 0) {
            log.debug("upload", "no local changes");
            return result;
        }
        log.info("upload", std::to_string(div.value().ahead) + " unpushed commit(s) on " + result.branch + ", pushing");
        auto pushed = pushBranch(result.branch);
        if (!pushed) return pushed.error();
        result.outcome = UploadOutcome::PushedPending;
        return result;
    }

    auto committed = vcs_.commit(buildCommitMessage(context_));
    if (!committed) return committed.error();

    auto head = vcs_.headCommit();
    if (!head) return head.error();
    result.commitId = head.value();
    log.info("upload", "committed " + result.commitId.substr(0, 12) + " on " + result.branch);

    auto pushed = pushBranch(result.branch);
    if (!pushed) {
        Error err = pushed.error();
        err.message = "commit " + result.commitId.substr(0, 12) + " kept locally; " + err.message;
        return err;
    }
    result.outcome = UploadOutcome::Committed;
    log.info("upload", "pushed " + result.branch + " to " + detector_.remote());
    return result;
}

}
