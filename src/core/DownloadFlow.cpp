#include "core/DownloadFlow.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <unistd.h>

#include "core/Constants.hpp"
#include "util/Logger.hpp"

namespace gitsync {

const char* downloadOutcomeName(DownloadOutcome outcome) {
    switch (outcome) {
        case DownloadOutcome::NoOp: return "NoOp";
        case DownloadOutcome::FastForwarded: return "FastForwarded";
    }
    return "Unknown";
}

DownloadFlow::DownloadFlow(IVcsAdapter& vcs, ChangeDetector& detector)
    : vcs_(vcs), detector_(detector) {}

std::string DownloadFlow::makeStashLabel() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream os;
    os << Constants::STASH_LABEL_PREFIX << " " << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
       << " pid " << ::getpid();
    return os.str();
}

Expected<DownloadResult> DownloadFlow::run(const Divergence& divergence) {
    auto& log = Logger::instance();
    DownloadResult result;

    if (divergence.behind == 0) {
        log.debug("download", "upstream has no new commits");
        return result;
    }

    auto ref = detector_.upstreamRef();
    if (!ref) return ref.error();

    auto head = vcs_.headCommit();
    if (!head) return head.error();
    result.headBefore = head.value();

    auto dirty = detector_.isWorkingTreeDirty();
    if (!dirty) return dirty.error();

    StashRecord stash;
    if (dirty.value()) {
        auto pushed = vcs_.stashPush(makeStashLabel());
        if (!pushed) return pushed.error();
        stash = pushed.value();
        if (stash.created()) {
            result.stashUsed = true;
            log.info("download", "stashed local edits as '" + stash.label + "' (" + stash.commitId.substr(0, 12) + ")");
        } else {
            log.debug("download", "working tree became clean before stashing");
        }
    }

    auto ff = vcs_.fastForward(ref.value());
    if (!ff) {
        Error err = ff.error();
        if (stash.created()) {
            err.message += "; local edits remain in stash '" + stash.label + "' (" + stash.commitId + ")";
        }
        if (err.code == ErrorCode::DivergedHistoryError) {
            log.error("download", "MANUAL ACTION REQUIRED: " + ref.value() + " cannot be fast-forwarded; "
                      "local and upstream histories have diverged");
        }
        return err;
    }

    auto after = vcs_.headCommit();
    if (!after) return after.error();
    result.headAfter = after.value();
    result.outcome = DownloadOutcome::FastForwarded;
    result.commitsIntegrated = divergence.behind;
    log.info("download", "fast-forwarded " + std::to_string(divergence.behind) + " commit(s) to " +
             result.headAfter.substr(0, 12));

    if (!stash.created()) return result;

    auto applied = vcs_.stashApply(stash);
    if (!applied) {
        log.error("download", "MANUAL ACTION REQUIRED: stash '" + stash.label + "' (" + stash.commitId +
                  ") did not re-apply cleanly and has been kept");
        Error err = applied.error();
        err.code = ErrorCode::RestoreConflictError;
        err.message = "restore of stash '" + stash.label + "' conflicted, stash kept: " + err.message;
        return err;
    }

    auto dropped = vcs_.stashDrop(stash);
    if (!dropped) {
        result.stashLeftBehind = true;
        log.warn("download", "edits restored but stash " + stash.commitId + " could not be dropped: " +
                 dropped.error().message);
    } else {
        log.info("download", "restored local edits from stash");
    }
    return result;
}

}
