#include "core/ChangeDetector.hpp"

#include <utility>

#include "util/Logger.hpp"

namespace gitsync {

ChangeDetector::ChangeDetector(IVcsAdapter& vcs, std::string remote, std::string upstreamBranch)
    : vcs_(vcs), remote_(std::move(remote)), upstreamBranch_(std::move(upstreamBranch)) {}

Expected<bool> ChangeDetector::hasLocalChanges() {
    auto staged = vcs_.stageAll();
    if (!staged) return staged.error();
    return vcs_.hasStagedChanges();
}

Expected<std::string> ChangeDetector::upstreamBranchName() {
    if (!upstreamBranch_.empty()) return upstreamBranch_;
    return vcs_.currentBranch();
}

Expected<std::string> ChangeDetector::upstreamRef() {
    auto branch = upstreamBranchName();
    if (!branch) return branch.error();
    return "refs/remotes/" + remote_ + "/" + branch.value();
}

Expected<Divergence> ChangeDetector::remoteDivergence() {
    auto fetched = vcs_.fetch(remote_);
    if (!fetched) return fetched.error();
    return trackedDivergence();
}

Expected<Divergence> ChangeDetector::trackedDivergence() {
    auto ref = upstreamRef();
    if (!ref) return ref.error();

    auto head = vcs_.headCommit();
    if (!head) return head.error();
    auto exists = vcs_.refExists(ref.value());
    if (!exists) return exists.error();

    Divergence d;
    if (!exists.value()) {
        // Remote branch not created yet: everything local is "ahead"
        if (!head.value().empty()) {
            auto n = vcs_.countCommits("HEAD");
            if (!n) return n.error();
            d.ahead = n.value();
        }
        Logger::instance().debug("detect", ref.value() + " does not exist yet");
        return d;
    }
    if (head.value().empty()) {
        auto n = vcs_.countCommits(ref.value());
        if (!n) return n.error();
        d.behind = n.value();
        return d;
    }
    return vcs_.aheadBehind(ref.value());
}

Expected<bool> ChangeDetector::isWorkingTreeDirty() {
    return vcs_.isWorkingTreeDirty();
}

Expected<RepositoryState> ChangeDetector::snapshot(bool fetchFirst) {
    RepositoryState state;

    auto staged = vcs_.hasStagedChanges();
    if (!staged) return staged.error();
    state.hasStagedChanges = staged.value();

    auto dirty = vcs_.isWorkingTreeDirty();
    if (!dirty) return dirty.error();
    state.isWorkingTreeDirty = dirty.value();

    auto div = fetchFirst ? remoteDivergence() : trackedDivergence();
    if (!div) return div.error();
    state.commitsAhead = div.value().ahead;
    state.commitsBehind = div.value().behind;
    return state;
}

}
