#pragma once

#include <string>

#include "core/ChangeDetector.hpp"
#include "core/IVcsAdapter.hpp"
#include "util/Expected.hpp"

namespace gitsync {

enum class DownloadOutcome {
    NoOp,          // upstream has nothing new
    FastForwarded  // HEAD moved forward to the upstream tip
};

const char* downloadOutcomeName(DownloadOutcome outcome);

struct DownloadResult {
    DownloadOutcome outcome{DownloadOutcome::NoOp};
    size_t commitsIntegrated{0};
    bool stashUsed{false};
    /// Restore succeeded but dropping the stash failed; a duplicate remains
    bool stashLeftBehind{false};
    std::string headBefore;
    std::string headAfter;
};

/**
 * @brief Remote -> local half of a cycle
 *
 * Caller must hold the sync lock and must have fetched in this cycle
 * (ChangeDetector::remoteDivergence); nothing here talks to the network.
 *
 * A dirty working tree is always stashed before integrating. Integration is
 * fast-forward only. Errors that need a human:
 *   DivergedHistoryError  local commits not on upstream; HEAD untouched and
 *                         any stash made for this attempt is left in place
 *   RestoreConflictError  stash did not re-apply cleanly; the stash entry is
 *                         kept so no edit is lost
 * Neither is ever resolved automatically.
 */
class DownloadFlow {
public:
    DownloadFlow(IVcsAdapter& vcs, ChangeDetector& detector);

    /// @param divergence Counts from this cycle's fetch
    Expected<DownloadResult> run(const Divergence& divergence);

    /// Label for a new autostash, unique per process and second
    static std::string makeStashLabel();

private:
    IVcsAdapter& vcs_;
    ChangeDetector& detector_;
};

}
