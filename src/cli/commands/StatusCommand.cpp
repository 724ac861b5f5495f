#include "cli/commands/StatusCommand.hpp"

#include <filesystem>
#include <iostream>

#include "cli/CommandSupport.hpp"
#include "core/ChangeDetector.hpp"
#include "core/GitCliAdapter.hpp"
#include "core/SyncLock.hpp"

namespace fs = std::filesystem;

namespace gitsync {

static const char* yesNo(bool v) { return v ? "yes" : "no"; }

/**
 * @brief Execute 'gitsync status'
 *
 * Read-only: uses ChangeDetector::snapshot, which never stages, and only
 * touches the network when --fetch is given.
 */
Expected<void> StatusCommand::execute(const AppContext&, const std::vector<std::string>& args) {
    std::vector<std::string> rest = args;
    bool fetchFirst = takeSwitch(rest, "--fetch");

    auto cfgRes = loadConfig(rest);
    if (!cfgRes) return cfgRes.error();
    SyncConfig cfg = cfgRes.value();

    GitCliAdapter vcs(cfg.repoPath, cfg.gitExecutable, cfg.networkTimeout);
    auto top = vcs.topLevel();
    if (!top) {
        return Error{ErrorCode::ConfigurationError,
                     cfg.repoPath.string() + " is not a git working copy (" + top.error().message + ")"};
    }
    cfg.repoPath = top.value();

    ChangeDetector detector(vcs, cfg.remoteName, cfg.upstreamBranch);
    auto branch = vcs.currentBranch();
    auto upstream = detector.upstreamRef();
    auto state = detector.snapshot(fetchFirst);

    std::cout << "repository: " << cfg.repoPath.string() << "\n";
    std::cout << "branch:     " << (branch ? branch.value() : "(" + branch.error().message + ")") << "\n";
    std::cout << "upstream:   " << (upstream ? upstream.value() : "(unknown)") << "\n";
    if (state) {
        const RepositoryState& s = state.value();
        std::cout << "staged:     " << yesNo(s.hasStagedChanges) << "\n";
        std::cout << "dirty:      " << yesNo(s.isWorkingTreeDirty) << "\n";
        std::cout << "ahead:      " << s.commitsAhead << "\n";
        std::cout << "behind:     " << s.commitsBehind << "\n";
    }

    fs::path marker = cfg.resolvedLockPath();
    std::error_code ec;
    if (fs::exists(marker, ec)) {
        auto info = SyncLock::inspect(marker);
        if (info) {
            std::cout << "lock:       held by pid " << info.value().pid << " on " << info.value().host
                      << " since " << info.value().acquiredAt << "\n";
        } else {
            std::cout << "lock:       held (" << info.error().message << ")\n";
        }
    } else {
        std::cout << "lock:       free\n";
    }

    if (!state) return state.error();
    return {};
}

}
