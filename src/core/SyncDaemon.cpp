#include "core/SyncDaemon.hpp"

#include <utility>

#include "core/GitCliAdapter.hpp"
#include "core/IgnoreRules.hpp"
#include "core/SyncLock.hpp"
#include "util/Logger.hpp"
#include "util/Shutdown.hpp"

namespace fs = std::filesystem;

namespace gitsync {

SyncDaemon::SyncDaemon(SyncConfig config, ShutdownToken& token, std::unique_ptr<IVcsAdapter> vcs)
    : config_(std::move(config)), token_(token), vcs_(std::move(vcs)) {
    if (!vcs_) {
        vcs_ = std::make_unique<GitCliAdapter>(config_.repoPath, config_.gitExecutable, config_.networkTimeout);
    }
}

SyncDaemon::~SyncDaemon() = default;

Expected<void> SyncDaemon::prepare() {
    if (cycle_) return {};
    auto& log = Logger::instance();

    auto valid = config_.validate();
    if (!valid) return valid.error();

    std::error_code ec;
    if (!fs::is_directory(config_.repoPath, ec)) {
        return Error{ErrorCode::ConfigurationError, config_.repoPath.string() + " is not a directory"};
    }

    auto top = vcs_->topLevel();
    if (!top) {
        return Error{ErrorCode::ConfigurationError,
                     config_.repoPath.string() + " is not a git working copy (" + top.error().message + ")"};
    }
    fs::path root = top.value();

    // Lock defaults are relative to the top level, not to a subdirectory
    if (config_.repoPath != root) {
        log.debug("daemon", "using top level " + root.string() + " for " + config_.repoPath.string());
        config_.repoPath = root;
    }

    fs::path marker = config_.resolvedLockPath();
    auto dir = SyncLock::prepareDirectory(marker);
    if (!dir) {
        return Error{ErrorCode::ConfigurationError, "lock directory unusable: " + dir.error().message};
    }

    IgnoreRules ignore(*vcs_, root);
    bool markerDirIsRoot = marker.parent_path().lexically_normal() == root.lexically_normal();
    auto excluded = markerDirIsRoot ? ignore.ensureExcluded(marker, false)
                                    : ignore.ensureExcluded(marker.parent_path(), true);
    if (!excluded) {
        return Error{ErrorCode::ConfigurationError, "cannot exclude lock marker from staging: " + excluded.error().message};
    }
    if (config_.installDefaultIgnores) {
        auto added = ignore.installDefaults();
        if (!added) {
            return Error{ErrorCode::ConfigurationError, "cannot install default ignore patterns: " + added.error().message};
        }
    }

    cycle_ = std::make_unique<SyncCycle>(*vcs_, config_, token_);
    log.info("daemon", "synchronizing " + root.string() + " with " + config_.remoteName +
             (config_.upstreamBranch.empty() ? std::string() : "/" + config_.upstreamBranch) +
             " every " + std::to_string(config_.pollInterval.count()) + "s, lock " + marker.string());
    return {};
}

Expected<size_t> SyncDaemon::run() {
    auto ready = prepare();
    if (!ready) return ready.error();

    size_t cycles = 0;
    const auto interval = std::chrono::duration_cast<std::chrono::milliseconds>(config_.pollInterval);

    // First cycle runs immediately
    while (true) {
        last_ = cycle_->runCycle();
        ++cycles;

        if (config_.maxCycles > 0 && cycles >= config_.maxCycles) break;
        if (token_.stopRequested()) break;

        if (!cycle_->sleepUntilNext(interval)) {
            if (token_.stopRequested()) break;
            Logger::instance().info("daemon", "early cycle requested");
        }
        if (token_.stopRequested()) break;
    }

    if (token_.stopRequested()) {
        Logger::instance().info("daemon", "shutdown requested, stopped after " + std::to_string(cycles) + " cycle(s)");
    }
    return cycles;
}

}
