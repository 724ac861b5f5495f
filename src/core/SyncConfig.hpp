#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "core/Constants.hpp"
#include "util/Expected.hpp"

namespace gitsync {

/**
 * @brief Process configuration, resolved once at startup
 *
 * Every field has a default; command-line flags override them. Zero
 * durations and counts mean "unbounded".
 */
struct SyncConfig {
    std::filesystem::path repoPath{};                 // working copy, default cwd
    std::chrono::seconds pollInterval{Constants::DEFAULT_POLL_INTERVAL};
    std::string remoteName{Constants::DEFAULT_REMOTE};
    std::string upstreamBranch{};                     // empty: same name as local branch
    std::filesystem::path lockPath{};                 // empty: <repo>/.gitsync/sync.lock
    std::chrono::milliseconds lockPollInterval{Constants::DEFAULT_LOCK_POLL};
    std::chrono::seconds lockMaxWait{0};
    std::chrono::seconds networkTimeout{0};
    std::string commitContext{};                      // appended to automated commit messages
    size_t maxCycles{0};
    bool installDefaultIgnores{false};
    std::string gitExecutable{"git"};
    std::string logLevel{};                           // empty: GITSYNC_LOG or info
    std::filesystem::path logFile{};

    /**
     * @brief Build a configuration from command-line flags
     *
     * Recognized flags:
     *   --repo <path>  --interval <sec>  --remote <name>  --branch <name>
     *   --lock-path <path>  --lock-timeout <sec>  --network-timeout <sec>
     *   --message <text>  --max-cycles <n>  --default-ignores
     *   --git <exe>  --log-level <lvl>  --log-file <path>
     *
     * @return Filled config or InvalidArgs naming the offending flag
     */
    static Expected<SyncConfig> fromArgs(const std::vector<std::string>& args);

    /// Lock marker location with defaults applied, absolute when repoPath is
    std::filesystem::path resolvedLockPath() const;

    /// Check field ranges; ConfigurationError on failure
    Expected<void> validate() const;

    /// Help text for the shared flags, one pair per flag
    static std::vector<std::pair<std::string, std::string>> flagHelp();
};

}
