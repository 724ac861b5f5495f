#pragma once

#include <chrono>

/**
 * @brief Fixed values shared by the sync engine
 *
 * The commit marker is a contract with the remote CI trigger filter; changing
 * it re-enables validation runs for automated commits.
 */
namespace gitsync {

namespace Constants {
    // Commit message convention
    constexpr const char* COMMIT_PREFIX = "[gitsync]";
    constexpr const char* COMMIT_SUMMARY = "Automatic sync of working copy";
    constexpr const char* LOOP_MARKER = "[skip ci]";

    // Lock marker, relative to the repository root
    constexpr const char* LOCK_DIR_NAME = ".gitsync";
    constexpr const char* LOCK_FILE_NAME = "sync.lock";

    constexpr const char* STASH_LABEL_PREFIX = "gitsync-autostash";

    constexpr const char* DEFAULT_REMOTE = "origin";

    constexpr std::chrono::seconds DEFAULT_POLL_INTERVAL{30};
    constexpr std::chrono::milliseconds DEFAULT_LOCK_POLL{1000};

    // Exit statuses of the executable
    constexpr int EXIT_CONFIG_ERROR = 2;
    constexpr int EXIT_FORCED = 130;
}
}
