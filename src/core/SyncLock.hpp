#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include "util/Expected.hpp"

namespace gitsync {

class ShutdownToken;

/// Holder details written into the marker file
struct LockInfo {
    long pid{0};
    std::string host;
    std::string acquiredAt;   // ISO-8601 local time
};

/**
 * @brief Scoped ownership of the lock marker
 *
 * Move-only. The destructor releases, so every exit path from the critical
 * section removes the marker.
 */
class LockHandle {
public:
    LockHandle() = default;
    explicit LockHandle(std::filesystem::path markerPath);
    ~LockHandle();

    LockHandle(const LockHandle&) = delete;
    LockHandle& operator=(const LockHandle&) = delete;
    LockHandle(LockHandle&& other) noexcept;
    LockHandle& operator=(LockHandle&& other) noexcept;

    bool held() const { return !path_.empty(); }
    const std::filesystem::path& path() const { return path_; }

    /// Remove the marker; safe to call more than once
    Expected<void> release();

private:
    std::filesystem::path path_{};
};

/**
 * @brief Mutual exclusion over one working copy via a marker file
 *
 * The marker is created with O_CREAT|O_EXCL, which is atomic across
 * processes on a local filesystem. There is no stale-lock expiry: a marker
 * left by a crashed process blocks every later cycle until an operator
 * removes it (`gitsync unlock --force`). Two cycles running at once is
 * worse than a stalled sync.
 */
class SyncLock {
public:
    /**
     * @param markerPath File whose existence means "a cycle is running"
     * @param pollInterval Delay between attempts while the marker exists
     * @param maxWait Give up with LockTimeout after this long; zero waits forever
     */
    SyncLock(std::filesystem::path markerPath,
             std::chrono::milliseconds pollInterval,
             std::chrono::milliseconds maxWait = std::chrono::milliseconds(0));

    /**
     * @brief Block until the marker can be created, then create it
     *
     * Checks the token between polls and returns Cancelled when a stop was
     * requested. Creates the marker directory if needed (IoError if that
     * fails).
     */
    Expected<LockHandle> acquire(ShutdownToken& token) const;

    /// Single attempt; returns a handle that is not held when busy
    Expected<LockHandle> tryAcquire() const;

    /// Release through the handle (same as letting it go out of scope)
    static Expected<void> release(LockHandle& handle);

    /// Read holder details of an existing marker
    static Expected<LockInfo> inspect(const std::filesystem::path& markerPath);

    /// Operator recovery: delete a marker regardless of holder
    static Expected<void> forceRemove(const std::filesystem::path& markerPath);

    /// Make sure the directory for the marker exists
    static Expected<void> prepareDirectory(const std::filesystem::path& markerPath);

    const std::filesystem::path& markerPath() const { return path_; }

private:
    std::filesystem::path path_;
    std::chrono::milliseconds poll_;
    std::chrono::milliseconds maxWait_;
};

}
