#pragma once

#include <atomic>
#include <chrono>

namespace gitsync {

/**
 * @brief Cooperative stop/wake flags shared by the loop and the lock poller
 *
 * The signal handlers installed by installSignalHandlers() drive the global
 * instance; tests create their own and flip the flags directly.
 */
class ShutdownToken {
public:
    /// Instance wired to the process signal handlers
    static ShutdownToken& global();

    void requestStop() { stop_.store(true, std::memory_order_release); }
    bool stopRequested() const { return stop_.load(std::memory_order_acquire); }

    /// Ask for an early cycle (SIGUSR1 from a file watcher)
    void requestWake() { wake_.store(true, std::memory_order_release); }
    bool consumeWake() { return wake_.exchange(false, std::memory_order_acq_rel); }

    void reset() {
        stop_.store(false);
        wake_.store(false);
    }

    /**
     * @brief Sleep in short slices until the duration passes, a stop is
     * requested, or a wake-up arrives
     * @return false when interrupted by stop or wake
     */
    bool sleepFor(std::chrono::milliseconds total);

private:
    std::atomic<bool> stop_{false};
    std::atomic<bool> wake_{false};
};

/**
 * @brief Install SIGINT/SIGTERM/SIGQUIT/SIGUSR1 handlers
 *
 * First SIGINT or SIGTERM: graceful, the in-flight cycle completes.
 * SIGQUIT or a repeated SIGINT/SIGTERM: forced, the held lock marker is
 * unlinked best-effort and the process exits with status 130.
 * SIGUSR1: run the next cycle now.
 */
void installSignalHandlers();

/// Path unlinked by the forced-exit handler; nullptr clears it
void registerHeldLockPath(const char* path);

}
