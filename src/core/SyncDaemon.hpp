#pragma once

#include <memory>

#include "core/IVcsAdapter.hpp"
#include "core/SyncConfig.hpp"
#include "core/SyncCycle.hpp"
#include "util/Expected.hpp"

namespace gitsync {

class ShutdownToken;

/**
 * @brief Process lifecycle around the sync loop
 *
 * prepare() fails fast with ConfigurationError when the path is not a
 * working copy or the lock directory cannot be created. run() performs the
 * first cycle immediately, then sleeps the configured interval between
 * cycles until a stop is requested or maxCycles is reached. A stop never
 * interrupts a cycle; it is checked between Sleeping and the next Locking.
 */
class SyncDaemon {
public:
    /**
     * @param config Startup configuration
     * @param token Stop/wake flags, normally ShutdownToken::global()
     * @param vcs Adapter to use; nullptr builds a GitCliAdapter from config
     */
    SyncDaemon(SyncConfig config, ShutdownToken& token, std::unique_ptr<IVcsAdapter> vcs = nullptr);
    ~SyncDaemon();

    SyncDaemon(const SyncDaemon&) = delete;
    SyncDaemon& operator=(const SyncDaemon&) = delete;

    /// Validate repository and lock location; idempotent
    Expected<void> prepare();

    /// Run cycles until stopped; returns the number of cycles run
    Expected<size_t> run();

    /// Report of the most recent cycle
    const CycleReport& lastReport() const { return last_; }

    const SyncConfig& config() const { return config_; }

private:
    SyncConfig config_;
    ShutdownToken& token_;
    std::unique_ptr<IVcsAdapter> vcs_;
    std::unique_ptr<SyncCycle> cycle_;
    CycleReport last_{};
};

}
