#pragma once

#include <chrono>
#include <functional>
#include <utility>

#include "core/ChangeDetector.hpp"
#include "core/DownloadFlow.hpp"
#include "core/IVcsAdapter.hpp"
#include "core/SyncConfig.hpp"
#include "core/SyncLock.hpp"
#include "core/UploadFlow.hpp"
#include "util/Expected.hpp"

namespace gitsync {

class ShutdownToken;

/**
 * @brief Orchestrator states
 *
 *   Idle -> Locking -> Uploading -> Downloading -> Unlocking -> Sleeping -> Idle
 *
 * Locking, Uploading and Downloading may jump straight to Unlocking on error.
 */
enum class CycleState { Idle, Locking, Uploading, Downloading, Unlocking, Sleeping };

const char* cycleStateName(CycleState state);

/// What one cycle did; an Error with code None means "no error"
struct CycleReport {
    bool lockAcquired{false};

    bool uploadAttempted{false};
    UploadResult upload{};
    Error uploadError{};

    bool downloadAttempted{false};
    bool downloadSkipped{false};     // fetch failed, integration not tried
    DownloadResult download{};
    Error downloadError{};

    Error cycleError{};              // lock failures and unexpected exceptions
    std::chrono::milliseconds elapsed{0};

    bool ok() const {
        return uploadError.code == ErrorCode::None && downloadError.code == ErrorCode::None &&
               cycleError.code == ErrorCode::None;
    }
};

/**
 * @brief One lock-guarded upload + download pass over a working copy
 *
 * Upload and download are independent: a failed upload does not stop the
 * download in the same cycle. Every error, including exceptions thrown by
 * the adapter, is caught here and reported; the lock is released on every
 * path.
 */
class SyncCycle {
public:
    using StateListener = std::function<void(CycleState)>;

    SyncCycle(IVcsAdapter& vcs, const SyncConfig& config, ShutdownToken& token);

    CycleReport runCycle();

    /**
     * @brief Sleeping state between cycles
     * @return false when cut short by a stop or wake-up request
     */
    bool sleepUntilNext(std::chrono::milliseconds interval);

    CycleState state() const { return state_; }

    /// Observe every transition, e.g. for tests or status reporting
    void setStateListener(StateListener listener) { listener_ = std::move(listener); }

    ChangeDetector& detector() { return detector_; }

private:
    void transition(CycleState next);
    void runUpload(CycleReport& report);
    void runDownload(CycleReport& report);
    void logReport(const CycleReport& report) const;

    ShutdownToken& token_;
    SyncLock lock_;
    ChangeDetector detector_;
    UploadFlow upload_;
    DownloadFlow download_;
    CycleState state_{CycleState::Idle};
    StateListener listener_{};
    unsigned long cycleNumber_{0};
};

}
