#include "core/SyncCycle.hpp"

#include <exception>

#include "util/Logger.hpp"
#include "util/Shutdown.hpp"

namespace gitsync {

const char* cycleStateName(CycleState state) {
    switch (state) {
        case CycleState::Idle: return "Idle";
        case CycleState::Locking: return "Locking";
        case CycleState::Uploading: return "Uploading";
        case CycleState::Downloading: return "Downloading";
        case CycleState::Unlocking: return "Unlocking";
        case CycleState::Sleeping: return "Sleeping";
    }
    return "Unknown";
}

namespace {

// Expected, self-healing conditions are warnings; anything that needs a
// person or points at a bug is an error.
void logFailure(const std::string& component, const Error& err) {
    auto& log = Logger::instance();
    switch (err.code) {
        case ErrorCode::NetworkError:
        case ErrorCode::RejectedError:
        case ErrorCode::LockTimeout:
        case ErrorCode::Cancelled:
            log.warn(component, err.describe());
            break;
        default:
            log.error(component, err.describe());
            break;
    }
}

}

SyncCycle::SyncCycle(IVcsAdapter& vcs, const SyncConfig& config, ShutdownToken& token)
    : token_(token),
      lock_(config.resolvedLockPath(), config.lockPollInterval,
            std::chrono::duration_cast<std::chrono::milliseconds>(config.lockMaxWait)),
      detector_(vcs, config.remoteName, config.upstreamBranch),
      upload_(vcs, detector_, config.commitContext),
      download_(vcs, detector_) {}

void SyncCycle::transition(CycleState next) {
    Logger::instance().debug("cycle", std::string(cycleStateName(state_)) + " -> " + cycleStateName(next));
    state_ = next;
    if (listener_) listener_(next);
}

void SyncCycle::runUpload(CycleReport& report) {
    report.uploadAttempted = true;
    auto res = upload_.run();
    if (!res) {
        report.uploadError = res.error();
        logFailure("upload", res.error());
        return;
    }
    report.upload = res.value();
}

void SyncCycle::runDownload(CycleReport& report) {
    auto div = detector_.remoteDivergence();
    if (!div) {
        report.downloadSkipped = true;
        report.downloadError = div.error();
        logFailure("download", div.error());
        Logger::instance().warn("download", "skipping download for this cycle");
        return;
    }

    report.downloadAttempted = true;
    auto res = download_.run(div.value());
    if (!res) {
        report.downloadError = res.error();
        logFailure("download", res.error());
        return;
    }
    report.download = res.value();
}

CycleReport SyncCycle::runCycle() {
    CycleReport report;
    const auto started = std::chrono::steady_clock::now();
    ++cycleNumber_;
    Logger::instance().debug("cycle", "cycle " + std::to_string(cycleNumber_) + " starting");

    transition(CycleState::Locking);
    try {
        auto acquired = lock_.acquire(token_);
        if (!acquired) {
            report.cycleError = acquired.error();
            logFailure("lock", acquired.error());
        } else {
            LockHandle handle = std::move(acquired.value());
            report.lockAcquired = true;

            try {
                transition(CycleState::Uploading);
                runUpload(report);
                transition(CycleState::Downloading);
                runDownload(report);
            } catch (const std::exception& e) {
                report.cycleError = Error{ErrorCode::InternalError,
                                          std::string("unexpected failure while ") + cycleStateName(state_) + ": " + e.what()};
                Logger::instance().error("cycle", report.cycleError.describe());
            }

            transition(CycleState::Unlocking);
            auto released = handle.release();
            if (!released) {
                logFailure("lock", released.error());
                if (report.cycleError.code == ErrorCode::None) report.cycleError = released.error();
            }
        }
    } catch (const std::exception& e) {
        report.cycleError = Error{ErrorCode::InternalError, std::string("unexpected failure while locking: ") + e.what()};
        Logger::instance().error("cycle", report.cycleError.describe());
    }
    if (state_ != CycleState::Unlocking) transition(CycleState::Unlocking);

    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    logReport(report);
    transition(CycleState::Idle);
    return report;
}

bool SyncCycle::sleepUntilNext(std::chrono::milliseconds interval) {
    transition(CycleState::Sleeping);
    bool full = token_.sleepFor(interval);
    transition(CycleState::Idle);
    return full;
}

void SyncCycle::logReport(const CycleReport& report) const {
    std::string up = report.uploadError.code != ErrorCode::None ? errorCodeName(report.uploadError.code)
                   : report.uploadAttempted ? uploadOutcomeName(report.upload.outcome)
                   : "not run";
    std::string down = report.downloadError.code != ErrorCode::None ? errorCodeName(report.downloadError.code)
                     : report.downloadAttempted ? downloadOutcomeName(report.download.outcome)
                     : "not run";
    std::string line = "cycle " + std::to_string(cycleNumber_) + " finished in " +
                       std::to_string(report.elapsed.count()) + " ms: upload=" + up + " download=" + down;
    if (report.ok()) {
        if (report.upload.outcome == UploadOutcome::NoOp && report.download.outcome == DownloadOutcome::NoOp) {
            Logger::instance().debug("cycle", line);
        } else {
            Logger::instance().info("cycle", line);
        }
    } else {
        Logger::instance().warn("cycle", line);
    }
}

}
