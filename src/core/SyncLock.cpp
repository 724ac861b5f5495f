#include "core/SyncLock.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <unistd.h>
#include <utility>

#include "util/Logger.hpp"
#include "util/Shutdown.hpp"

namespace fs = std::filesystem;

namespace gitsync {

namespace {

std::string hostName() {
    char buf[256] = {0};
    if (::gethostname(buf, sizeof(buf) - 1) != 0) return "unknown";
    return buf;
}

std::string nowIso() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return os.str();
}

std::string describeHolder(const fs::path& marker) {
    auto info = SyncLock::inspect(marker);
    if (!info) return "unknown holder";
    return "pid " + std::to_string(info.value().pid) + " on " + info.value().host +
           " since " + info.value().acquiredAt;
}

}

LockHandle::LockHandle(fs::path markerPath) : path_(std::move(markerPath)) {}

LockHandle::~LockHandle() {
    auto res = release();
    if (!res) {
        Logger::instance().error("lock", res.error().message);
    }
}

LockHandle::LockHandle(LockHandle&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}

LockHandle& LockHandle::operator=(LockHandle&& other) noexcept {
    if (this != &other) {
        auto res = release();
        if (!res) Logger::instance().error("lock", res.error().message);
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

Expected<void> LockHandle::release() {
    if (path_.empty()) return {};
    fs::path p = std::move(path_);
    path_.clear();
    registerHeldLockPath(nullptr);

    std::error_code ec;
    bool removed = fs::remove(p, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "failed to remove lock marker " + p.string() + ": " + ec.message()};
    }
    if (!removed) {
        Logger::instance().warn("lock", "marker " + p.string() + " was already gone at release");
    } else {
        Logger::instance().debug("lock", "released " + p.string());
    }
    return {};
}

SyncLock::SyncLock(fs::path markerPath, std::chrono::milliseconds pollInterval, std::chrono::milliseconds maxWait)
    : path_(std::move(markerPath)), poll_(pollInterval), maxWait_(maxWait) {}

Expected<void> SyncLock::prepareDirectory(const fs::path& markerPath) {
    fs::path dir = markerPath.parent_path();
    if (dir.empty()) return {};
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "cannot create lock directory " + dir.string() + ": " + ec.message()};
    }
    if (!fs::is_directory(dir, ec)) {
        return Error{ErrorCode::IoError, "lock directory is not a directory: " + dir.string()};
    }
    return {};
}

Expected<LockHandle> SyncLock::tryAcquire() const {
    auto dirRes = prepareDirectory(path_);
    if (!dirRes) return dirRes.error();

    int fd = ::open(path_.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
    if (fd < 0) {
        if (errno == EEXIST) return LockHandle();
        return Error{ErrorCode::IoError, "cannot create lock marker " + path_.string() + ": " + std::strerror(errno)};
    }

    std::ostringstream body;
    body << "pid=" << ::getpid() << "\n"
         << "host=" << hostName() << "\n"
         << "acquired=" << nowIso() << "\n";
    const std::string text = body.str();
    ssize_t written = ::write(fd, text.data(), text.size());
    int writeErr = errno;
    ::close(fd);
    if (written != static_cast<ssize_t>(text.size())) {
        ::unlink(path_.c_str());
        return Error{ErrorCode::IoError, "cannot write lock marker " + path_.string() + ": " + std::strerror(writeErr)};
    }

    registerHeldLockPath(path_.c_str());
    Logger::instance().debug("lock", "acquired " + path_.string());
    return LockHandle(path_);
}

Expected<LockHandle> SyncLock::acquire(ShutdownToken& token) const {
    const auto start = std::chrono::steady_clock::now();
    bool announced = false;

    while (true) {
        auto attempt = tryAcquire();
        if (!attempt) return attempt.error();
        if (attempt.value().held()) return std::move(attempt.value());

        if (!announced) {
            Logger::instance().info("lock", "waiting for " + path_.string() + " (held by " + describeHolder(path_) + ")");
            announced = true;
        }

        // Poll in slices so a stop request is noticed quickly
        auto pollEnd = std::chrono::steady_clock::now() + poll_;
        while (std::chrono::steady_clock::now() < pollEnd) {
            if (token.stopRequested()) {
                return Error{ErrorCode::Cancelled, "shutdown requested while waiting for the lock"};
            }
            if (maxWait_.count() > 0 && std::chrono::steady_clock::now() - start >= maxWait_) {
                return Error{ErrorCode::LockTimeout, "lock " + path_.string() + " still held after " +
                             std::to_string(maxWait_.count()) + " ms (" + describeHolder(path_) + ")"};
            }
            std::this_thread::sleep_for(std::min(poll_, std::chrono::milliseconds(50)));
        }
    }
}

Expected<void> SyncLock::release(LockHandle& handle) {
    return handle.release();
}

Expected<LockInfo> SyncLock::inspect(const fs::path& markerPath) {
    std::ifstream in(markerPath);
    if (!in) {
        return Error{ErrorCode::IoError, "no lock marker at " + markerPath.string()};
    }
    LockInfo info;
    std::string line;
    while (std::getline(in, line)) {
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = line.substr(0, eq);
        std::string value = line.substr(eq + 1);
        if (key == "pid") {
            try {
                info.pid = std::stol(value);
            } catch (const std::exception&) {
                info.pid = 0;
            }
        } else if (key == "host") {
            info.host = value;
        } else if (key == "acquired") {
            info.acquiredAt = value;
        }
    }
    return info;
}

Expected<void> SyncLock::forceRemove(const fs::path& markerPath) {
    std::error_code ec;
    if (!fs::exists(markerPath, ec)) {
        return Error{ErrorCode::IoError, "no lock marker at " + markerPath.string()};
    }
    fs::remove(markerPath, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "failed to remove " + markerPath.string() + ": " + ec.message()};
    }
    Logger::instance().warn("lock", "marker " + markerPath.string() + " removed by operator");
    return {};
}

}
