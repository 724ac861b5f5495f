#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

#include "test_utils.hpp"
#include "core/Constants.hpp"
#include "core/SyncLock.hpp"
#include "util/Shutdown.hpp"

namespace fs = std::filesystem;

using namespace gitsync;
using namespace gitsync::test::utils;
using namespace std::chrono_literals;

/**
 * @brief Signal handling in a forked child that holds the sync lock
 *
 * The child installs the real handlers, takes the lock and reports over a
 * pipe: 'r' once the lock is held, 's' once a stop was requested.
 */
class ShutdownSignalTest : public ::testing::Test {
protected:
    enum class Mode {
        ExitOnStop,   // release the lock and exit 0 after a graceful stop
        KeepRunning,  // ignore graceful stops so only a forced exit ends it
    };

    void SetUp() override {
        tempDir = createTempDir();
        marker = tempDir / ".gitsync" / "sync.lock";
    }

    void TearDown() override {
        if (child > 0) {
            ::kill(child, SIGKILL);
            ::waitpid(child, nullptr, 0);
        }
        if (readFd >= 0) ::close(readFd);
        removeDir(tempDir);
    }

    void spawnHolder(Mode mode) {
        int fds[2];
        ASSERT_EQ(::pipe(fds), 0);
        pid_t pid = ::fork();
        ASSERT_GE(pid, 0);
        if (pid == 0) {
            ::close(fds[0]);
            runHolder(mode, fds[1]);
        }
        ::close(fds[1]);
        child = pid;
        readFd = fds[0];
    }

    // Child side; never returns
    [[noreturn]] void runHolder(Mode mode, int out) {
        installSignalHandlers();
        ShutdownToken::global().reset();
        SyncLock lock(marker, 20ms);
        auto handle = lock.tryAcquire();
        if (!handle) ::_exit(3);
        char ready = 'r';
        if (::write(out, &ready, 1) != 1) ::_exit(4);

        bool reported = false;
        for (;;) {
            if (ShutdownToken::global().stopRequested() && !reported) {
                reported = true;
                char stopped = 's';
                if (::write(out, &stopped, 1) != 1) ::_exit(4);
                if (mode == Mode::ExitOnStop) {
                    std::error_code ec;
                    bool stillHeld = fs::exists(marker, ec);
                    auto released = SyncLock::release(handle.value());
                    ::_exit(stillHeld && released ? 0 : 5);
                }
            }
            ::usleep(10 * 1000);
        }
    }

    bool waitForByte(char expected, int timeoutMs = 5000) {
        pollfd pfd{readFd, POLLIN, 0};
        if (::poll(&pfd, 1, timeoutMs) <= 0) return false;
        char c = 0;
        if (::read(readFd, &c, 1) != 1) return false;
        return c == expected;
    }

    /// Exit status of the child, -1 if it did not exit normally in time
    int waitForExit(std::chrono::milliseconds limit = 5000ms) {
        auto deadline = std::chrono::steady_clock::now() + limit;
        while (std::chrono::steady_clock::now() < deadline) {
            int status = 0;
            pid_t r = ::waitpid(child, &status, WNOHANG);
            if (r == child) {
                child = -1;
                return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            }
            std::this_thread::sleep_for(10ms);
        }
        return -1;
    }

    fs::path tempDir;
    fs::path marker;
    pid_t child{-1};
    int readFd{-1};
};

// Test: One SIGTERM only requests a stop; the holder still owns the lock
TEST_F(ShutdownSignalTest, FirstTermIsGraceful) {
    spawnHolder(Mode::ExitOnStop);
    ASSERT_TRUE(waitForByte('r'));
    ASSERT_TRUE(fs::exists(marker));

    ASSERT_EQ(::kill(child, SIGTERM), 0);
    ASSERT_TRUE(waitForByte('s'));
    EXPECT_EQ(waitForExit(), 0);
    EXPECT_FALSE(fs::exists(marker));
}

// Test: A second SIGTERM forces exit 130 and unlinks the held marker
TEST_F(ShutdownSignalTest, SecondTermForcesExit) {
    spawnHolder(Mode::KeepRunning);
    ASSERT_TRUE(waitForByte('r'));
    ASSERT_TRUE(fs::exists(marker));

    ASSERT_EQ(::kill(child, SIGTERM), 0);
    ASSERT_TRUE(waitForByte('s'));
    EXPECT_TRUE(fs::exists(marker));

    ASSERT_EQ(::kill(child, SIGTERM), 0);
    EXPECT_EQ(waitForExit(), Constants::EXIT_FORCED);
    EXPECT_FALSE(fs::exists(marker));
}

// Test: SIGQUIT forces exit 130 and unlinks the held marker
TEST_F(ShutdownSignalTest, QuitForcesExit) {
    spawnHolder(Mode::KeepRunning);
    ASSERT_TRUE(waitForByte('r'));
    ASSERT_TRUE(fs::exists(marker));

    ASSERT_EQ(::kill(child, SIGQUIT), 0);
    EXPECT_EQ(waitForExit(), Constants::EXIT_FORCED);
    EXPECT_FALSE(fs::exists(marker));
}
