#include "util/Shutdown.hpp"

#include <csignal>
#include <cstring>
#include <thread>
#include <unistd.h>

#include "core/Constants.hpp"

namespace gitsync {

namespace {

constexpr size_t kMaxLockPath = 4096;

// Written outside signal context, read by the handler; a leading NUL means
// no lock is held.
char heldLockPath[kMaxLockPath] = {0};
volatile sig_atomic_t heldLockValid = 0;
volatile sig_atomic_t stopSignals = 0;

void forcedExit() {
    if (heldLockValid && heldLockPath[0] != '\0') {
        ::unlink(heldLockPath);
    }
    static const char msg[] = "gitsync: forced shutdown\n";
    ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
    (void)ignored;
    ::_exit(Constants::EXIT_FORCED);
}

void onSignal(int sig) {
    if (sig == SIGUSR1) {
        ShutdownToken::global().requestWake();
        return;
    }
    if (sig == SIGQUIT) {
        forcedExit();
    }
    stopSignals = stopSignals + 1;
    if (stopSignals > 1) {
        forcedExit();
    }
    ShutdownToken::global().requestStop();
}

}

ShutdownToken& ShutdownToken::global() {
    static ShutdownToken token;
    return token;
}

bool ShutdownToken::sleepFor(std::chrono::milliseconds total) {
    constexpr auto slice = std::chrono::milliseconds(100);
    auto deadline = std::chrono::steady_clock::now() + total;
    while (true) {
        if (stopRequested() || consumeWake()) return false;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) return true;
        std::this_thread::sleep_for(left < slice ? left : slice);
    }
}

void installSignalHandlers() {
    // Construct the static before any handler can run
    ShutdownToken::global();
    struct sigaction sa{};
    sa.sa_handler = onSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGQUIT, &sa, nullptr);
    sigaction(SIGUSR1, &sa, nullptr);
    std::signal(SIGPIPE, SIG_IGN);
}

void registerHeldLockPath(const char* path) {
    heldLockValid = 0;
    if (path == nullptr || std::strlen(path) >= kMaxLockPath) {
        heldLockPath[0] = '\0';
        return;
    }
    std::strncpy(heldLockPath, path, kMaxLockPath - 1);
    heldLockPath[kMaxLockPath - 1] = '\0';
    heldLockValid = 1;
}

}
