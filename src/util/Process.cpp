#include "util/Process.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace gitsync {

namespace {

std::vector<std::string> buildEnvironment(const std::vector<std::pair<std::string, std::string>>& overrides) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        bool replaced = false;
        for (const auto& kv : overrides) {
            if (entry.rfind(kv.first + "=", 0) == 0) {
                replaced = true;
                break;
            }
        }
        if (!replaced) env.push_back(std::move(entry));
    }
    for (const auto& kv : overrides) {
        env.push_back(kv.first + "=" + kv.second);
    }
    return env;
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// Escalate from SIGTERM to SIGKILL for the child's process group
int terminateGroup(pid_t pid) {
    ::kill(-pid, SIGTERM);
    int status = 0;
    for (int i = 0; i < 20; ++i) {
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) return decodeStatus(status);
        ::usleep(100 * 1000);
    }
    ::kill(-pid, SIGKILL);
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    return decodeStatus(status);
}

}

Expected<ProcessResult> runProcess(const std::vector<std::string>& argv, const ProcessOptions& opts) {
    if (argv.empty()) {
        return Error{ErrorCode::InvalidArgs, "runProcess: empty argv"};
    }

    // Everything the child touches is prepared before fork()
    std::vector<char*> args;
    for (const auto& s : argv) args.push_back(const_cast<char*>(s.c_str()));
    args.push_back(nullptr);

    std::vector<std::string> envStrings = buildEnvironment(opts.env);
    std::vector<char*> envp;
    for (auto& s : envStrings) envp.push_back(const_cast<char*>(s.c_str()));
    envp.push_back(nullptr);

    std::string cwd = opts.workingDir.string();

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return Error{ErrorCode::IoError, std::string("pipe failed: ") + std::strerror(errno)};
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        return Error{ErrorCode::IoError, std::string("fork failed: ") + std::strerror(err)};
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(fds[1], STDOUT_FILENO);
        ::dup2(fds[1], STDERR_FILENO);
        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
            static const char msg[] = "gitsync: cannot change to working directory\n";
            ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
            (void)ignored;
            ::_exit(127);
        }
        ::execvpe(args[0], args.data(), envp.data());
        static const char msg[] = "gitsync: exec failed\n";
        ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
        ::_exit(127);
    }

    // Parent side also sets the group to close the race with the child
    ::setpgid(pid, pid);
    ::close(fds[1]);

    ProcessResult result;
    const bool bounded = opts.timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + opts.timeout;
    char buf[4096];

    while (true) {
        int waitMs = -1;
        if (bounded) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) {
                result.timedOut = true;
                break;
            }
            waitMs = static_cast<int>(left.count());
        }
        pollfd pfd{fds[0], POLLIN, 0};
        int pr = ::poll(&pfd, 1, waitMs);
        if (pr < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (pr == 0) continue;
        ssize_t n = ::read(fds[0], buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) break;
        result.output.append(buf, static_cast<size_t>(n));
    }
    ::close(fds[0]);

    if (result.timedOut) {
        result.exitCode = terminateGroup(pid);
        return result;
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return Error{ErrorCode::IoError, std::string("waitpid failed: ") + std::strerror(errno)};
        }
    }
    result.exitCode = decodeStatus(status);
    return result;
}

}
