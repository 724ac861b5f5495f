#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "util/Expected.hpp"

namespace gitsync {

/// Outcome of a finished child process
struct ProcessResult {
    int exitCode{-1};       // WEXITSTATUS, or 128 + signal number
    std::string output;     // stdout and stderr interleaved
    bool timedOut{false};
};

struct ProcessOptions {
    std::filesystem::path workingDir{};
    /// Extra NAME=VALUE pairs layered over the parent environment
    std::vector<std::pair<std::string, std::string>> env{};
    /// Zero means wait forever
    std::chrono::milliseconds timeout{0};
};

/**
 * @brief Run a program to completion and capture its output
 *
 * The child is started with fork/execvp in its own process group, so a
 * terminal Ctrl-C aimed at the daemon does not tear down an in-flight git
 * call. On timeout the whole group gets SIGTERM, then SIGKILL.
 *
 * @param argv Program and arguments; argv[0] is looked up in PATH
 * @return ProcessResult, or IoError when the process could not be started
 */
Expected<ProcessResult> runProcess(const std::vector<std::string>& argv, const ProcessOptions& opts = {});

}
