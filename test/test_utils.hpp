#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace gitsync::test {

/**
 * @brief Test utilities for gitsync tests
 *
 * Temporary directories and files, plus helpers that drive the real git
 * client to build a bare "remote" and working-copy clones of it.
 */
namespace utils {

/**
 * @brief Create a temporary directory for testing
 * @return Path to temporary directory
 */
std::filesystem::path createTempDir();

/**
 * @brief Remove a directory and all its contents
 * @param dir Directory to remove
 */
void removeDir(const std::filesystem::path& dir);

/**
 * @brief Create a file with content in the given directory
 * @param baseDir Base directory
 * @param filename File name, may contain subdirectories
 * @param content File content
 * @return Full path to created file
 */
std::filesystem::path createFile(
    const std::filesystem::path& baseDir,
    const std::string& filename,
    const std::string& content = ""
);

/**
 * @brief Read file content
 * @param filePath Path to file
 * @return File content as string, empty if missing
 */
std::string readFile(const std::filesystem::path& filePath);

/// Result of a git invocation made by a test
struct GitRun {
    int exitCode{-1};
    std::string output;
};

/**
 * @brief Run git in a directory
 * @param dir Directory passed to `git -C`
 * @param args Arguments after `-C <dir>`
 */
GitRun runGit(const std::filesystem::path& dir, const std::vector<std::string>& args);

/// Run git and return its output without the trailing newline
std::string gitOutput(const std::filesystem::path& dir, const std::vector<std::string>& args);

/**
 * @brief Create a bare repository with one commit on main
 * @param baseDir Directory to create it in
 * @return Path to the bare repository
 */
std::filesystem::path createRemote(const std::filesystem::path& baseDir, const std::string& name = "remote.git");

/**
 * @brief Clone a remote and set a local committer identity
 * @return Path to the working copy
 */
std::filesystem::path cloneRemote(const std::filesystem::path& remote,
                                  const std::filesystem::path& baseDir,
                                  const std::string& name);

/**
 * @brief Write a file, commit it and optionally push it
 * @return Commit id of the new HEAD
 */
std::string commitFile(const std::filesystem::path& repo,
                       const std::string& filename,
                       const std::string& content,
                       const std::string& message,
                       bool push = false);

/// Commit id of a ref in a repository
std::string revParse(const std::filesystem::path& repo, const std::string& ref);

/// Subject line of the newest commit on a ref
std::string lastSubject(const std::filesystem::path& repo, const std::string& ref = "HEAD");

/// Number of entries in the stash list
size_t stashCount(const std::filesystem::path& repo);

/**
 * @brief Get current working directory
 * @return Current working directory path
 */
std::filesystem::path getCwd();

/**
 * @brief Set working directory
 * @param dir Directory to change to
 */
void setCwd(const std::filesystem::path& dir);

} // namespace utils

} // namespace gitsync::test
