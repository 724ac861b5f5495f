#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "core/IVcsAdapter.hpp"
#include "util/Expected.hpp"

namespace gitsync {

/**
 * @brief Keeps daemon-owned files out of "stage all"
 *
 * Rules are written to the repository-local exclude file (info/exclude in
 * the VCS metadata directory), which is honoured like .gitignore but never
 * committed. Existing rules in .gitignore and info/exclude are checked
 * first so nothing is duplicated.
 */
class IgnoreRules {
public:
    IgnoreRules(IVcsAdapter& vcs, std::filesystem::path root);

    /**
     * @brief Exclude a path below the repository root
     * @param path Absolute path; paths outside the root are left alone
     * @param isDir Write a directory rule ("/dir/") instead of a file rule
     * @return true when a rule was appended, false when already covered
     */
    Expected<bool> ensureExcluded(const std::filesystem::path& path, bool isDir);

    /// Append the stock temp-file patterns that are not present yet
    Expected<size_t> installDefaults();

    /// Editor swap files, OS metadata, partial downloads
    static const std::vector<std::string>& defaultPatterns();

    /// Rules from .gitignore followed by info/exclude
    Expected<std::vector<std::string>> currentRules();

private:
    Expected<void> appendRules(const std::vector<std::string>& rules);

    IVcsAdapter& vcs_;
    std::filesystem::path root_;
};

}
