#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "core/IVcsAdapter.hpp"
#include "util/Process.hpp"

namespace gitsync {

/**
 * @brief IVcsAdapter backed by the git command-line client
 *
 * Every call runs `git -C <root> ...` with LC_ALL=C so failure messages can
 * be classified, and GIT_TERMINAL_PROMPT=0 so a missing credential fails
 * instead of waiting on a prompt nobody will answer. fetch and push honour
 * the optional network timeout.
 */
class GitCliAdapter : public IVcsAdapter {
public:
    explicit GitCliAdapter(std::filesystem::path root,
                           std::string gitExecutable = "git",
                           std::chrono::seconds networkTimeout = std::chrono::seconds(0));

    Expected<std::filesystem::path> topLevel() override;
    Expected<std::filesystem::path> metadataPath(const std::string& name) override;
    Expected<void> stageAll() override;
    Expected<bool> hasStagedChanges() override;
    Expected<bool> isWorkingTreeDirty() override;
    Expected<void> commit(const std::string& message) override;
    Expected<std::string> currentBranch() override;
    Expected<std::string> headCommit() override;
    Expected<void> push(const std::string& remote, const std::string& localBranch,
                        const std::string& remoteBranch) override;
    Expected<void> fetch(const std::string& remote) override;
    Expected<bool> refExists(const std::string& ref) override;
    Expected<Divergence> aheadBehind(const std::string& ref) override;
    Expected<size_t> countCommits(const std::string& ref) override;
    Expected<void> fastForward(const std::string& ref) override;
    Expected<StashRecord> stashPush(const std::string& label) override;
    Expected<void> stashApply(const StashRecord& record) override;
    Expected<void> stashDrop(const StashRecord& record) override;

    const std::filesystem::path& root() const { return root_; }

private:
    Expected<ProcessResult> git(const std::vector<std::string>& args, bool network = false);
    /// stash@{n} selector for a stash commit, IoError when it is gone
    Expected<std::string> stashSelector(const std::string& commitId);

    std::filesystem::path root_;
    std::string gitExe_;
    std::chrono::seconds networkTimeout_;
};

}
