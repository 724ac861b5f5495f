#pragma once

#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "core/IVcsAdapter.hpp"

namespace gitsync::test {

/**
 * @brief Scripted IVcsAdapter for failure injection
 *
 * Every primitive succeeds with a neutral answer unless a test overrides the
 * corresponding result. Calls are recorded by name in order.
 */
class FakeVcsAdapter : public IVcsAdapter {
public:
    explicit FakeVcsAdapter(std::filesystem::path root) : root_(std::move(root)) {}

    Expected<std::filesystem::path> topLevel() override { record("topLevel"); return root_; }
    Expected<std::filesystem::path> metadataPath(const std::string& name) override {
        record("metadataPath");
        return root_ / ".git" / name;
    }
    Expected<void> stageAll() override {
        record("stageAll");
        if (throwOnStage) throw std::runtime_error("index.lock exists");
        return stageResult;
    }
    Expected<bool> hasStagedChanges() override { record("hasStagedChanges"); return staged; }
    Expected<bool> isWorkingTreeDirty() override { record("isWorkingTreeDirty"); return dirty; }
    Expected<void> commit(const std::string&) override { record("commit"); return {}; }
    Expected<std::string> currentBranch() override { record("currentBranch"); return branch; }
    Expected<std::string> headCommit() override { record("headCommit"); return head; }
    Expected<void> push(const std::string&, const std::string&, const std::string&) override {
        record("push");
        return pushResult;
    }
    Expected<void> fetch(const std::string&) override { record("fetch"); return fetchResult; }
    Expected<bool> refExists(const std::string&) override { record("refExists"); return true; }
    Expected<Divergence> aheadBehind(const std::string&) override { record("aheadBehind"); return divergence; }
    Expected<size_t> countCommits(const std::string&) override { record("countCommits"); return size_t{1}; }
    Expected<void> fastForward(const std::string&) override {
        record("fastForward");
        if (fastForwardResult) divergence.behind = 0;
        return fastForwardResult;
    }
    Expected<StashRecord> stashPush(const std::string& label) override {
        record("stashPush");
        StashRecord rec;
        rec.label = label;
        rec.commitId = "5a5b";
        return rec;
    }
    Expected<void> stashApply(const StashRecord&) override { record("stashApply"); return {}; }
    Expected<void> stashDrop(const StashRecord&) override { record("stashDrop"); return {}; }

    bool called(const std::string& name) const {
        for (const auto& c : calls) {
            if (c == name) return true;
        }
        return false;
    }

    // Scripted answers
    bool throwOnStage{false};
    Expected<void> stageResult{};
    bool staged{false};
    bool dirty{false};
    std::string branch{"main"};
    std::string head{"c0ffee"};
    Expected<void> pushResult{};
    Expected<void> fetchResult{};
    Divergence divergence{};
    Expected<void> fastForwardResult{};

    std::vector<std::string> calls;

private:
    void record(const std::string& name) { calls.push_back(name); }

    std::filesystem::path root_;
};

}
