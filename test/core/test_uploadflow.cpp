#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "test_utils.hpp"
#include "core/ChangeDetector.hpp"
#include "core/GitCliAdapter.hpp"
#include "core/UploadFlow.hpp"

namespace fs = std::filesystem;

using namespace gitsync;
using namespace gitsync::test::utils;

class UploadFlowTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        remote = createRemote(tempDir);
        alice = cloneRemote(remote, tempDir, "alice");
        bob = cloneRemote(remote, tempDir, "bob");
    }

    void TearDown() override {
        removeDir(tempDir);
    }

    std::string remoteMain() { return revParse(remote, "refs/heads/main"); }

    fs::path tempDir;
    fs::path remote;
    fs::path alice;
    fs::path bob;
};

// Test: Commit message carries prefix and loop-prevention marker
TEST_F(UploadFlowTest, CommitMessageConvention) {
    std::string plain = UploadFlow::buildCommitMessage("");
    EXPECT_EQ(plain, "[gitsync] Automatic sync of working copy [skip ci]");

    std::string withContext = UploadFlow::buildCommitMessage("host: laptop");
    EXPECT_EQ(withContext.rfind(plain, 0), 0u);
    EXPECT_NE(withContext.find("\n\nhost: laptop"), std::string::npos);
}

// Test: Nothing changed means no commit and no push
TEST_F(UploadFlowTest, NoChangesIsNoOp) {
    std::string headBefore = revParse(alice, "HEAD");

    GitCliAdapter vcs(alice);
    ChangeDetector detector(vcs, "origin");
    UploadFlow upload(vcs, detector);
    auto res = upload.run();
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(res.value().outcome, UploadOutcome::NoOp);
    EXPECT_EQ(res.value().branch, "main");
    EXPECT_EQ(revParse(alice, "HEAD"), headBefore);
}

// Test: New file becomes exactly one pushed sync commit
TEST_F(UploadFlowTest, NewFileCommittedAndPushed) {
    createFile(alice, "todo.txt", "buy milk\n");

    GitCliAdapter vcs(alice);
    ChangeDetector detector(vcs, "origin");
    UploadFlow upload(vcs, detector);
    auto res = upload.run();
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(res.value().outcome, UploadOutcome::Committed);

    std::string head = revParse(alice, "HEAD");
    EXPECT_EQ(res.value().commitId, head);
    EXPECT_EQ(remoteMain(), head);
    EXPECT_EQ(gitOutput(alice, {"rev-list", "--count", "HEAD~1..HEAD"}), "1");
    EXPECT_NE(gitOutput(alice, {"show", "--name-only", "--format=", "HEAD"}).find("todo.txt"), std::string::npos);

    std::string subject = lastSubject(alice);
    EXPECT_NE(subject.find("[gitsync]"), std::string::npos);
    EXPECT_NE(subject.find("[skip ci]"), std::string::npos);

    auto div = detector.trackedDivergence();
    ASSERT_TRUE(div.has_value());
    EXPECT_EQ(div.value().ahead, 0u);
}

// Test: Running again without new edits creates nothing
TEST_F(UploadFlowTest, Idempotent) {
    createFile(alice, "todo.txt", "buy milk\n");

    GitCliAdapter vcs(alice);
    ChangeDetector detector(vcs, "origin");
    UploadFlow upload(vcs, detector);
    ASSERT_TRUE(upload.run().has_value());
    std::string afterFirst = revParse(alice, "HEAD");

    auto second = upload.run();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second.value().outcome, UploadOutcome::NoOp);
    EXPECT_EQ(revParse(alice, "HEAD"), afterFirst);
    EXPECT_EQ(remoteMain(), afterFirst);
}

// Test: Caller context lands in the commit body
TEST_F(UploadFlowTest, CommitContextInBody) {
    createFile(alice, "todo.txt", "buy milk\n");

    GitCliAdapter vcs(alice);
    ChangeDetector detector(vcs, "origin");
    UploadFlow upload(vcs, detector, "synced from alice");
    ASSERT_TRUE(upload.run().has_value());
    EXPECT_EQ(gitOutput(alice, {"log", "-1", "--format=%b"}), "synced from alice");
}

// Test: Remote moved ahead, push is rejected and the commit stays local
TEST_F(UploadFlowTest, PushRejectedKeepsCommit) {
    commitFile(bob, "b.txt", "from bob\n", "bob 1", true);
    std::string remoteBefore = remoteMain();
    createFile(alice, "a.txt", "from alice\n");

    GitCliAdapter vcs(alice);
    ChangeDetector detector(vcs, "origin");
    UploadFlow upload(vcs, detector);
    auto res = upload.run();
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::RejectedError);
    EXPECT_NE(res.error().message.find("kept locally"), std::string::npos);

    EXPECT_EQ(remoteMain(), remoteBefore);
    EXPECT_NE(lastSubject(alice).find("[gitsync]"), std::string::npos);
}

// Test: Unreachable remote is a NetworkError after the local commit
TEST_F(UploadFlowTest, PushNetworkError) {
    ASSERT_EQ(runGit(alice, {"remote", "set-url", "origin", (tempDir / "gone.git").string()}).exitCode, 0);
    createFile(alice, "a.txt", "offline edit\n");

    GitCliAdapter vcs(alice);
    ChangeDetector detector(vcs, "origin");
    UploadFlow upload(vcs, detector);
    auto res = upload.run();
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::NetworkError);
    EXPECT_NE(lastSubject(alice).find("[gitsync]"), std::string::npos);
}

// Test: Commits left by a failed push go out on the next run
TEST_F(UploadFlowTest, PendingCommitPushedWithoutNewCommit) {
    std::string local = commitFile(alice, "a.txt", "earlier\n", "earlier work");

    GitCliAdapter vcs(alice);
    ChangeDetector detector(vcs, "origin");
    UploadFlow upload(vcs, detector);
    auto res = upload.run();
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(res.value().outcome, UploadOutcome::PushedPending);
    EXPECT_EQ(revParse(alice, "HEAD"), local);
    EXPECT_EQ(remoteMain(), local);
}

// Test: Detached HEAD is refused before anything is committed
TEST_F(UploadFlowTest, DetachedHeadRefused) {
    ASSERT_EQ(runGit(alice, {"checkout", "-q", "--detach"}).exitCode, 0);
    std::string headBefore = revParse(alice, "HEAD");
    createFile(alice, "a.txt", "edit\n");

    GitCliAdapter vcs(alice);
    ChangeDetector detector(vcs, "origin");
    UploadFlow upload(vcs, detector);
    auto res = upload.run();
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::VcsFailure);
    EXPECT_EQ(revParse(alice, "HEAD"), headBefore);
}

// Test: Upstream branch name may differ from the local one
TEST_F(UploadFlowTest, PushesToConfiguredBranch) {
    createFile(alice, "a.txt", "edit\n");

    GitCliAdapter vcs(alice);
    ChangeDetector detector(vcs, "origin", "mirror");
    UploadFlow upload(vcs, detector);
    auto res = upload.run();
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(revParse(remote, "refs/heads/mirror"), revParse(alice, "HEAD"));
}
