#include <gtest/gtest.h>
#include <filesystem>
#include <regex>
#include <string>
#include <vector>
#include "test_utils.hpp"
#include "util/PatternMatcher.hpp"

namespace fs = std::filesystem;

using namespace gitsync;
using namespace gitsync::test::utils;

class PatternMatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
    }

    void TearDown() override {
        removeDir(tempDir);
    }

    fs::path tempDir;
};

// Test: Convert glob to regex
TEST_F(PatternMatcherTest, GlobToRegex) {
    std::regex regex1 = PatternMatcher::globToRegex("*.txt");
    EXPECT_TRUE(std::regex_match("file.txt", regex1));
    EXPECT_TRUE(std::regex_match(".txt", regex1));
    EXPECT_FALSE(std::regex_match("file.cpp", regex1));
    EXPECT_FALSE(std::regex_match("dir/file.txt", regex1)); // '*' stops at '/'

    // Question mark pattern
    std::regex regex2 = PatternMatcher::globToRegex("file?.txt");
    EXPECT_TRUE(std::regex_match("file1.txt", regex2));
    EXPECT_FALSE(std::regex_match("file10.txt", regex2)); // Too long

    // Double star crosses directories
    std::regex regex3 = PatternMatcher::globToRegex("logs/**");
    EXPECT_TRUE(std::regex_match("logs/a/b/c.log", regex3));

    std::regex regex4 = PatternMatcher::globToRegex("**/build");
    EXPECT_TRUE(std::regex_match("build", regex4));
    EXPECT_TRUE(std::regex_match("a/b/build", regex4));
}

// Test: Character classes, including negated ones
TEST_F(PatternMatcherTest, CharacterClasses) {
    std::regex cls = PatternMatcher::globToRegex("v[0-9].txt");
    EXPECT_TRUE(std::regex_match("v3.txt", cls));
    EXPECT_FALSE(std::regex_match("vx.txt", cls));

    std::regex neg = PatternMatcher::globToRegex("v[!0-9].txt");
    EXPECT_TRUE(std::regex_match("vx.txt", neg));
    EXPECT_FALSE(std::regex_match("v3.txt", neg));
}

// Test: Regex metacharacters in a glob are literal
TEST_F(PatternMatcherTest, MetacharactersAreLiteral) {
    std::regex re = PatternMatcher::globToRegex("a+b(1).txt");
    EXPECT_TRUE(std::regex_match("a+b(1).txt", re));
    EXPECT_FALSE(std::regex_match("aab1.txt", re));
}

// Test: Classes git accepts but std::regex rejects match nothing
TEST_F(PatternMatcherTest, UncompilableClassNeverMatches) {
    EXPECT_THROW(PatternMatcher::globToRegex("[z-a]"), std::regex_error);
    EXPECT_FALSE(PatternMatcher::matchesRule("[z-a]", "m", false));
    EXPECT_FALSE(PatternMatcher::matchesRule("[a-z\\]", "b", false));

    std::vector<std::string> rules{"[z-a]", "*.log"};
    EXPECT_FALSE(PatternMatcher::isIgnored(rules, ".gitsync", true));
    EXPECT_TRUE(PatternMatcher::isIgnored(rules, "build/out.log", false));
}

// Test: Unanchored rule matches in any directory
TEST_F(PatternMatcherTest, UnanchoredRuleMatchesAnyDepth) {
    EXPECT_TRUE(PatternMatcher::matchesRule("*.swp", "notes.swp", false));
    EXPECT_TRUE(PatternMatcher::matchesRule("*.swp", "docs/deep/notes.swp", false));
    EXPECT_FALSE(PatternMatcher::matchesRule("*.swp", "notes.swp.txt", false));
}

// Test: Leading or inner slash anchors the rule at the root
TEST_F(PatternMatcherTest, AnchoredRules) {
    EXPECT_TRUE(PatternMatcher::matchesRule("/.gitsync/", ".gitsync", true));
    EXPECT_FALSE(PatternMatcher::matchesRule("/.gitsync/", "sub/.gitsync", true));

    EXPECT_TRUE(PatternMatcher::matchesRule("build/out", "build/out", false));
    EXPECT_FALSE(PatternMatcher::matchesRule("build/out", "x/build/out", false));
}

// Test: Trailing slash only matches directories
TEST_F(PatternMatcherTest, DirectoryOnlyRule) {
    EXPECT_TRUE(PatternMatcher::matchesRule("cache/", "cache", true));
    EXPECT_FALSE(PatternMatcher::matchesRule("cache/", "cache", false));
}

// Test: Last matching rule wins and '!' re-includes
TEST_F(PatternMatcherTest, NegationLastMatchWins) {
    std::vector<std::string> rules{"*.log", "!keep.log"};
    EXPECT_TRUE(PatternMatcher::isIgnored(rules, "debug.log", false));
    EXPECT_FALSE(PatternMatcher::isIgnored(rules, "keep.log", false));

    rules.push_back("keep.log");
    EXPECT_TRUE(PatternMatcher::isIgnored(rules, "keep.log", false));
}

// Test: Files under an ignored directory stay ignored
TEST_F(PatternMatcherTest, ParentDirectoryExcluded) {
    std::vector<std::string> rules{"/.gitsync/", "!.gitsync/keep"};
    EXPECT_TRUE(PatternMatcher::isIgnored(rules, ".gitsync/sync.lock", false));
    EXPECT_TRUE(PatternMatcher::isIgnored(rules, ".gitsync/keep", false));
    EXPECT_FALSE(PatternMatcher::isIgnored(rules, "src/sync.lock", false));
}

// Test: Load rules skipping comments and blank lines
TEST_F(PatternMatcherTest, LoadRules) {
    fs::path file = createFile(tempDir, "exclude",
                               "# comment\n"
                               "\n"
                               "*.tmp   \n"
                               "/.gitsync/\r\n"
                               "!important.tmp\n");
    auto rules = PatternMatcher::loadRules(file);
    ASSERT_EQ(rules.size(), 3u);
    EXPECT_EQ(rules[0], "*.tmp");
    EXPECT_EQ(rules[1], "/.gitsync/");
    EXPECT_EQ(rules[2], "!important.tmp");
}

// Test: Missing file yields no rules
TEST_F(PatternMatcherTest, LoadRulesMissingFile) {
    auto rules = PatternMatcher::loadRules(tempDir / "does-not-exist");
    EXPECT_TRUE(rules.empty());
}

// Test: Empty rule list ignores nothing
TEST_F(PatternMatcherTest, EmptyRules) {
    EXPECT_FALSE(PatternMatcher::isIgnored({}, "anything", false));
    EXPECT_FALSE(PatternMatcher::matchesRule("", "anything", false));
}
