#pragma once

#include <filesystem>
#include <regex>
#include <string>
#include <vector>

namespace gitsync {

/**
 * @brief Glob matching with gitignore rule semantics
 *
 * Used to decide whether an ignore file already covers a path before the
 * daemon appends its own rules. git itself does the real filtering when
 * staging; this only has to agree with it for simple rules.
 *
 * Supported:
 *   *      -> any run of characters except '/'
 *   **     -> any run of characters including '/'
 *   ?      -> one character except '/'
 *   [abc]  -> character class (passed through)
 *   /x     -> anchored at the repository root
 *   x/     -> matches directories only
 *   !x     -> negation, re-includes a previously ignored path
 *
 * A rule without a '/' (other than a trailing one) matches against every
 * path component, e.g. "*.swp" matches "notes/a.swp".
 */
namespace PatternMatcher {

/**
 * @brief Convert glob pattern to std::regex
 *
 * Example: "*.txt" -> "^[^/]*\.txt$"
 */
std::regex globToRegex(const std::string& pattern);

/**
 * @brief Match one ignore rule (without leading '!') against a path
 * @param rule Rule text as written in the ignore file
 * @param relPath Path relative to repository root, '/' separated
 * @param isDir Whether relPath names a directory
 *
 * A rule whose character class std::regex cannot compile never matches.
 */
bool matchesRule(const std::string& rule, const std::string& relPath, bool isDir);

/**
 * @brief Read rules from an ignore file
 *
 * Skips blank lines and '#' comments, trims trailing whitespace. A missing
 * file yields an empty list.
 */
std::vector<std::string> loadRules(const std::filesystem::path& file);

/**
 * @brief Apply rules in order, last match wins, '!' re-includes
 *
 * A path is also ignored when any of its parent directories is ignored.
 */
bool isIgnored(const std::vector<std::string>& rules, const std::string& relPath, bool isDir);

}  // namespace PatternMatcher

}  // namespace gitsync
