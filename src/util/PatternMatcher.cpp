#include "util/PatternMatcher.hpp"

#include <fstream>
#include <regex>

#include "util/Logger.hpp"

namespace gitsync {
namespace PatternMatcher {

std::regex globToRegex(const std::string& pattern) {
    std::string regexStr = "^";
    for (size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];
        if (c == '*') {
            if (i + 1 < pattern.size() && pattern[i + 1] == '*') {
                // "**/" also matches zero directories
                if (i + 2 < pattern.size() && pattern[i + 2] == '/') {
                    regexStr += "(.*/)?";
                    i += 2;
                } else {
                    regexStr += ".*";
                    ++i;
                }
            } else {
                regexStr += "[^/]*";
            }
        } else if (c == '?') {
            regexStr += "[^/]";
        } else if (c == '[') {
            size_t close = pattern.find(']', i + 1);
            if (close == std::string::npos) {
                regexStr += "\\[";
            } else {
                std::string cls = pattern.substr(i + 1, close - i - 1);
                if (!cls.empty() && cls[0] == '!') cls[0] = '^';
                regexStr += "[" + cls + "]";
                i = close;
            }
        } else if (c == '.') {
            regexStr += "\\.";
        } else if (c == '+' || c == ']' || c == '(' || c == ')' ||
                   c == '{' || c == '}' || c == '^' || c == '$' || c == '|' || c == '\\') {
            regexStr += '\\';
            regexStr += c;
        } else {
            regexStr += c;
        }
    }
    regexStr += "$";
    return std::regex(regexStr);
}

bool matchesRule(const std::string& ruleIn, const std::string& relPath, bool isDir) {
    std::string rule = ruleIn;
    if (rule.empty()) return false;

    bool dirOnly = false;
    if (rule.back() == '/') {
        dirOnly = true;
        rule.pop_back();
    }
    if (dirOnly && !isDir) return false;

    bool anchored = false;
    if (!rule.empty() && rule.front() == '/') {
        anchored = true;
        rule.erase(0, 1);
    }
    if (rule.find('/') != std::string::npos) anchored = true;
    if (rule.empty()) return false;

    // git accepts classes std::regex rejects ("[z-a]"); such a rule matches nothing here
    std::regex re;
    try {
        re = globToRegex(rule);
    } catch (const std::regex_error& e) {
        Logger::instance().debug("ignore", "rule '" + ruleIn + "' not understood: " + e.what());
        return false;
    }
    if (anchored) {
        return std::regex_match(relPath, re);
    }

    // Unanchored: match the last component
    auto slash = relPath.rfind('/');
    std::string base = (slash == std::string::npos) ? relPath : relPath.substr(slash + 1);
    return std::regex_match(base, re);
}

std::vector<std::string> loadRules(const std::filesystem::path& file) {
    std::vector<std::string> rules;
    std::ifstream in(file);
    if (!in) return rules;
    std::string line;
    while (std::getline(in, line)) {
        while (!line.empty() && (line.back() == ' ' || line.back() == '\t' || line.back() == '\r')) {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') continue;
        rules.push_back(line);
    }
    return rules;
}

static bool evaluate(const std::vector<std::string>& rules, const std::string& relPath, bool isDir) {
    bool ignored = false;
    for (const auto& r : rules) {
        if (!r.empty() && r[0] == '!') {
            if (matchesRule(r.substr(1), relPath, isDir)) ignored = false;
        } else if (matchesRule(r, relPath, isDir)) {
            ignored = true;
        }
    }
    return ignored;
}

bool isIgnored(const std::vector<std::string>& rules, const std::string& relPath, bool isDir) {
    // git never re-includes a file whose parent directory is excluded
    std::string prefix;
    size_t pos = 0;
    while ((pos = relPath.find('/', pos)) != std::string::npos) {
        prefix = relPath.substr(0, pos);
        if (evaluate(rules, prefix, true)) return true;
        ++pos;
    }
    return evaluate(rules, relPath, isDir);
}

}  // namespace PatternMatcher
}  // namespace gitsync
