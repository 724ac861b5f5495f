#include "core/IgnoreRules.hpp"

#include <algorithm>
#include <fstream>
#include <utility>

#include "util/Logger.hpp"
#include "util/PatternMatcher.hpp"

namespace fs = std::filesystem;

namespace gitsync {

IgnoreRules::IgnoreRules(IVcsAdapter& vcs, fs::path root) : vcs_(vcs), root_(std::move(root)) {}

const std::vector<std::string>& IgnoreRules::defaultPatterns() {
    static const std::vector<std::string> patterns{
        "*.swp", "*.swo", "*~", ".#*",
        ".DS_Store", "Thumbs.db", "desktop.ini",
        "*.part", "*.crdownload", "*.download", "*.tmp",
    };
    return patterns;
}

Expected<std::vector<std::string>> IgnoreRules::currentRules() {
    auto rules = PatternMatcher::loadRules(root_ / ".gitignore");
    auto exclude = vcs_.metadataPath("info/exclude");
    if (!exclude) return exclude.error();
    auto local = PatternMatcher::loadRules(exclude.value());
    rules.insert(rules.end(), local.begin(), local.end());
    return rules;
}

Expected<void> IgnoreRules::appendRules(const std::vector<std::string>& rules) {
    auto exclude = vcs_.metadataPath("info/exclude");
    if (!exclude) return exclude.error();

    std::error_code ec;
    fs::create_directories(exclude.value().parent_path(), ec);
    if (ec) {
        return Error{ErrorCode::IoError, "cannot create " + exclude.value().parent_path().string() + ": " + ec.message()};
    }

    // Keep existing content on its own line
    bool needsNewline = false;
    {
        std::ifstream in(exclude.value(), std::ios::binary);
        if (in) {
            in.seekg(0, std::ios::end);
            if (in.tellg() > 0) {
                in.seekg(-1, std::ios::end);
                char last = 0;
                in.get(last);
                needsNewline = last != '\n';
            }
        }
    }

    std::ofstream out(exclude.value(), std::ios::app);
    if (!out) return Error{ErrorCode::IoError, "cannot open " + exclude.value().string() + " for writing"};
    if (needsNewline) out << "\n";
    for (const auto& r : rules) out << r << "\n";
    out.flush();
    if (!out) return Error{ErrorCode::IoError, "failed writing " + exclude.value().string()};
    return {};
}

Expected<bool> IgnoreRules::ensureExcluded(const fs::path& path, bool isDir) {
    std::error_code ec;
    fs::path absPath = fs::weakly_canonical(path, ec);
    if (ec) absPath = path.lexically_normal();
    fs::path absRoot = fs::weakly_canonical(root_, ec);
    if (ec) absRoot = root_.lexically_normal();

    fs::path rel = absPath.lexically_relative(absRoot);
    std::string relStr = rel.generic_string();
    if (rel.empty() || relStr == "." || relStr.rfind("..", 0) == 0) {
        Logger::instance().debug("ignore", path.string() + " is outside the working copy");
        return false;
    }
    if (relStr == ".git" || relStr.rfind(".git/", 0) == 0) return false;

    auto rules = currentRules();
    if (!rules) return rules.error();
    if (PatternMatcher::isIgnored(rules.value(), relStr, isDir)) return false;

    std::string rule = "/" + relStr + (isDir ? "/" : "");
    auto appended = appendRules({rule});
    if (!appended) return appended.error();
    Logger::instance().info("ignore", "added '" + rule + "' to the local exclude file");
    return true;
}

Expected<size_t> IgnoreRules::installDefaults() {
    auto rules = currentRules();
    if (!rules) return rules.error();

    std::vector<std::string> missing;
    for (const auto& p : defaultPatterns()) {
        if (std::find(rules.value().begin(), rules.value().end(), p) == rules.value().end()) {
            missing.push_back(p);
        }
    }
    if (missing.empty()) return size_t{0};

    auto appended = appendRules(missing);
    if (!appended) return appended.error();
    Logger::instance().info("ignore", "added " + std::to_string(missing.size()) + " default pattern(s) to the local exclude file");
    return missing.size();
}

}
