#include "core/SyncConfig.hpp"

#include <stdexcept>

#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace gitsync {

static Expected<unsigned long> parseCount(const std::string& flag, const std::string& text) {
    if (text.empty() || text[0] == '-') {
        return Error{ErrorCode::InvalidArgs, flag + ": expected a non-negative number, got '" + text + "'"};
    }
    try {
        size_t used = 0;
        unsigned long v = std::stoul(text, &used);
        if (used != text.size()) {
            return Error{ErrorCode::InvalidArgs, flag + ": trailing characters in '" + text + "'"};
        }
        return v;
    } catch (const std::exception&) {
        return Error{ErrorCode::InvalidArgs, flag + ": expected a non-negative number, got '" + text + "'"};
    }
}

Expected<SyncConfig> SyncConfig::fromArgs(const std::vector<std::string>& args) {
    SyncConfig cfg;
    std::error_code ec;
    cfg.repoPath = fs::current_path(ec);
    if (ec) return Error{ErrorCode::IoError, "cannot read current directory: " + ec.message()};

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];

        if (a == "--default-ignores") {
            cfg.installDefaultIgnores = true;
            continue;
        }

        // Everything else takes a value
        if (i + 1 >= args.size()) {
            return Error{ErrorCode::InvalidArgs, "unknown or incomplete option: " + a};
        }
        const std::string& v = args[i + 1];
        ++i;

        if (a == "--repo") {
            cfg.repoPath = v;
        } else if (a == "--interval") {
            auto n = parseCount(a, v);
            if (!n) return n.error();
            cfg.pollInterval = std::chrono::seconds(n.value());
        } else if (a == "--remote") {
            cfg.remoteName = v;
        } else if (a == "--branch") {
            cfg.upstreamBranch = v;
        } else if (a == "--lock-path") {
            cfg.lockPath = v;
        } else if (a == "--lock-timeout") {
            auto n = parseCount(a, v);
            if (!n) return n.error();
            cfg.lockMaxWait = std::chrono::seconds(n.value());
        } else if (a == "--network-timeout") {
            auto n = parseCount(a, v);
            if (!n) return n.error();
            cfg.networkTimeout = std::chrono::seconds(n.value());
        } else if (a == "--message") {
            cfg.commitContext = v;
        } else if (a == "--max-cycles") {
            auto n = parseCount(a, v);
            if (!n) return n.error();
            cfg.maxCycles = n.value();
        } else if (a == "--git") {
            cfg.gitExecutable = v;
        } else if (a == "--log-level") {
            LogLevel lvl;
            if (!Logger::parseLevel(v, lvl)) {
                return Error{ErrorCode::InvalidArgs, "--log-level: unknown level '" + v + "'"};
            }
            cfg.logLevel = v;
        } else if (a == "--log-file") {
            cfg.logFile = v;
        } else {
            return Error{ErrorCode::InvalidArgs, "unknown option: " + a};
        }
    }

    cfg.repoPath = fs::absolute(cfg.repoPath, ec).lexically_normal();
    if (ec) return Error{ErrorCode::InvalidArgs, "--repo: " + ec.message()};
    return cfg;
}

fs::path SyncConfig::resolvedLockPath() const {
    if (lockPath.empty()) {
        return repoPath / Constants::LOCK_DIR_NAME / Constants::LOCK_FILE_NAME;
    }
    if (lockPath.is_relative()) {
        return (repoPath / lockPath).lexically_normal();
    }
    return lockPath;
}

Expected<void> SyncConfig::validate() const {
    if (repoPath.empty()) {
        return Error{ErrorCode::ConfigurationError, "repository path is empty"};
    }
    if (pollInterval.count() < 1) {
        return Error{ErrorCode::ConfigurationError, "poll interval must be at least one second"};
    }
    if (lockPollInterval.count() < 1) {
        return Error{ErrorCode::ConfigurationError, "lock poll interval must be positive"};
    }
    if (remoteName.empty()) {
        return Error{ErrorCode::ConfigurationError, "remote name is empty"};
    }
    if (gitExecutable.empty()) {
        return Error{ErrorCode::ConfigurationError, "git executable is empty"};
    }
    if (resolvedLockPath().filename().empty()) {
        return Error{ErrorCode::ConfigurationError, "lock path names a directory: " + resolvedLockPath().string()};
    }
    return {};
}

std::vector<std::pair<std::string, std::string>> SyncConfig::flagHelp() {
    return {
        {"--repo <path>", "Working copy to synchronize (default: current directory)."},
        {"--interval <sec>", "Seconds between cycles (default: 30)."},
        {"--remote <name>", "Remote to fetch from and push to (default: origin)."},
        {"--branch <name>", "Upstream branch name (default: the checked-out branch's name)."},
        {"--lock-path <path>", "Lock marker file (default: <repo>/.gitsync/sync.lock)."},
        {"--lock-timeout <sec>", "Give up waiting for the lock after <sec> seconds (default: wait forever)."},
        {"--network-timeout <sec>", "Kill fetch/push calls that run longer than <sec> (default: none)."},
        {"--message <text>", "Extra context appended to automated commit messages."},
        {"--max-cycles <n>", "Stop after <n> cycles (default: unlimited)."},
        {"--default-ignores", "Add editor/OS temp-file patterns to the local exclude file."},
        {"--git <exe>", "git executable to invoke (default: git from PATH)."},
        {"--log-level <lvl>", "error, warn, info or debug (default: $GITSYNC_LOG or info)."},
        {"--log-file <path>", "Also append log lines to <path>."},
    };
}

}
