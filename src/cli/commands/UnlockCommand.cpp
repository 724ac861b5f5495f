#include "cli/commands/UnlockCommand.hpp"

#include <filesystem>
#include <iostream>

#include "cli/CommandSupport.hpp"
#include "core/GitCliAdapter.hpp"
#include "core/SyncLock.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace gitsync {

Expected<void> UnlockCommand::execute(const AppContext&, const std::vector<std::string>& args) {
    std::vector<std::string> rest = args;
    bool force = takeSwitch(rest, "--force");

    auto cfgRes = loadConfig(rest);
    if (!cfgRes) return cfgRes.error();
    SyncConfig cfg = cfgRes.value();

    // Same marker the daemon uses: defaults hang off the top level
    GitCliAdapter vcs(cfg.repoPath, cfg.gitExecutable, cfg.networkTimeout);
    auto top = vcs.topLevel();
    if (top) {
        cfg.repoPath = top.value();
    } else {
        Logger::instance().debug("unlock", cfg.repoPath.string() + " is not a git working copy, using it as is");
    }
    fs::path marker = cfg.resolvedLockPath();

    std::error_code ec;
    if (!fs::exists(marker, ec)) {
        std::cout << "no lock at " << marker.string() << "\n";
        return {};
    }

    auto info = SyncLock::inspect(marker);
    if (info) {
        std::cout << "lock " << marker.string() << " held by pid " << info.value().pid << " on "
                  << info.value().host << " since " << info.value().acquiredAt << "\n";
    }
    if (!force) {
        return Error{ErrorCode::InvalidArgs, "refusing to remove " + marker.string() + " without --force"};
    }

    auto removed = SyncLock::forceRemove(marker);
    if (!removed) return removed.error();
    std::cout << "removed " << marker.string() << "\n";
    return {};
}

}
