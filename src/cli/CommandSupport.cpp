#include "cli/CommandSupport.hpp"

#include <algorithm>

#include "util/Logger.hpp"
#include "util/Shutdown.hpp"

namespace gitsync {

Expected<SyncConfig> loadConfig(const std::vector<std::string>& args) {
    auto cfg = SyncConfig::fromArgs(args);
    if (!cfg) return cfg.error();

    auto& log = Logger::instance();
    if (!cfg.value().logLevel.empty()) {
        LogLevel lvl = LogLevel::Info;
        Logger::parseLevel(cfg.value().logLevel, lvl);
        log.setLevel(lvl);
    }
    if (!cfg.value().logFile.empty() && !log.attachFile(cfg.value().logFile)) {
        return Error{ErrorCode::ConfigurationError, "cannot open log file " + cfg.value().logFile.string()};
    }
    return cfg;
}

bool takeSwitch(std::vector<std::string>& args, const std::string& name) {
    auto it = std::remove(args.begin(), args.end(), name);
    bool present = it != args.end();
    args.erase(it, args.end());
    return present;
}

ShutdownToken& shutdownFor(const AppContext& ctx) {
    return ctx.shutdown ? *ctx.shutdown : ShutdownToken::global();
}

}
