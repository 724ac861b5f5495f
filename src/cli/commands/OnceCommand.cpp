#include "cli/commands/OnceCommand.hpp"

#include "cli/CommandSupport.hpp"
#include "core/SyncDaemon.hpp"

namespace gitsync {

Expected<void> OnceCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    auto cfg = loadConfig(args);
    if (!cfg) return cfg.error();
    cfg.value().maxCycles = 1;

    SyncDaemon daemon(cfg.value(), shutdownFor(ctx));
    auto ran = daemon.run();
    if (!ran) return ran.error();

    // Report the first failure so scripts see a non-zero exit
    const CycleReport& report = daemon.lastReport();
    if (report.cycleError.code != ErrorCode::None) return report.cycleError;
    if (report.uploadError.code != ErrorCode::None) return report.uploadError;
    if (report.downloadError.code != ErrorCode::None) return report.downloadError;
    return {};
}

}
