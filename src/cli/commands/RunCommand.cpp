#include "cli/commands/RunCommand.hpp"

#include "cli/CommandSupport.hpp"
#include "core/SyncDaemon.hpp"

namespace gitsync {

Expected<void> RunCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    auto cfg = loadConfig(args);
    if (!cfg) return cfg.error();

    SyncDaemon daemon(cfg.value(), shutdownFor(ctx));
    auto ran = daemon.run();
    if (!ran) return ran.error();
    return {};
}

}
