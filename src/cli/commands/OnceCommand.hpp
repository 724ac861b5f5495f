#pragma once

#include "cli/ICommand.hpp"
#include "core/SyncConfig.hpp"

namespace gitsync {

/// Single cycle, for cron/timer-driven deployments
class OnceCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "once"; }
    const char* description() const override { return "Run a single sync cycle and exit"; }
    const char* helpNameLine() const override { return "once -  Run exactly one synchronization cycle"; }
    const char* helpSynopsis() const override { return "gitsync once [--repo <path>] [options]"; }
    const char* helpDescription() const override {
        return "Run one cycle and exit. The exit status is non-zero when either half of the cycle failed, "
               "which makes the command usable from a scheduler.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return SyncConfig::flagHelp(); }
};

}
