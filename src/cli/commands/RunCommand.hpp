#pragma once

#include "cli/ICommand.hpp"
#include "core/SyncConfig.hpp"

namespace gitsync {

class RunCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "run"; }
    const char* description() const override { return "Synchronize continuously until stopped"; }
    const char* helpNameLine() const override { return "run -  Run the synchronization loop in the foreground"; }
    const char* helpSynopsis() const override { return "gitsync run [--repo <path>] [--interval <sec>] [options]"; }
    const char* helpDescription() const override {
        return "Run one cycle immediately, then one cycle every interval. Each cycle takes the lock, commits and "
               "pushes local changes, fetches, and fast-forwards to the upstream branch, stashing and restoring "
               "uncommitted edits. SIGINT/SIGTERM stop after the current cycle; a second signal or SIGQUIT exits "
               "at once. SIGUSR1 starts the next cycle early.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return SyncConfig::flagHelp(); }
};

}
