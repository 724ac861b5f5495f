#pragma once

#include <string>
#include <utility>
#include <vector>

#include "cli/ICommand.hpp"
#include "core/SyncConfig.hpp"

namespace gitsync {

class StatusCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "status"; }
    const char* description() const override { return "Show sync state of a working copy"; }
    const char* helpNameLine() const override { return "status -  Show what the next cycle would do"; }
    const char* helpSynopsis() const override { return "gitsync status [--fetch] [--repo <path>] [options]"; }
    const char* helpDescription() const override {
        return "Report branch, upstream, uncommitted changes, commits ahead of and behind the upstream, and the "
               "current lock holder. Nothing is staged or committed. Counts use the last fetched upstream unless "
               "--fetch is given.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        auto opts = SyncConfig::flagHelp();
        opts.insert(opts.begin(), std::make_pair(std::string("--fetch"), std::string("Fetch from the remote before counting commits")));
        return opts;
    }
};

}
