#pragma once

#include <string>
#include <utility>
#include <vector>

#include "cli/ICommand.hpp"

namespace gitsync {

/// Operator recovery for a marker left behind by a crashed process
class UnlockCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "unlock"; }
    const char* description() const override { return "Remove a stale sync lock"; }
    const char* helpNameLine() const override { return "unlock -  Delete the lock marker of a working copy"; }
    const char* helpSynopsis() const override { return "gitsync unlock --force [--repo <path>] [--lock-path <path>]"; }
    const char* helpDescription() const override {
        return "Locks never expire on their own. When a process died while holding the lock, every later cycle "
               "waits for it. Check that no gitsync process is running, then remove the marker with --force. "
               "Without --force the current holder is printed and nothing is removed.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--force", "Actually remove the marker"},
            {"--repo <path>", "Working copy (default: current directory)"},
            {"--lock-path <path>", "Marker file (default: <repo>/.gitsync/sync.lock)"},
        };
    }
};

}
