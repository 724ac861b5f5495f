#pragma once

#include <string>
#include <vector>

#include "cli/ICommand.hpp"
#include "core/SyncConfig.hpp"

namespace gitsync {

class ShutdownToken;

/// Parse flags into a SyncConfig and apply its logging settings
Expected<SyncConfig> loadConfig(const std::vector<std::string>& args);

/// Remove every occurrence of a value-less switch; returns whether it was present
bool takeSwitch(std::vector<std::string>& args, const std::string& name);

/// Token from the context, or the one driven by process signals
ShutdownToken& shutdownFor(const AppContext& ctx);

}
