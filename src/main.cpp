// CLI entry: command pattern over the sync daemon.

#include <iostream>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/ICommand.hpp"
#include "core/Constants.hpp"
#include "util/Shutdown.hpp"

using namespace gitsync;

static int exitStatus(const Expected<void>& res) {
    if (res) return 0;
    if (res.error().code == ErrorCode::ConfigurationError || res.error().code == ErrorCode::InvalidArgs) {
        return Constants::EXIT_CONFIG_ERROR;
    }
    return 1;
}

int main(int argc, char** argv) {
    CommandFactory::registerDefaults();
    installSignalHandlers();

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    AppContext ctx{};
    CommandInvoker invoker;
    if (args.empty()) {
        auto cmd = CommandFactory::instance().create("help");
        invoker.invoke(*cmd, ctx, {});
        return 0;
    }
    std::string cmdName = args.front();
    args.erase(args.begin());
    if (cmdName == "--help" || cmdName == "-h") cmdName = "help";

    auto cmd = CommandFactory::instance().create(cmdName);
    if (!cmd) {
        std::cerr << "Unknown command: " << cmdName << "\n";
        auto help = CommandFactory::instance().create("help");
        invoker.invoke(*help, ctx, {});
        return Constants::EXIT_CONFIG_ERROR;
    }
    return exitStatus(invoker.invoke(*cmd, ctx, args));
}
