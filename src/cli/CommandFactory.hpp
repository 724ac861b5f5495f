#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "cli/ICommand.hpp"

namespace gitsync {

/**
 * @brief Name -> command registry used by main() and the help command
 */
class CommandFactory {
public:
    using Creator = std::function<std::unique_ptr<ICommand>()>;

    static CommandFactory& instance();

    /// Register run, once, status, unlock and help
    static void registerDefaults();

    void registerCreator(const std::string& name, Creator creator);
    bool contains(const std::string& name) const;
    std::unique_ptr<ICommand> create(const std::string& name) const;
    /// One instance of every command, sorted by name
    void listCommands(std::vector<std::unique_ptr<ICommand>>& out) const;

private:
    CommandFactory() = default;
    std::unordered_map<std::string, Creator> creators;
};

}
