#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "cli/ICommand.hpp"

namespace proclient {

/**
 * @brief Registry of pro subcommands by name
 *
 * Populated once at startup by registerBuiltins(); lookups create a fresh
 * command object per invocation.
 */
class CommandFactory {
public:
    using Creator = std::function<std::unique_ptr<ICommand>()>;

    static CommandFactory& instance();

    /// Register enable, disable, attach, detach, refresh, status and help
    static void registerBuiltins();

    void registerCreator(const std::string& name, Creator creator);
    bool has(const std::string& name) const { return creators.count(name) != 0; }
    std::unique_ptr<ICommand> create(const std::string& name) const;

    /// One instance of every registered command, sorted by name
    void listCommands(std::vector<std::unique_ptr<ICommand>>& out) const;

private:
    CommandFactory() = default;
    std::unordered_map<std::string, Creator> creators;
};

}
