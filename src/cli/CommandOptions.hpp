#pragma once

#include <set>
#include <string>
#include <vector>

#include "core/Operation.hpp"
#include "util/Expected.hpp"

namespace proclient {

/// Flags shared by the pro subcommands, plus remaining positional words
struct CommandOptions {
    std::vector<std::string> positional;
    bool assumeYes{false};
    bool beta{false};
    bool all{false};
    bool noAutoEnable{false};
    OutputFormat format{OutputFormat::Text};
    std::vector<std::string> enable;      // --enable, repeatable
    std::vector<std::string> enableBeta;  // --enable-beta, repeatable
    int retries{0};                       // --retries; 0 means the command's default
};

/**
 * @brief Parse subcommand arguments
 * @param args Arguments after the subcommand name
 * @param accepted Flags this subcommand understands (e.g. "--assume-yes", "--format")
 *
 * Flags taking a value (--format, --enable, --enable-beta, --retries)
 * accept both "--flag value" and "--flag=value". An unknown flag, a missing
 * value or a bad format or retry count yields InvalidArgs.
 */
Expected<CommandOptions> parseCommandOptions(const std::vector<std::string>& args, const std::set<std::string>& accepted);

}
