#include "cli/commands/HelpCommand.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "cli/CommandOptions.hpp"
#include "core/HelpQuery.hpp"
#include "core/OutputRenderer.hpp"

namespace proclient {

namespace {

void printCommandDetail(const ICommand& cmd) {
    std::cout << "Name:\n" << cmd.helpNameLine() << "\n\n";
    std::cout << "SYNOPSIS:\n" << cmd.helpSynopsis() << "\n\n";
    std::cout << "DESCRIPTION:\n" << cmd.helpDescription() << "\n\n";
    auto opts = cmd.helpOptions();
    if (!opts.empty()) {
        std::cout << "OPTIONS:\n";
        for (const auto& [opt, desc] : opts) {
            std::cout << opt << " :  " << desc << "\n\n";
        }
    }
}

void printOverview(const AppContext& ctx) {
    std::vector<std::unique_ptr<ICommand>> cmds;
    CommandFactory::instance().listCommands(cmds);

    std::cout << "usage: pro <command> [<args>]\n\n";
    std::cout << "Available commands:\n";
    for (const auto& c : cmds) {
        std::cout << "  " << c->name() << "\t" << c->description() << "\n";
    }
    std::cout << "\nAvailable services:\n";
    for (const auto& s : ctx.catalog->validServices(ctx.config.allowBeta)) {
        std::cout << "  " << s << "\n";
    }
}

}

/**
 * @brief Execute 'pro help'
 *
 * Service names take precedence over command names. An unknown topic is a
 * HelpNotFound error whose message the invoker prints on stderr.
 */
Expected<void> HelpCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    auto optsRes = parseCommandOptions(args, {"--format", "--all"});
    if (!optsRes) return optsRes.error();
    const CommandOptions& opts = optsRes.value();

    if (opts.positional.empty()) {
        printOverview(ctx);
        return {};
    }

    const std::string& topic = opts.positional.front();
    auto help = queryHelp(*ctx.catalog, topic, ctx.platform.series);
    if (help) {
        OutputRenderer::renderHelp(help.value(), opts.format, std::cout);
        return {};
    }

    if (auto cmd = CommandFactory::instance().create(topic)) {
        printCommandDetail(*cmd);
        return {};
    }
    return help.error();
}

}
