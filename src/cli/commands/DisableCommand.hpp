#pragma once

#include "cli/ICommand.hpp"

namespace proclient {

class DisableCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "disable"; }
    const char* description() const override { return "Disable a specific Ubuntu Pro service on this machine"; }
    const char* helpNameLine() const override { return "disable -  Disable one or more Ubuntu Pro services"; }
    const char* helpSynopsis() const override { return "pro disable <service> [<service> ...] [--assume-yes] [--beta] [--format text|json]"; }
    const char* helpDescription() const override {
        return "Disable the named services on an attached machine. Services that depend on a disabled "
               "service are disabled first when --assume-yes is given.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"<service>", "Name of a service, see `pro status` for the list"},
            {"--assume-yes", "Do not prompt; also disable dependent services automatically"},
            {"--beta", "Allow beta services"},
            {"--format", "Output format: text (default) or json (requires --assume-yes)"}
        };
    }
};

}
