#pragma once

#include "cli/ICommand.hpp"

namespace proclient {

class EnableCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "enable"; }
    const char* description() const override { return "Enable a specific Ubuntu Pro service on this machine"; }
    const char* helpNameLine() const override { return "enable -  Enable one or more Ubuntu Pro services"; }
    const char* helpSynopsis() const override { return "pro enable <service> [<service> ...] [--assume-yes] [--beta] [--format text|json]"; }
    const char* helpDescription() const override {
        return "Enable the named services on an attached machine. Services are processed in the order given; "
               "a failure on one service does not stop the others.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"<service>", "Name of a service, see `pro status` for the list"},
            {"--assume-yes", "Do not prompt; also enable required services automatically"},
            {"--beta", "Allow beta services"},
            {"--format", "Output format: text (default) or json (requires --assume-yes)"}
        };
    }
};

}
