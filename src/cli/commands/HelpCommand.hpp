#pragma once

#include "cli/ICommand.hpp"

namespace proclient {

class HelpCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "help"; }
    const char* description() const override { return "Show detailed information about Ubuntu Pro services"; }
    const char* helpNameLine() const override { return "help -  Show help for services and commands"; }
    const char* helpSynopsis() const override { return "pro help [<service>|<command>] [--format text|json]"; }
    const char* helpDescription() const override {
        return "Without arguments, list commands and services. With a service name, show whether it is "
               "available on this release and what it provides.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--format", "Output format: text (default) or json"}
        };
    }
};

}
