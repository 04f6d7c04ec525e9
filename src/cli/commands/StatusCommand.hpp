#pragma once

#include "cli/ICommand.hpp"

namespace proclient {

class StatusCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "status"; }
    const char* description() const override { return "Current status of all Ubuntu Pro services"; }
    const char* helpNameLine() const override { return "status -  Show subscription and service status"; }
    const char* helpSynopsis() const override { return "pro status [--all] [--format text|json]"; }
    const char* helpDescription() const override {
        return "Show whether this machine is attached and, for each service, whether it is available, "
               "entitled and enabled.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--all", "Include beta services"},
            {"--format", "Output format: text (default) or json"}
        };
    }
};

}
