#pragma once

#include "cli/ICommand.hpp"

namespace proclient {

class DetachCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "detach"; }
    const char* description() const override { return "Remove this machine from an Ubuntu Pro subscription"; }
    const char* helpNameLine() const override { return "detach -  Remove this machine from an Ubuntu Pro subscription"; }
    const char* helpSynopsis() const override { return "pro detach [--assume-yes] [--format text|json]"; }
    const char* helpDescription() const override {
        return "Disable every enabled service and forget the subscription attachment.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--assume-yes", "Do not prompt for confirmation"},
            {"--format", "Output format: text (default) or json (requires --assume-yes)"}
        };
    }
};

}
