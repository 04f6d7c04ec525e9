#pragma once

#include "cli/ICommand.hpp"

namespace proclient {

class AttachCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "attach"; }
    const char* description() const override { return "Attach this machine to an Ubuntu Pro subscription"; }
    const char* helpNameLine() const override { return "attach -  Attach this machine to an Ubuntu Pro subscription"; }
    const char* helpSynopsis() const override { return "pro attach <token> [--no-auto-enable] [--format text|json]"; }
    const char* helpDescription() const override {
        return "Attach this machine using a subscription token. Services the contract enables by default "
               "are enabled unless --no-auto-enable is given.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"<token>", "Token obtained from https://ubuntu.com/pro"},
            {"--no-auto-enable", "Do not enable any recommended services automatically"},
            {"--format", "Output format: text (default) or json"}
        };
    }
};

}
