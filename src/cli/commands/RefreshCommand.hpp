#pragma once

#include "cli/ICommand.hpp"

namespace proclient {

class RefreshCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "refresh"; }
    const char* description() const override { return "Refresh Ubuntu Pro contract and configuration"; }
    const char* helpNameLine() const override { return "refresh -  Refresh the subscription contract or the client configuration"; }
    const char* helpSynopsis() const override { return "pro refresh [contract|config]"; }
    const char* helpDescription() const override {
        return "contract (default): re-read the contract for the attached token and update entitlements, "
               "disabling services that are no longer entitled. config: reload and validate the configuration file.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"contract", "Refresh the subscription entitlements"},
            {"config", "Reload the configuration file"}
        };
    }
};

}
