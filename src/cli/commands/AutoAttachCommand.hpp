#pragma once

#include <chrono>

#include "cli/ICommand.hpp"

namespace proclient {

/**
 * @brief 'pro auto-attach': attach with the image's own token
 *
 * The token comes from the contract source instead of the command line.
 * With --enable/--enable-beta only the named services are enabled (beta
 * allowed for both lists, but a beta name under --enable is refused);
 * otherwise the contract's defaults are. Attempts are retried up to
 * --retries times (3 by default) while the contract source reports I/O
 * failures or services are left pending.
 */
class AutoAttachCommand : public ICommand {
public:
    static constexpr int DEFAULT_RETRIES = 3;

    explicit AutoAttachCommand(std::chrono::milliseconds retryDelay = std::chrono::seconds(2))
        : retryDelay(retryDelay) {}

    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "auto-attach"; }
    const char* description() const override { return "Automatically attach on an Ubuntu Pro cloud instance"; }
    const char* helpNameLine() const override {
        return "auto-attach -  Automatically attach on an Ubuntu Pro cloud instance";
    }
    const char* helpSynopsis() const override {
        return "pro auto-attach [--enable <service>]... [--enable-beta <service>]... [--retries N] "
               "[--format text|json]";
    }
    const char* helpDescription() const override {
        return "Attach this machine using the token its image is entitled to. A machine attached on a "
               "different instance is detached first.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--enable", "Enable this service instead of the defaults (repeatable; beta services refused)"},
            {"--enable-beta", "Enable this service, beta services allowed (repeatable)"},
            {"--retries", "Number of attempts before giving up (default 3)"},
            {"--format", "Output format: text (default) or json"}
        };
    }

private:
    std::chrono::milliseconds retryDelay;
};

}
