#include "cli/commands/RefreshCommand.hpp"

#include <iostream>

#include "cli/CommandOptions.hpp"
#include "cli/commands/CommandSupport.hpp"
#include "core/ActionExecutor.hpp"
#include "util/Logger.hpp"

namespace proclient {

static Expected<void> refreshConfig(const AppContext& ctx) {
    auto cfg = Config::load(ctx.config.configFile);
    if (!cfg) return cfg.error();
    Logger::instance().setLevel(Logger::parseLevel(cfg.value().logLevel, Logger::instance().level()));
    std::cout << Messages::REFRESH_CONFIG_SUCCESS << "\n";
    return {};
}

/**
 * @brief Replace the entitlement set from the contract source
 *
 * Enabled services that lost their entitlement are disabled (dependents
 * first). Each dependent disabled along the way and each service that
 * lost its entitlement is reported on stderr.
 */
static Expected<void> refreshContract(const AppContext& ctx) {
    auto lock = CommandSupport::acquireLock(ctx, "refresh", OutputFormat::Text);
    if (!lock) return lock.error();

    auto stateRes = ctx.store->load();
    if (!stateRes) return stateRes.error();
    AttachmentState state = stateRes.value();
    if (!state.attached) {
        return Error{ErrorCode::NotAttached, Messages::UNATTACHED.text};
    }

    auto contractRes = ctx.contracts->lookup(state.token);
    if (!contractRes) return contractRes.error();
    const Contract& contract = contractRes.value();

    state.contractName = contract.name;
    state.entitlements = std::set<std::string>(contract.entitlements.begin(), contract.entitlements.end());

    std::vector<std::string> lost;
    for (const auto& svc : ctx.catalog->disableOrder()) {
        if (state.isEnabled(svc) && !state.isEntitled(svc)) lost.push_back(svc);
    }
    if (!lost.empty()) {
        ExecutionOptions execOpts;
        execOpts.assumeYes = true;
        ActionExecutor executor(*ctx.catalog, *ctx.backend);
        auto report = executor.execute(Action::Disable, lost, state, execOpts);
        // Dependents switched off along the way are still entitled; name them separately
        for (const auto& w : report.warnings) std::cerr << w.message << "\n";
        for (const auto& o : report.outcomes) {
            const Service* svc = ctx.catalog->find(o.serviceName);
            if (o.status == ServiceStatus::Success && svc) {
                std::cerr << Messages::format(Messages::SERVICE_ENTITLEMENT_REMOVED.text, {{"title", svc->title}}) << "\n";
            }
        }
        for (const auto& e : report.errors) std::cerr << e.message << "\n";
    }

    auto saved = ctx.store->save(state);
    if (!saved) return saved.error();
    Logger::instance().info("Refreshed contract '" + contract.name + "'");
    std::cout << Messages::REFRESH_CONTRACT_SUCCESS << "\n";
    return {};
}

Expected<void> RefreshCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    auto optsRes = parseCommandOptions(args, {});
    if (!optsRes) return optsRes.error();
    const auto& positional = optsRes.value().positional;
    if (positional.size() > 1) {
        return Error{ErrorCode::InvalidArgs, "unrecognized arguments: " + positional[1]};
    }

    std::string target = positional.empty() ? "contract" : positional.front();
    if (target == "contract") return refreshContract(ctx);
    if (target == "config") return refreshConfig(ctx);
    return Error{ErrorCode::InvalidArgs, "Invalid refresh target '" + target + "'. Use: contract, config"};
}

}
