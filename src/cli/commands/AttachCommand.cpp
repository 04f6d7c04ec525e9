#include "cli/commands/AttachCommand.hpp"

#include <iostream>

#include "cli/CommandOptions.hpp"
#include "cli/commands/CommandSupport.hpp"
#include "core/Platform.hpp"
#include "core/ServiceResolver.hpp"
#include "util/Logger.hpp"

namespace proclient {

/**
 * @brief Execute 'pro attach'
 *
 *   1. Reject if already attached
 *   2. Resolve the token to a contract
 *   3. Record the attachment and its entitlements
 *   4. Enable the contract's default services (unless --no-auto-enable);
 *      services not offered on this release are skipped silently
 */
Expected<void> AttachCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    auto optsRes = parseCommandOptions(args, {"--assume-yes", "--no-auto-enable", "--format"});
    if (!optsRes) return optsRes.error();
    const CommandOptions& opts = optsRes.value();

    if (opts.positional.empty()) {
        return Error{ErrorCode::InvalidArgs, Messages::ATTACH_REQUIRES_TOKEN};
    }
    if (opts.positional.size() > 1) {
        return Error{ErrorCode::InvalidArgs, "unrecognized arguments: " + opts.positional[1]};
    }
    const std::string& token = opts.positional.front();

    auto lock = CommandSupport::acquireLock(ctx, name(), opts.format);
    if (!lock) return lock.error();

    auto stateRes = ctx.store->load();
    if (!stateRes) return stateRes.error();
    if (stateRes.value().attached) {
        Error err = CommandSupport::reportSystemError(Messages::ALREADY_ATTACHED,
                                                      {{"contract", stateRes.value().contractName}}, opts.format);
        err.code = ErrorCode::AlreadyAttached;
        return err;
    }

    auto contractRes = ctx.contracts->lookup(token);
    if (!contractRes) {
        if (contractRes.error().code == ErrorCode::InvalidToken) {
            return CommandSupport::reportSystemError(Messages::INVALID_TOKEN, {}, opts.format);
        }
        return contractRes.error();
    }
    const Contract& contract = contractRes.value();

    AttachmentState state = CommandSupport::newAttachment(ctx, token, contract);
    Logger::instance().info("Attached to contract '" + contract.name + "'");

    OperationResult result;
    if (!opts.noAutoEnable) {
        result = ServiceResolver::aggregate(std::nullopt, CommandSupport::enableDefaults(ctx, contract, state));
    }

    auto saved = ctx.store->save(state);
    if (!saved) return saved.error();

    if (!result.processedServices.empty() && Platform::rebootRequired(ctx.config.rebootRequiredFile)) {
        result.needsReboot = true;
    }
    if (opts.format == OutputFormat::Text) {
        std::cout << Messages::format(Messages::ATTACH_SUCCESS, {{"contract", contract.name}}) << "\n";
    }
    return CommandSupport::finish(result, Action::Attach, opts.format, ctx);
}

}
