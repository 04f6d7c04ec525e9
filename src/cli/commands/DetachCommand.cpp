#include "cli/commands/DetachCommand.hpp"

#include <iostream>

#include "cli/CommandOptions.hpp"
#include "cli/commands/CommandSupport.hpp"
#include "core/ServiceResolver.hpp"
#include "util/Logger.hpp"

namespace proclient {

Expected<void> DetachCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    auto optsRes = parseCommandOptions(args, {"--assume-yes", "--format"});
    if (!optsRes) return optsRes.error();
    const CommandOptions& opts = optsRes.value();
    if (!opts.positional.empty()) {
        return Error{ErrorCode::InvalidArgs, "unrecognized arguments: " + opts.positional.front()};
    }
    if (opts.format == OutputFormat::Json && !opts.assumeYes) {
        return CommandSupport::reportSystemError(Messages::JSON_FORMAT_REQUIRE_ASSUME_YES, {}, opts.format);
    }

    auto lock = CommandSupport::acquireLock(ctx, name(), opts.format);
    if (!lock) return lock.error();

    auto stateRes = ctx.store->load();
    if (!stateRes) return stateRes.error();
    AttachmentState state = stateRes.value();
    if (!state.attached) {
        return CommandSupport::reportSystemError(Messages::UNATTACHED, {}, opts.format);
    }

    // Dependents go first so nothing is left enabled on a disabled requirement
    std::vector<std::string> toDisable;
    for (const auto& svc : ctx.catalog->disableOrder()) {
        if (state.isEnabled(svc)) toDisable.push_back(svc);
    }

    if (opts.format == OutputFormat::Text && !opts.assumeYes && !toDisable.empty()) {
        std::cout << Messages::DETACH_WILL_DISABLE << "\n";
        for (const auto& svc : toDisable) std::cout << "    " << svc << "\n";
        if (!CommandSupport::confirm(ctx)) {
            return CommandSupport::reportSystemError(Messages::PROMPT_DENIED, {}, opts.format);
        }
    }

    OperationResult result = ServiceResolver::aggregate(std::nullopt, CommandSupport::disableAll(ctx, state));

    auto cleared = ctx.store->clear();
    if (!cleared) return cleared.error();
    Logger::instance().info("Detached from contract '" + state.contractName + "'");

    auto res = CommandSupport::finish(result, Action::Detach, opts.format, ctx);
    if (opts.format == OutputFormat::Text) std::cout << Messages::DETACH_SUCCESS << "\n";
    return res;
}

}
