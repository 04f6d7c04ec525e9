#include "cli/commands/AutoAttachCommand.hpp"

#include <iostream>
#include <optional>
#include <thread>

#include "cli/CommandOptions.hpp"
#include "cli/commands/CommandSupport.hpp"
#include "core/Platform.hpp"
#include "core/PreconditionGate.hpp"
#include "core/RequestValidator.hpp"
#include "core/ServiceResolver.hpp"
#include "util/Logger.hpp"

namespace proclient {

/**
 * @brief Detach a machine whose attachment belongs to another instance
 *
 * An attachment recorded for this machine id is left alone and reported
 * as already-attached.
 */
static Expected<void> detachBeforeAutoAttach(const AppContext& ctx, AttachmentState& state, OutputFormat format) {
    if (state.machineId == Platform::machineId(ctx.config.dataDir)) {
        Error err = CommandSupport::reportSystemError(Messages::ALREADY_ATTACHED,
                                                      {{"contract", state.contractName}}, format);
        err.code = ErrorCode::AlreadyAttached;
        return err;
    }

    if (format == OutputFormat::Text) std::cout << Messages::REATTACHING << "\n";
    Logger::instance().info("Detaching from '" + state.contractName + "' attached on instance " + state.machineId);
    ExecutionReport report = CommandSupport::disableAll(ctx, state);
    if (!report.errors.empty()) {
        return CommandSupport::reportSystemError(Messages::DETACH_AUTOMATION_FAILURE, {}, format);
    }
    auto cleared = ctx.store->clear();
    if (!cleared) return cleared.error();
    state = AttachmentState{};
    return {};
}

static void append(ExecutionReport& into, const ExecutionReport& from) {
    into.outcomes.insert(into.outcomes.end(), from.outcomes.begin(), from.outcomes.end());
    into.errors.insert(into.errors.end(), from.errors.begin(), from.errors.end());
    into.warnings.insert(into.warnings.end(), from.warnings.begin(), from.warnings.end());
    into.needsReboot = into.needsReboot || from.needsReboot;
}

/**
 * @brief Execute 'pro auto-attach'
 *
 *   1. Refuse beta services named under --enable
 *   2. Detach first if attached on a different instance
 *   3. Fetch the image token and its contract, then record the attachment
 *   4. Enable the contract defaults, or exactly the requested services
 *   5. Repeat steps 3-4 on I/O failures or pending services, up to the
 *      retry limit, then fail with full-auto-attach-error
 */
Expected<void> AutoAttachCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    auto optsRes = parseCommandOptions(args, {"--enable", "--enable-beta", "--retries", "--format"});
    if (!optsRes) return optsRes.error();
    const CommandOptions& opts = optsRes.value();
    if (!opts.positional.empty()) {
        return Error{ErrorCode::InvalidArgs, "unrecognized arguments: " + opts.positional.front()};
    }

    for (const auto& svcName : opts.enable) {
        const Service* svc = ctx.catalog->find(svcName);
        if (svc && svc->isBeta) {
            Logger::instance().warn("Beta service " + svcName + " requested without --enable-beta");
            return CommandSupport::reportSystemError(Messages::BETA_SERVICE_FOUND, {}, opts.format);
        }
    }

    const bool enableDefaults = opts.enable.empty() && opts.enableBeta.empty();
    std::vector<std::string> requested = opts.enable;
    requested.insert(requested.end(), opts.enableBeta.begin(), opts.enableBeta.end());
    NamePartition names = RequestValidator::partition(RequestValidator::dedupe(requested), *ctx.catalog, true);

    auto lock = CommandSupport::acquireLock(ctx, name(), opts.format);
    if (!lock) return lock.error();

    auto stateRes = ctx.store->load();
    if (!stateRes) return stateRes.error();
    AttachmentState state = stateRes.value();
    if (state.attached) {
        auto detached = detachBeforeAutoAttach(ctx, state, opts.format);
        if (!detached) return detached.error();
    }

    const int limit = opts.retries > 0 ? opts.retries : DEFAULT_RETRIES;
    ExecutionReport combined;
    std::optional<OperationResult> result;
    for (int attempt = 1; attempt <= limit && !result; ++attempt) {
        if (attempt > 1 && retryDelay.count() > 0) std::this_thread::sleep_for(retryDelay);
        Logger::instance().debug("auto-attach attempt " + std::to_string(attempt) + " of " + std::to_string(limit));

        if (!state.attached) {
            auto token = ctx.contracts->autoAttachToken();
            if (!token) {
                if (token.error().code == ErrorCode::InvalidToken) {
                    return CommandSupport::reportSystemError(Messages::UNSUPPORTED_AUTO_ATTACH, {}, opts.format);
                }
                if (token.error().code != ErrorCode::IoError) return token.error();
                Logger::instance().warn("Could not fetch auto-attach token: " + token.error().message);
                continue;
            }
            auto contractRes = ctx.contracts->lookup(token.value());
            if (!contractRes) {
                if (contractRes.error().code == ErrorCode::InvalidToken) {
                    return CommandSupport::reportSystemError(Messages::INVALID_TOKEN, {}, opts.format);
                }
                if (contractRes.error().code != ErrorCode::IoError) return contractRes.error();
                Logger::instance().warn("Could not fetch contract: " + contractRes.error().message);
                continue;
            }

            state = CommandSupport::newAttachment(ctx, token.value(), contractRes.value());
            Logger::instance().info("Auto-attached to contract '" + state.contractName + "'");
            if (opts.format == OutputFormat::Text) {
                std::cout << Messages::format(Messages::ATTACH_SUCCESS, {{"contract", state.contractName}}) << "\n";
            }
            if (enableDefaults) {
                append(combined, CommandSupport::enableDefaults(ctx, contractRes.value(), state));
                result = ServiceResolver::aggregate(std::nullopt, combined);
            }
            auto saved = ctx.store->save(state);
            if (!saved) return saved.error();
            if (result) break;
        }

        // Services enabled by an earlier attempt are not tried again
        std::vector<std::string> pending;
        for (const auto& svc : names.known) {
            if (!state.isEnabled(svc)) pending.push_back(svc);
        }
        ExecutionOptions execOpts;
        execOpts.assumeYes = true;
        ActionExecutor executor(*ctx.catalog, *ctx.backend);
        ExecutionReport report = executor.execute(Action::Enable, pending, state, execOpts);
        append(combined, report);
        auto saved = ctx.store->save(state);
        if (!saved) return saved.error();

        if (!report.errors.empty() || !names.unknown.empty()) {
            std::optional<ErrorEntry> notFound;
            if (!names.unknown.empty()) notFound = PreconditionGate::unknownServicesError(Action::Enable, names.unknown);
            result = ServiceResolver::aggregate(notFound, combined);
            break;
        }
        bool allEnabled = true;
        for (const auto& svc : names.known) allEnabled = allEnabled && state.isEnabled(svc);
        if (allEnabled) result = ServiceResolver::aggregate(std::nullopt, combined);
    }

    if (!result) {
        Logger::instance().error("auto-attach gave up after " + std::to_string(limit) + " attempt(s)");
        return CommandSupport::reportSystemError(Messages::FULL_AUTO_ATTACH_ERROR, {}, opts.format);
    }
    if (!result->processedServices.empty() && Platform::rebootRequired(ctx.config.rebootRequiredFile)) {
        result->needsReboot = true;
    }
    return CommandSupport::finish(*result, Action::Attach, opts.format, ctx);
}

}
