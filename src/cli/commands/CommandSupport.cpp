#include "cli/commands/CommandSupport.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "cli/CommandOptions.hpp"
#include "core/OutputRenderer.hpp"
#include "core/Platform.hpp"
#include "core/ServiceResolver.hpp"
#include "util/Logger.hpp"

namespace proclient::CommandSupport {

Error reportSystemError(const NamedMessage& msg, const std::map<std::string, std::string>& args, OutputFormat format) {
    ErrorEntry entry{Messages::format(msg.text, args), msg.code, std::nullopt, ErrorType::System};
    Logger::instance().debug(std::string("Reporting ") + msg.code);
    if (format == OutputFormat::Json) {
        OperationResult result;
        result.errors.push_back(entry);
        OutputRenderer::renderJson(result, std::cout);
    } else {
        std::cerr << entry.message << "\n";
    }
    return Error{ErrorCode::OperationFailed, ""};
}

Expected<std::unique_ptr<FileLock>> acquireLock(const AppContext& ctx, const std::string& command, OutputFormat format) {
    auto lock = FileLock::acquire(ctx.config.lockFile());
    if (!lock) {
        if (lock.error().code == ErrorCode::LockHeld) {
            return reportSystemError(Messages::LOCK_HELD,
                                     {{"command", command}, {"lock", ctx.config.lockFile().string()}}, format);
        }
        return lock.error();
    }
    return std::move(lock.value());
}

bool confirm(const AppContext& ctx) {
    std::cout << Messages::CONFIRM_PROMPT << std::flush;
    std::string answer;
    if (!ctx.input || !std::getline(*ctx.input, answer)) return false;
    std::transform(answer.begin(), answer.end(), answer.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return answer == "y" || answer == "yes";
}

Expected<void> finish(const OperationResult& result, Action action, OutputFormat format, const AppContext& ctx) {
    if (format == OutputFormat::Json) {
        OutputRenderer::renderJson(result, std::cout);
    } else {
        OutputRenderer::renderText(result, action, *ctx.catalog, std::cout, std::cerr);
    }
    Logger::instance().info(std::string(actionVerb(action)) + " finished with result " + result.result());
    if (!result.succeeded()) return Error{ErrorCode::OperationFailed, ""};
    return {};
}

Expected<void> runServiceBatch(Action action, const AppContext& ctx, const std::vector<std::string>& args) {
    auto optsRes = parseCommandOptions(args, {"--assume-yes", "--beta", "--format"});
    if (!optsRes) return optsRes.error();
    const CommandOptions& opts = optsRes.value();

    if (opts.format == OutputFormat::Json && !opts.assumeYes) {
        return reportSystemError(Messages::JSON_FORMAT_REQUIRE_ASSUME_YES, {}, opts.format);
    }

    OperationRequest request;
    request.action = action;
    request.requestedNames = opts.positional;
    request.assumeYes = opts.assumeYes;
    request.allowBeta = opts.beta || ctx.config.allowBeta;
    request.format = opts.format;

    auto lock = acquireLock(ctx, actionVerb(action), opts.format);
    if (!lock) return lock.error();

    auto stateRes = ctx.store->load();
    if (!stateRes) return stateRes.error();

    ServiceResolver resolver(*ctx.catalog, *ctx.backend);
    auto resolved = resolver.resolve(request, stateRes.value());
    if (!resolved) return resolved.error();
    Resolution& res = resolved.value();

    if (res.stateChanged) {
        auto saved = ctx.store->save(res.state);
        if (!saved) return saved.error();
    }
    if (!res.result.processedServices.empty() && Platform::rebootRequired(ctx.config.rebootRequiredFile)) {
        res.result.needsReboot = true;
    }
    return finish(res.result, action, opts.format, ctx);
}

AttachmentState newAttachment(const AppContext& ctx, const std::string& token, const Contract& contract) {
    AttachmentState state;
    state.attached = true;
    state.contractName = contract.name;
    state.token = token;
    state.machineId = Platform::machineId(ctx.config.dataDir);
    state.attachedAt = utcNow();
    state.entitlements.insert(contract.entitlements.begin(), contract.entitlements.end());
    return state;
}

ExecutionReport enableDefaults(const AppContext& ctx, const Contract& contract, AttachmentState& state) {
    std::vector<std::string> defaults;
    for (const auto& svc : ctx.catalog->enableOrder()) {
        if (std::find(contract.enableByDefault.begin(), contract.enableByDefault.end(), svc) !=
            contract.enableByDefault.end()) {
            defaults.push_back(svc);
        }
    }
    ExecutionOptions execOpts;
    execOpts.assumeYes = true;
    execOpts.skipUnavailable = true;
    ActionExecutor executor(*ctx.catalog, *ctx.backend);
    return executor.execute(Action::Enable, defaults, state, execOpts);
}

ExecutionReport disableAll(const AppContext& ctx, AttachmentState& state) {
    std::vector<std::string> enabled;
    for (const auto& svc : ctx.catalog->disableOrder()) {
        if (state.isEnabled(svc)) enabled.push_back(svc);
    }
    ExecutionOptions execOpts;
    execOpts.assumeYes = true;
    ActionExecutor executor(*ctx.catalog, *ctx.backend);
    return executor.execute(Action::Disable, enabled, state, execOpts);
}

std::string utcNow() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return os.str();
}

}
