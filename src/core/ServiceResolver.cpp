#include "core/ServiceResolver.hpp"

#include "core/PreconditionGate.hpp"
#include "util/Logger.hpp"

namespace proclient {

ServiceResolver::ServiceResolver(const ServiceCatalog& catalog, IServiceBackend& backend)
    : catalog(catalog), backend(backend) {}

OperationResult ServiceResolver::aggregate(const std::optional<ErrorEntry>& batchError, const ExecutionReport& report) {
    OperationResult result;
    if (batchError) result.errors.push_back(*batchError);
    for (const auto& o : report.outcomes) {
        if (o.status == ServiceStatus::Success) {
            result.processedServices.push_back(o.serviceName);
        } else if (o.status == ServiceStatus::Failure) {
            result.failedServices.push_back(o.serviceName);
        }
    }
    result.errors.insert(result.errors.end(), report.errors.begin(), report.errors.end());
    result.warnings = report.warnings;
    result.needsReboot = report.needsReboot;
    return result;
}

Expected<Resolution> ServiceResolver::resolve(const OperationRequest& request, const AttachmentState& state) const {
    auto namesRes = RequestValidator::normalize(request);
    if (!namesRes) return namesRes.error();

    NamePartition names = RequestValidator::partition(namesRes.value(), catalog, request.allowBeta);
    Logger::instance().debug(std::string(actionVerb(request.action)) + ": " + std::to_string(names.known.size()) +
                             " known, " + std::to_string(names.unknown.size()) + " unknown service(s)");

    Resolution res;
    res.state = state;

    if (auto blocked = PreconditionGate::check(request.action, state, names)) {
        Logger::instance().debug("Precondition blocked batch: " + blocked->messageCode);
        res.result = aggregate(blocked, ExecutionReport{});
        return res;
    }

    ExecutionOptions opts;
    opts.assumeYes = request.assumeYes;
    ActionExecutor executor(catalog, backend);
    ExecutionReport report = executor.execute(request.action, names.known, res.state, opts);

    // Unknown names never execute; they still surface as one batch-level error
    std::optional<ErrorEntry> unknownError;
    if (!names.unknown.empty()) unknownError = PreconditionGate::unknownServicesError(request.action, names.unknown);

    res.result = aggregate(unknownError, report);
    res.stateChanged = res.state != state;
    return res;
}

}
