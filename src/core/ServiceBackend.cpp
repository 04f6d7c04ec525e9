#include "core/ServiceBackend.hpp"

#include <utility>

#include "core/Messages.hpp"
#include "util/Logger.hpp"

namespace proclient {

namespace {

ServiceActionOutcome failure(const Service& service, const NamedMessage& msg, std::map<std::string, std::string> args) {
    args.emplace("title", service.title);
    ServiceActionOutcome out;
    out.status = ServiceStatus::Failure;
    out.error = ErrorEntry{Messages::format(msg.text, args), msg.code, service.name, ErrorType::Service};
    return out;
}

ErrorEntry warning(const Service& subject, const NamedMessage& msg) {
    return ErrorEntry{Messages::format(msg.text, {{"title", subject.title}}), msg.code, subject.name, ErrorType::Service};
}

// Carry a nested failure up, attributed to the service the caller asked for
ServiceActionOutcome propagate(const Service& service, ServiceActionOutcome nested) {
    nested.status = ServiceStatus::Failure;
    if (nested.error) nested.error->service = service.name;
    return nested;
}

}

StateServiceBackend::StateServiceBackend(const ServiceCatalog& catalog, std::string series)
    : catalog(catalog), series(std::move(series)) {}

ServiceActionOutcome StateServiceBackend::enable(const Service& service, AttachmentState& state, const ExecutionOptions& opts) {
    if (!service.availableOn(series)) {
        if (opts.skipUnavailable) {
            Logger::instance().debug("Skipping " + service.name + ": not available on " + series);
            ServiceActionOutcome skipped;
            skipped.status = ServiceStatus::Skipped;
            return skipped;
        }
        return failure(service, Messages::SERVICE_NOT_AVAILABLE, {{"series", series}});
    }
    if (!state.isEntitled(service.name)) {
        return failure(service, Messages::SERVICE_NOT_ENTITLED, {});
    }
    if (state.isEnabled(service.name)) {
        return failure(service, Messages::SERVICE_ALREADY_ENABLED, {});
    }

    // Without consent, refuse before touching anything
    if (!opts.assumeYes) {
        for (const auto& req : service.requiredServices) {
            if (!state.isEnabled(req)) {
                const Service* r = catalog.find(req);
                return failure(service, Messages::REQUIRED_SERVICE_DISABLED, {{"other", r ? r->title : req}});
            }
        }
    }

    ServiceActionOutcome out;
    for (const auto& req : service.requiredServices) {
        if (state.isEnabled(req)) continue;
        const Service* r = catalog.find(req);
        if (!r) continue;
        ExecutionOptions nestedOpts = opts;
        nestedOpts.skipUnavailable = false;
        auto nested = enable(*r, state, nestedOpts);
        out.warnings.insert(out.warnings.end(), nested.warnings.begin(), nested.warnings.end());
        out.sideEffects.insert(out.sideEffects.end(), nested.sideEffects.begin(), nested.sideEffects.end());
        if (nested.status != ServiceStatus::Success) {
            nested.warnings = out.warnings;
            nested.sideEffects = out.sideEffects;
            return propagate(service, std::move(nested));
        }
        out.warnings.push_back(warning(*r, Messages::ENABLING_REQUIRED_SERVICE));
        out.sideEffects.push_back(r->name);
        out.needsReboot = out.needsReboot || nested.needsReboot;
    }

    state.enabledServices.insert(service.name);
    Logger::instance().info("Enabled " + service.name);
    out.status = ServiceStatus::Success;
    out.needsReboot = out.needsReboot || service.requiresReboot;
    return out;
}

ServiceActionOutcome StateServiceBackend::disable(const Service& service, AttachmentState& state, const ExecutionOptions& opts) {
    if (!state.isEnabled(service.name)) {
        return failure(service, Messages::SERVICE_ALREADY_DISABLED, {});
    }

    std::vector<std::string> enabledDependents;
    for (const auto& dep : catalog.dependentServices(service.name)) {
        if (state.isEnabled(dep)) enabledDependents.push_back(dep);
    }
    if (!opts.assumeYes && !enabledDependents.empty()) {
        const Service* d = catalog.find(enabledDependents.front());
        return failure(service, Messages::DEPENDENT_SERVICE_ENABLED, {{"other", d ? d->title : enabledDependents.front()}});
    }

    ServiceActionOutcome out;
    for (const auto& dep : enabledDependents) {
        const Service* d = catalog.find(dep);
        if (!d || !state.isEnabled(dep)) continue;
        auto nested = disable(*d, state, opts);
        out.warnings.insert(out.warnings.end(), nested.warnings.begin(), nested.warnings.end());
        out.sideEffects.insert(out.sideEffects.end(), nested.sideEffects.begin(), nested.sideEffects.end());
        if (nested.status != ServiceStatus::Success) {
            nested.warnings = out.warnings;
            nested.sideEffects = out.sideEffects;
            return propagate(service, std::move(nested));
        }
        out.warnings.push_back(warning(*d, Messages::DISABLING_DEPENDENT_SERVICE));
        out.sideEffects.push_back(d->name);
    }

    state.enabledServices.erase(service.name);
    Logger::instance().info("Disabled " + service.name);
    out.status = ServiceStatus::Success;
    return out;
}

}
