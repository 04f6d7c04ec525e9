#include "core/ActionExecutor.hpp"

#include <unordered_set>

#include "util/Logger.hpp"

namespace proclient {

ActionExecutor::ActionExecutor(const ServiceCatalog& catalog, IServiceBackend& backend)
    : catalog(catalog), backend(backend) {}

ExecutionReport ActionExecutor::execute(Action action, const std::vector<std::string>& known, AttachmentState& state,
                                        const ExecutionOptions& opts) const {
    ExecutionReport report;
    std::unordered_set<std::string> handled;

    for (const auto& name : known) {
        const Service* svc = catalog.find(name);
        if (!svc) continue;

        if (handled.count(name)) {
            Logger::instance().debug(name + " already handled earlier in this batch");
            report.outcomes.push_back({name, ServiceStatus::Success});
            continue;
        }

        Logger::instance().debug(std::string("Attempting to ") + actionVerb(action) + " " + name);
        ServiceActionOutcome out = action == Action::Disable ? backend.disable(*svc, state, opts)
                                                             : backend.enable(*svc, state, opts);

        report.warnings.insert(report.warnings.end(), out.warnings.begin(), out.warnings.end());
        handled.insert(out.sideEffects.begin(), out.sideEffects.end());
        report.needsReboot = report.needsReboot || out.needsReboot;

        if (out.status == ServiceStatus::Failure) {
            Logger::instance().warn(std::string("Failed to ") + actionVerb(action) + " " + name +
                                    (out.error ? ": " + out.error->message : std::string()));
            if (out.error) report.errors.push_back(*out.error);
        }
        report.outcomes.push_back({name, out.status});
        handled.insert(name);
    }
    return report;
}

}
