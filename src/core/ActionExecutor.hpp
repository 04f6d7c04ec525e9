#pragma once

#include <string>
#include <vector>

#include "core/AttachmentState.hpp"
#include "core/Operation.hpp"
#include "core/ServiceBackend.hpp"
#include "core/ServiceCatalog.hpp"

namespace proclient {

/// Everything the executed phase produced, outcomes in request order
struct ExecutionReport {
    std::vector<ServiceOutcome> outcomes;
    std::vector<ErrorEntry> errors;
    std::vector<ErrorEntry> warnings;
    bool needsReboot{false};
};

/**
 * @brief Applies enable/disable to each eligible service, sequentially
 *
 * No fail-fast: a failure on one service never prevents the next attempt.
 * A requested service already handled as a side effect of an earlier
 * service in the same batch counts as processed.
 */
class ActionExecutor {
public:
    ActionExecutor(const ServiceCatalog& catalog, IServiceBackend& backend);

    ExecutionReport execute(Action action, const std::vector<std::string>& known, AttachmentState& state,
                            const ExecutionOptions& opts) const;

private:
    const ServiceCatalog& catalog;
    IServiceBackend& backend;
};

}
