#pragma once

#include "core/ActionExecutor.hpp"
#include "core/AttachmentState.hpp"
#include "core/Operation.hpp"
#include "core/RequestValidator.hpp"
#include "core/ServiceBackend.hpp"
#include "core/ServiceCatalog.hpp"
#include "util/Expected.hpp"

namespace proclient {

/// Outcome of resolving one request: the report plus the state to persist
struct Resolution {
    OperationResult result;
    AttachmentState state;
    bool stateChanged{false};
};

/**
 * @brief Entitlement resolution for a batch of service names
 *
 * Flow: validator -> precondition gate -> (blocked: one batch error)
 * else executor -> aggregation. Given the same request, state, catalog and
 * a deterministic backend, the result is always the same. The input state
 * is never modified; the caller persists Resolution::state if changed.
 */
class ServiceResolver {
public:
    ServiceResolver(const ServiceCatalog& catalog, IServiceBackend& backend);

    /// InvalidArgs if the request names no service
    Expected<Resolution> resolve(const OperationRequest& request, const AttachmentState& state) const;

    /// Merge the gate's unknown-name error and the executed phase into one report
    static OperationResult aggregate(const std::optional<ErrorEntry>& batchError, const ExecutionReport& report);

private:
    const ServiceCatalog& catalog;
    IServiceBackend& backend;
};

}
