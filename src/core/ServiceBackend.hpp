#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/AttachmentState.hpp"
#include "core/Operation.hpp"
#include "core/ServiceCatalog.hpp"

namespace proclient {

struct ExecutionOptions {
    bool assumeYes{false};
    bool skipUnavailable{false};  // Unavailable services are skipped instead of failing
};

/**
 * @brief Result of one enable/disable attempt on one service
 *
 * sideEffects lists other services enabled/disabled on the way (required
 * or dependent services), in the order they were handled.
 */
struct ServiceActionOutcome {
    ServiceStatus status{ServiceStatus::Failure};
    std::optional<ErrorEntry> error;
    bool needsReboot{false};
    std::vector<ErrorEntry> warnings;
    std::vector<std::string> sideEffects;
};

/**
 * @brief Strategy performing the lifecycle action for one service
 *
 * Implementations mutate only the AttachmentState they are handed.
 */
class IServiceBackend {
public:
    virtual ~IServiceBackend() = default;
    virtual ServiceActionOutcome enable(const Service& service, AttachmentState& state, const ExecutionOptions& opts) = 0;
    virtual ServiceActionOutcome disable(const Service& service, AttachmentState& state, const ExecutionOptions& opts) = 0;
};

/**
 * @brief Backend that records enablement in the attachment state
 *
 * Installs nothing. Checks availability on the current series, the
 * entitlement, the current enablement, and required/dependent services.
 */
class StateServiceBackend : public IServiceBackend {
public:
    StateServiceBackend(const ServiceCatalog& catalog, std::string series);

    ServiceActionOutcome enable(const Service& service, AttachmentState& state, const ExecutionOptions& opts) override;
    ServiceActionOutcome disable(const Service& service, AttachmentState& state, const ExecutionOptions& opts) override;

private:
    const ServiceCatalog& catalog;
    std::string series;
};

}
