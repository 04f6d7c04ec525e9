#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/AttachmentState.hpp"
#include "core/Operation.hpp"
#include "core/RequestValidator.hpp"

namespace proclient {

/// Exactly one class per request; decides the message code
enum class RequestClass {
    AllUnknown,          // no known names
    AllKnownUnattached,  // only known names, machine unattached
    Mixed,               // known and unknown names, machine unattached
    AttachedExecution    // proceeds to per-service execution
};

/**
 * @brief Machine-level check run before any per-service work
 *
 * When the request is blocked, the whole batch is rejected with one
 * synthesized system error; no per-service outcome exists.
 */
namespace PreconditionGate {

RequestClass classify(Action action, const AttachmentState& state, const NamePartition& names);

/// Blocking batch error, or nullopt when execution may proceed
std::optional<ErrorEntry> check(Action action, const AttachmentState& state, const NamePartition& names);

/// One "Cannot <action> unknown service" clause per name, joined
ErrorEntry unknownServicesError(Action action, const std::vector<std::string>& unknown);

/// Unknown clauses (if any) followed by one subscription clause per known name
ErrorEntry unattachedError(Action action, const NamePartition& names);

}

}
