#include "core/PreconditionGate.hpp"

#include <utility>

#include "core/Messages.hpp"

namespace proclient::PreconditionGate {

namespace {

std::vector<std::string> unknownClauses(Action action, const std::vector<std::string>& unknown) {
    std::vector<std::string> clauses;
    for (const auto& name : unknown) {
        clauses.push_back(Messages::format(Messages::INVALID_SERVICE_OR_FAILURE.text,
                                           {{"action", actionVerb(action)}, {"name", name}}));
    }
    return clauses;
}

ErrorEntry systemError(std::string message, const char* code) {
    ErrorEntry e;
    e.message = std::move(message);
    e.messageCode = code;
    e.type = ErrorType::System;
    return e;
}

}

RequestClass classify(Action action, const AttachmentState& state, const NamePartition& names) {
    if (names.known.empty()) return RequestClass::AllUnknown;
    if (actionRequiresAttachment(action) && !state.attached) {
        return names.unknown.empty() ? RequestClass::AllKnownUnattached : RequestClass::Mixed;
    }
    return RequestClass::AttachedExecution;
}

ErrorEntry unknownServicesError(Action action, const std::vector<std::string>& unknown) {
    return systemError(Messages::joinClauses(unknownClauses(action, unknown)),
                       Messages::INVALID_SERVICE_OR_FAILURE.code);
}

ErrorEntry unattachedError(Action action, const NamePartition& names) {
    std::vector<std::string> clauses = unknownClauses(action, names.unknown);
    for (const auto& name : names.known) {
        clauses.push_back(Messages::format(Messages::VALID_SERVICE_FAILURE_UNATTACHED.text, {{"name", name}}));
    }
    const char* code = names.unknown.empty() ? Messages::VALID_SERVICE_FAILURE_UNATTACHED.code
                                             : Messages::MIXED_SERVICES_FAILURE_UNATTACHED.code;
    return systemError(Messages::joinClauses(clauses), code);
}

std::optional<ErrorEntry> check(Action action, const AttachmentState& state, const NamePartition& names) {
    switch (classify(action, state, names)) {
        case RequestClass::AllUnknown:
            return unknownServicesError(action, names.unknown);
        case RequestClass::AllKnownUnattached:
        case RequestClass::Mixed:
            return unattachedError(action, names);
        case RequestClass::AttachedExecution:
            break;
    }
    return std::nullopt;
}

}
