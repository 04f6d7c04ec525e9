#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/Constants.hpp"

namespace proclient {

enum class Action { Enable, Disable, Attach, Detach, Refresh };

enum class OutputFormat { Text, Json };

/// Verb as used in messages and on the command line ("enable", ...)
const char* actionVerb(Action action);

/// True for actions that only make sense on an attached machine and
/// operate on a batch of service names
bool actionRequiresAttachment(Action action);

/**
 * @brief One CLI invocation's request
 *
 * requestedNames is de-duplicated (first occurrence wins) by
 * RequestValidator::dedupe before classification.
 */
struct OperationRequest {
    Action action{Action::Enable};
    std::vector<std::string> requestedNames;
    bool assumeYes{false};
    bool allowBeta{false};
    OutputFormat format{OutputFormat::Text};
};

enum class ErrorType { System, Service };

/**
 * @brief Error or warning entry of the structured result
 *
 * service is empty for batch-level (system) entries and rendered as null.
 */
struct ErrorEntry {
    std::string message;
    std::string messageCode;
    std::optional<std::string> service;
    ErrorType type{ErrorType::System};
};

inline bool operator==(const ErrorEntry& a, const ErrorEntry& b) {
    return a.message == b.message && a.messageCode == b.messageCode && a.service == b.service && a.type == b.type;
}

enum class ServiceStatus { Success, Failure, Skipped };

struct ServiceOutcome {
    std::string serviceName;
    ServiceStatus status{ServiceStatus::Skipped};
};

/**
 * @brief Final, immutable report of one operation
 *
 * result() is derived: failure iff errors or failedServices is non-empty.
 */
struct OperationResult {
    std::string schemaVersion{Constants::SCHEMA_VERSION};
    std::vector<std::string> processedServices;
    std::vector<std::string> failedServices;
    std::vector<ErrorEntry> errors;
    std::vector<ErrorEntry> warnings;
    bool needsReboot{false};

    bool succeeded() const { return errors.empty() && failedServices.empty(); }
    const char* result() const { return succeeded() ? "success" : "failure"; }
};

inline bool operator==(const OperationResult& a, const OperationResult& b) {
    return a.schemaVersion == b.schemaVersion && a.processedServices == b.processedServices &&
           a.failedServices == b.failedServices && a.errors == b.errors && a.warnings == b.warnings &&
           a.needsReboot == b.needsReboot;
}

}
