#pragma once

#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

#include "core/HelpQuery.hpp"
#include "core/Operation.hpp"
#include "core/ServiceCatalog.hpp"

namespace proclient {

/**
 * @brief Serializes results for humans (text) or machines (JSON)
 *
 * Operation JSON:
 *   {"_schema_version": "0.1", "result": "success"|"failure",
 *    "processed_services": [...], "failed_services": [...],
 *    "errors": [{"message", "message_code", "service", "type"}],
 *    "warnings": [same shape], "needs_reboot": bool}
 */
namespace OutputRenderer {

nlohmann::json errorToJson(const ErrorEntry& entry);
nlohmann::json toJson(const OperationResult& result);
nlohmann::json helpToJson(const ServiceHelp& help);

/// JSON document on one line, followed by a newline
void renderJson(const OperationResult& result, std::ostream& out);

/**
 * @brief Human-readable rendering
 *
 * One "<Title> enabled|disabled" line per processed service on @p out,
 * warnings and errors (blank-line separated) on @p err, then the reboot
 * notice if needed.
 */
void renderText(const OperationResult& result, Action action, const ServiceCatalog& catalog,
                std::ostream& out, std::ostream& err);

void renderHelp(const ServiceHelp& help, OutputFormat format, std::ostream& out);

}

}
