#pragma once

#include <string>
#include <vector>

#include "core/Operation.hpp"
#include "core/ServiceCatalog.hpp"
#include "util/Expected.hpp"

namespace proclient {

/// Requested names split against the catalog, each list in request order
struct NamePartition {
    std::vector<std::string> known;
    std::vector<std::string> unknown;
};

namespace RequestValidator {

/// Remove repeated names, keeping the first occurrence of each
std::vector<std::string> dedupe(const std::vector<std::string>& names);

/**
 * @brief Split names into known and unknown
 *
 * Exact, case-sensitive match. Beta services count as unknown unless
 * @p allowBeta is set.
 */
NamePartition partition(const std::vector<std::string>& names, const ServiceCatalog& catalog, bool allowBeta);

/// Dedupe the request's names; an empty list is an InvalidArgs error
Expected<std::vector<std::string>> normalize(const OperationRequest& request);

}

}
