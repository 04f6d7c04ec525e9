#include "core/RequestValidator.hpp"

#include <unordered_set>

#include "core/Messages.hpp"

namespace proclient::RequestValidator {

std::vector<std::string> dedupe(const std::vector<std::string>& names) {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (const auto& n : names) {
        if (seen.insert(n).second) out.push_back(n);
    }
    return out;
}

NamePartition partition(const std::vector<std::string>& names, const ServiceCatalog& catalog, bool allowBeta) {
    NamePartition p;
    for (const auto& n : names) {
        const Service* svc = catalog.find(n);
        if (svc && (!svc->isBeta || allowBeta)) {
            p.known.push_back(n);
        } else {
            p.unknown.push_back(n);
        }
    }
    return p;
}

Expected<std::vector<std::string>> normalize(const OperationRequest& request) {
    auto names = dedupe(request.requestedNames);
    if (names.empty()) {
        return Error{ErrorCode::InvalidArgs,
                     Messages::format(Messages::SERVICE_NAME_REQUIRED, {{"action", actionVerb(request.action)}})};
    }
    return names;
}

}
