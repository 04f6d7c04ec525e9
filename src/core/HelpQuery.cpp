#include "core/HelpQuery.hpp"

#include "core/Messages.hpp"

namespace proclient {

Expected<ServiceHelp> queryHelp(const ServiceCatalog& catalog, const std::string& name, const std::string& series) {
    const Service* svc = catalog.find(name);
    if (!svc) {
        return Error{ErrorCode::HelpNotFound, Messages::format(Messages::HELP_NOT_FOUND, {{"name", name}})};
    }
    return ServiceHelp{svc->name, svc->availableOn(series), svc->helpText};
}

}
