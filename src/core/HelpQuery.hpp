#pragma once

#include <string>

#include "core/ServiceCatalog.hpp"
#include "util/Expected.hpp"

namespace proclient {

struct ServiceHelp {
    std::string name;
    bool available{false};
    std::string help;
};

/**
 * @brief Look up help for one service
 *
 * available reflects catalog data for @p series only, never attachment.
 * Unknown names fail with HelpNotFound ("No help available for '<name>'").
 */
Expected<ServiceHelp> queryHelp(const ServiceCatalog& catalog, const std::string& name, const std::string& series);

}
