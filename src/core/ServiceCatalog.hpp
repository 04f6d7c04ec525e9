#pragma once

#include <map>
#include <string>
#include <vector>

namespace proclient {

/**
 * @brief Static description of one optional service
 *
 * Immutable once the catalog is built; shared read-only by every command.
 */
struct Service {
    std::string name;                          // Unique key used on the command line (e.g., "esm-infra")
    std::string title;                         // Human-readable title (e.g., "ESM Infra")
    std::string description;                   // One-line summary shown by status
    std::string helpText;                      // Long help shown by `pro help <name>`
    std::map<std::string, bool> availableByRelease;  // Release series -> available
    bool isBeta{false};
    bool requiresReboot{false};                // Enabling needs a reboot to complete
    std::vector<std::string> requiredServices; // Must be enabled before this one

    /// True if the service is offered on @p series (unknown series -> false)
    bool availableOn(const std::string& series) const;
};

/**
 * @brief Fixed, enumerable catalog of services
 *
 * Lookup is exact and case-sensitive. Ordering of the underlying list is
 * the catalog order, used as the tie-break for enable/disable ordering.
 */
class ServiceCatalog {
public:
    /// Catalog shipped with the client
    static const ServiceCatalog& builtin();

    explicit ServiceCatalog(std::vector<Service> services);

    /// Find a service by exact name, nullptr if absent
    const Service* find(const std::string& name) const;

    bool contains(const std::string& name) const { return find(name) != nullptr; }

    const std::vector<Service>& services() const { return entries; }

    /// Services that list @p name in their requiredServices, in catalog order
    std::vector<std::string> dependentServices(const std::string& name) const;

    /// Sorted names, beta services omitted unless @p allowBeta
    std::vector<std::string> validServices(bool allowBeta) const;

    /// All service names, required services before their dependents
    std::vector<std::string> enableOrder() const;

    /// All service names, dependents before the services they require
    std::vector<std::string> disableOrder() const;

private:
    void visit(const std::string& name, bool byRequired, std::map<std::string, bool>& visited,
               std::vector<std::string>& order) const;

    std::vector<Service> entries;
    std::map<std::string, size_t> byName;
};

}
