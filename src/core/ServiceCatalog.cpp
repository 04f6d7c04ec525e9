#include "core/ServiceCatalog.hpp"

#include <algorithm>
#include <utility>

namespace proclient {

namespace {

std::map<std::string, bool> releases(bool xenial, bool bionic, bool focal, bool jammy, bool kinetic) {
    return {
        {"xenial", xenial},
        {"bionic", bionic},
        {"focal", focal},
        {"jammy", jammy},
        {"kinetic", kinetic},
    };
}

std::vector<Service> builtinServices() {
    std::vector<Service> s;

    s.push_back({"cc-eal", "CC EAL2", "Common Criteria EAL2 Provisioning Packages",
        "Common Criteria is an Information Technology Security Evaluation standard "
        "(ISO/IEC IS 15408) for computer security certification. Ubuntu 16.04 LTS "
        "and 18.04 LTS have been certified at EAL2. Enabling this service provides "
        "the provisioning packages needed to configure a machine to the evaluated "
        "configuration. You can find out more at https://ubuntu.com/security/certifications#cc",
        releases(true, true, false, false, false), false, false, {}});

    s.push_back({"cis", "CIS Audit", "Security compliance and audit tools",
        "Center for Internet Security Audit Tools are tools for auditing and "
        "hardening a system against the CIS benchmarks. You can find out more "
        "at https://ubuntu.com/security/certifications/docs/usg",
        releases(true, true, true, false, false), false, false, {}});

    s.push_back({"esm-apps", "ESM Apps", "Expanded Security Maintenance for Applications",
        "Expanded Security Maintenance for Applications is enabled by default on "
        "entitled workloads. It provides access to a private PPA which includes "
        "available high and critical CVE fixes for Ubuntu LTS packages in the "
        "Ubuntu Main and Ubuntu Universe repositories from the Ubuntu LTS release "
        "date until its end of life. You can find out more about the service at "
        "https://ubuntu.com/security/esm",
        releases(true, true, true, true, false), false, false, {}});

    s.push_back({"esm-infra", "ESM Infra", "Expanded Security Maintenance for Infrastructure",
        "Expanded Security Maintenance for Infrastructure provides access to a "
        "private PPA which includes available high and critical CVE fixes for "
        "Ubuntu LTS packages in the Ubuntu Main repository between the end of the "
        "standard Ubuntu LTS security maintenance and its end of life. It is "
        "enabled by default with Ubuntu Pro. You can find out more about the "
        "service at https://ubuntu.com/security/esm",
        releases(true, true, true, true, false), false, false, {}});

    s.push_back({"fips", "FIPS", "NIST-certified core packages",
        "Installs FIPS 140 crypto packages for FedRAMP, FISMA and compliance use "
        "cases. Note that \"fips\" does not provide security patching. For FIPS "
        "certified modules with security patches please see \"fips-updates\". You "
        "can find out more at https://ubuntu.com/security/fips",
        releases(true, true, true, false, false), false, true, {}});

    s.push_back({"fips-updates", "FIPS Updates", "NIST-certified core packages with priority security updates",
        "Installs FIPS 140 crypto packages including all security patches for "
        "those modules that have been provided since their certification date. "
        "You can find out more at https://ubuntu.com/security/fips",
        releases(true, true, true, false, false), false, true, {}});

    s.push_back({"livepatch", "Livepatch", "Canonical Livepatch service",
        "Livepatch provides selected high and critical kernel CVE fixes and other "
        "non-security bug fixes as kernel livepatches. Livepatches are applied "
        "without rebooting a machine which drastically limits the need for "
        "unscheduled system reboots. You can find out more about the service at "
        "https://ubuntu.com/security/livepatch",
        releases(true, true, true, true, false), false, false, {}});

    s.push_back({"realtime-kernel", "Real-Time Kernel", "Ubuntu kernel with PREEMPT_RT patches integrated",
        "The Real-time kernel is an Ubuntu kernel with PREEMPT_RT patches "
        "integrated. It services latency-dependent use cases by providing "
        "deterministic response times. You can find out more at "
        "https://ubuntu.com/realtime-kernel",
        releases(false, false, false, true, false), true, true, {}});

    s.push_back({"ros", "ROS ESM Security Updates", "Security Updates for the Robot Operating System",
        "ros provides access to a private PPA which includes security-related "
        "updates for available high and critical CVE fixes for Robot Operating "
        "System (ROS) packages. For access to ROS ESM and security updates, both "
        "esm-infra and esm-apps services will also be enabled. You can find out "
        "more about the service at https://ubuntu.com/robotics/ros-esm",
        releases(true, true, true, false, false), true, false, {"esm-apps", "esm-infra"}});

    s.push_back({"ros-updates", "ROS ESM All Updates", "All Updates for the Robot Operating System",
        "ros-updates provides access to a private PPA that includes non-security "
        "related updates for Robot Operating System (ROS) packages. For full "
        "access to ROS ESM, security and non-security updates, the esm-infra, "
        "esm-apps, and ros services will also be enabled. You can find out more "
        "about the service at https://ubuntu.com/robotics/ros-esm",
        releases(true, true, true, false, false), true, false, {"ros"}});

    return s;
}

}

bool Service::availableOn(const std::string& series) const {
    auto it = availableByRelease.find(series);
    return it != availableByRelease.end() && it->second;
}

const ServiceCatalog& ServiceCatalog::builtin() {
    static const ServiceCatalog catalog(builtinServices());
    return catalog;
}

ServiceCatalog::ServiceCatalog(std::vector<Service> services) : entries(std::move(services)) {
    for (size_t i = 0; i < entries.size(); ++i) {
        byName.emplace(entries[i].name, i);
    }
}

const Service* ServiceCatalog::find(const std::string& name) const {
    auto it = byName.find(name);
    if (it == byName.end()) return nullptr;
    return &entries[it->second];
}

std::vector<std::string> ServiceCatalog::dependentServices(const std::string& name) const {
    std::vector<std::string> out;
    for (const auto& svc : entries) {
        if (std::find(svc.requiredServices.begin(), svc.requiredServices.end(), name) != svc.requiredServices.end()) {
            out.push_back(svc.name);
        }
    }
    return out;
}

std::vector<std::string> ServiceCatalog::validServices(bool allowBeta) const {
    std::vector<std::string> names;
    for (const auto& svc : entries) {
        if (svc.isBeta && !allowBeta) continue;
        names.push_back(svc.name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

// Depth-first: emit prerequisites (required or dependent services) before the service itself
void ServiceCatalog::visit(const std::string& name, bool byRequired, std::map<std::string, bool>& visited,
                           std::vector<std::string>& order) const {
    if (visited.count(name)) return;
    visited[name] = true;
    const Service* svc = find(name);
    if (!svc) return;
    std::vector<std::string> edges = byRequired ? svc->requiredServices : dependentServices(name);
    for (const auto& next : edges) {
        visit(next, byRequired, visited, order);
    }
    order.push_back(name);
}

std::vector<std::string> ServiceCatalog::enableOrder() const {
    std::vector<std::string> order;
    std::map<std::string, bool> visited;
    for (const auto& svc : entries) visit(svc.name, true, visited, order);
    return order;
}

std::vector<std::string> ServiceCatalog::disableOrder() const {
    std::vector<std::string> order;
    std::map<std::string, bool> visited;
    for (const auto& svc : entries) visit(svc.name, false, visited, order);
    return order;
}

}
