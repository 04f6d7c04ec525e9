#include "core/OutputRenderer.hpp"

#include "core/Messages.hpp"

using json = nlohmann::json;

namespace proclient::OutputRenderer {

json errorToJson(const ErrorEntry& entry) {
    json j;
    j["message"] = entry.message;
    j["message_code"] = entry.messageCode;
    j["service"] = entry.service ? json(*entry.service) : json(nullptr);
    j["type"] = entry.type == ErrorType::System ? "system" : "service";
    return j;
}

json toJson(const OperationResult& result) {
    json j;
    j["_schema_version"] = result.schemaVersion;
    j["result"] = result.result();
    j["processed_services"] = result.processedServices;
    j["failed_services"] = result.failedServices;
    j["errors"] = json::array();
    for (const auto& e : result.errors) j["errors"].push_back(errorToJson(e));
    j["warnings"] = json::array();
    for (const auto& w : result.warnings) j["warnings"].push_back(errorToJson(w));
    j["needs_reboot"] = result.needsReboot;
    return j;
}

json helpToJson(const ServiceHelp& help) {
    return json{{"name", help.name}, {"available", help.available ? "yes" : "no"}, {"help", help.help}};
}

void renderJson(const OperationResult& result, std::ostream& out) {
    out << toJson(result).dump() << "\n";
}

void renderText(const OperationResult& result, Action action, const ServiceCatalog& catalog,
                std::ostream& out, std::ostream& err) {
    bool disabling = action == Action::Disable || action == Action::Detach;
    const char* tmpl = disabling ? Messages::SERVICE_DISABLED : Messages::SERVICE_ENABLED;
    for (const auto& name : result.processedServices) {
        const Service* svc = catalog.find(name);
        out << Messages::format(tmpl, {{"title", svc ? svc->title : name}}) << "\n";
    }
    for (const auto& w : result.warnings) {
        err << w.message << "\n";
    }
    for (size_t i = 0; i < result.errors.size(); ++i) {
        if (i > 0) err << "\n";
        err << result.errors[i].message << "\n";
    }
    if (result.needsReboot) {
        out << Messages::format(Messages::REBOOT_REQUIRED.text, {{"action", actionVerb(action)}}) << "\n";
    }
}

void renderHelp(const ServiceHelp& help, OutputFormat format, std::ostream& out) {
    if (format == OutputFormat::Json) {
        out << helpToJson(help).dump() << "\n";
        return;
    }
    out << "Name:\n" << help.name << "\n\n";
    out << "Available:\n" << (help.available ? "yes" : "no") << "\n\n";
    out << "Help:\n" << help.help << "\n";
}

}
