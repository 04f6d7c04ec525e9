#include "cli/commands/StatusCommand.hpp"

#include <iomanip>
#include <iostream>

#include <nlohmann/json.hpp>

#include "cli/CommandOptions.hpp"
#include "core/Constants.hpp"
#include "core/Messages.hpp"

using json = nlohmann::json;

namespace proclient {

namespace {

struct ServiceRow {
    std::string name;
    bool available{false};
    bool entitled{false};
    std::string status;  // enabled, disabled or n/a
    std::string description;
};

std::vector<ServiceRow> collectRows(const AppContext& ctx, const AttachmentState& state, bool includeBeta) {
    std::vector<ServiceRow> rows;
    for (const auto& name : ctx.catalog->validServices(includeBeta)) {
        const Service* svc = ctx.catalog->find(name);
        ServiceRow row;
        row.name = name;
        row.available = svc->availableOn(ctx.platform.series);
        row.entitled = state.isEntitled(name);
        if (!row.available || !row.entitled) {
            row.status = "n/a";
        } else {
            row.status = state.isEnabled(name) ? "enabled" : "disabled";
        }
        row.description = svc->description;
        rows.push_back(row);
    }
    return rows;
}

void printJson(const AttachmentState& state, const std::vector<ServiceRow>& rows) {
    json j;
    j["_schema_version"] = Constants::SCHEMA_VERSION;
    j["attached"] = state.attached;
    j["contract"] = state.attached ? json(state.contractName) : json(nullptr);
    j["services"] = json::array();
    for (const auto& r : rows) {
        json row = {
            {"name", r.name},
            {"available", r.available ? "yes" : "no"},
            {"entitled", r.entitled ? "yes" : "no"},
            {"status", r.status},
            {"description", r.description},
        };
        j["services"].push_back(row);
    }
    std::cout << j.dump() << "\n";
}

void printText(const AttachmentState& state, const std::vector<ServiceRow>& rows) {
    if (!state.attached) {
        std::cout << std::left << std::setw(18) << "SERVICE" << std::setw(11) << "AVAILABLE" << "DESCRIPTION\n";
        for (const auto& r : rows) {
            std::cout << std::setw(18) << r.name << std::setw(11) << (r.available ? "yes" : "no") << r.description << "\n";
        }
        std::cout << "\n" << Messages::UNATTACHED.text << "\n";
        return;
    }
    std::cout << std::left << std::setw(18) << "SERVICE" << std::setw(10) << "ENTITLED" << std::setw(10) << "STATUS"
              << "DESCRIPTION\n";
    for (const auto& r : rows) {
        std::cout << std::setw(18) << r.name << std::setw(10) << (r.entitled ? "yes" : "no") << std::setw(10)
                  << r.status << r.description << "\n";
    }
    std::cout << "\nSubscription: " << state.contractName << "\n";
}

}

Expected<void> StatusCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    auto optsRes = parseCommandOptions(args, {"--all", "--format"});
    if (!optsRes) return optsRes.error();
    const CommandOptions& opts = optsRes.value();

    auto stateRes = ctx.store->load();
    if (!stateRes) return stateRes.error();

    auto rows = collectRows(ctx, stateRes.value(), opts.all || ctx.config.allowBeta);
    if (opts.format == OutputFormat::Json) {
        printJson(stateRes.value(), rows);
    } else {
        printText(stateRes.value(), rows);
    }
    return {};
}

}
