#include "core/AttachmentState.hpp"

#include <nlohmann/json.hpp>

#include "core/Constants.hpp"
#include "util/FileUtil.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace proclient {

FileAttachmentStore::FileAttachmentStore(fs::path dataDir)
    : tokenPath(std::move(dataDir) / Constants::MACHINE_TOKEN_FILE) {}

Expected<AttachmentState> FileAttachmentStore::load() const {
    std::error_code ec;
    if (!fs::exists(tokenPath, ec)) {
        return AttachmentState{};
    }
    auto content = FileUtil::readFile(tokenPath);
    if (!content) return content.error();

    AttachmentState state;
    try {
        json j = json::parse(content.value());
        state.attached = j.value("attached", false);
        state.contractName = j.value("contract_name", "");
        state.token = j.value("token", "");
        state.machineId = j.value("machine_id", "");
        state.attachedAt = j.value("attached_at", "");
        if (j.contains("entitlements")) {
            for (const auto& e : j.at("entitlements")) state.entitlements.insert(e.get<std::string>());
        }
        if (j.contains("enabled_services")) {
            for (const auto& e : j.at("enabled_services")) state.enabledServices.insert(e.get<std::string>());
        }
    } catch (const json::exception& e) {
        return Error{ErrorCode::CorruptState, "Invalid machine token file " + tokenPath.string() + ": " + e.what()};
    }
    Logger::instance().debug("Loaded attachment state from " + tokenPath.string());
    return state;
}

Expected<void> FileAttachmentStore::save(const AttachmentState& state) {
    json j;
    j["attached"] = state.attached;
    j["contract_name"] = state.contractName;
    j["token"] = state.token;
    j["machine_id"] = state.machineId;
    j["attached_at"] = state.attachedAt;
    j["entitlements"] = state.entitlements;
    j["enabled_services"] = state.enabledServices;

    auto res = FileUtil::writeFileAtomic(tokenPath, j.dump(2) + "\n", Constants::PRIVATE_FILE_MODE);
    if (!res) return res;
    Logger::instance().debug("Saved attachment state to " + tokenPath.string());
    return {};
}

Expected<void> FileAttachmentStore::clear() {
    Logger::instance().debug("Removing " + tokenPath.string());
    return FileUtil::removeFile(tokenPath);
}

}
