#include "core/ContractSource.hpp"

#include <nlohmann/json.hpp>

#include "core/Messages.hpp"
#include "util/FileUtil.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace proclient {

Expected<Contract> FileContractSource::lookup(const std::string& token) const {
    std::error_code ec;
    if (!fs::exists(file, ec)) {
        Logger::instance().warn("Contract file " + file.string() + " does not exist");
        return Error{ErrorCode::InvalidToken, Messages::INVALID_TOKEN.text};
    }
    auto content = FileUtil::readFile(file);
    if (!content) return content.error();

    try {
        json j = json::parse(content.value());
        if (!j.is_object() || !j.contains(token) || !j.at(token).is_object()) {
            Logger::instance().debug("Token not found in " + file.string());
            return Error{ErrorCode::InvalidToken, Messages::INVALID_TOKEN.text};
        }
        const json& entry = j.at(token);
        Contract c;
        c.name = entry.value("name", "");
        c.entitlements = entry.value("entitlements", std::vector<std::string>{});
        c.enableByDefault = entry.value("enable_by_default", std::vector<std::string>{});
        return c;
    } catch (const json::exception& e) {
        return Error{ErrorCode::CorruptState, "Invalid contract file " + file.string() + ": " + e.what()};
    }
}

Expected<std::string> FileContractSource::autoAttachToken() const {
    std::error_code ec;
    if (!fs::exists(file, ec)) {
        return Error{ErrorCode::InvalidToken, Messages::UNSUPPORTED_AUTO_ATTACH.text};
    }
    auto content = FileUtil::readFile(file);
    if (!content) return content.error();

    try {
        json j = json::parse(content.value());
        if (!j.is_object() || !j.contains("auto_attach_token") || !j.at("auto_attach_token").is_string()) {
            Logger::instance().debug("No auto-attach token in " + file.string());
            return Error{ErrorCode::InvalidToken, Messages::UNSUPPORTED_AUTO_ATTACH.text};
        }
        return j.at("auto_attach_token").get<std::string>();
    } catch (const json::exception& e) {
        return Error{ErrorCode::CorruptState, "Invalid contract file " + file.string() + ": " + e.what()};
    }
}

Expected<Contract> MemoryContractSource::lookup(const std::string& token) const {
    auto it = contracts.find(token);
    if (it == contracts.end()) return Error{ErrorCode::InvalidToken, Messages::INVALID_TOKEN.text};
    return it->second;
}

Expected<std::string> MemoryContractSource::autoAttachToken() const {
    if (autoToken.empty()) return Error{ErrorCode::InvalidToken, Messages::UNSUPPORTED_AUTO_ATTACH.text};
    return autoToken;
}

}
