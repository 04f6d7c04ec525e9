#include "core/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include <yaml-cpp/yaml.h>

#include "core/Constants.hpp"
#include "util/FileUtil.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace proclient {

bool isTruthy(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v == "true" || v == "yes" || v == "1";
}

fs::path Config::lockFile() const { return dataDir / Constants::LOCK_FILE; }

Config Config::defaults() {
    Config c;
    c.configFile = Constants::DEFAULT_CONFIG_FILE;
    c.dataDir = Constants::DEFAULT_DATA_DIR;
    c.logFile = Constants::DEFAULT_LOG_FILE;
    c.osReleaseFile = Constants::DEFAULT_OS_RELEASE_FILE;
    c.rebootRequiredFile = Constants::DEFAULT_REBOOT_REQUIRED_FILE;
    return c;
}

Expected<Config> Config::parse(const std::string& yaml, const fs::path& source) {
    Config c = defaults();
    if (!source.empty()) c.configFile = source;
    try {
        YAML::Node root = YAML::Load(yaml);
        if (root.IsNull()) {
            c.contractFile = c.dataDir / Constants::CONTRACTS_FILE;
            return c;
        }
        if (!root.IsMap()) {
            return Error{ErrorCode::InvalidArgs, "Invalid configuration in " + c.configFile.string() + ": expected a mapping"};
        }
        if (root["data_dir"]) c.dataDir = root["data_dir"].as<std::string>();
        if (root["log_file"]) c.logFile = root["log_file"].as<std::string>();
        if (root["log_level"]) c.logLevel = root["log_level"].as<std::string>();
        if (root["contract_file"]) c.contractFile = root["contract_file"].as<std::string>();
        if (root["os_release_file"]) c.osReleaseFile = root["os_release_file"].as<std::string>();
        if (root["reboot_required_file"]) c.rebootRequiredFile = root["reboot_required_file"].as<std::string>();
        if (root["features"] && root["features"]["allow_beta"]) {
            c.allowBeta = root["features"]["allow_beta"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        return Error{ErrorCode::InvalidArgs, "Invalid configuration in " + c.configFile.string() + ": " + e.what()};
    }
    if (c.contractFile.empty()) c.contractFile = c.dataDir / Constants::CONTRACTS_FILE;
    return c;
}

void Config::applyEnvironment() {
    bool contractFollowsDataDir = contractFile == dataDir / Constants::CONTRACTS_FILE;
    if (const char* v = std::getenv("UA_DATA_DIR")) {
        dataDir = v;
        if (contractFollowsDataDir) contractFile = dataDir / Constants::CONTRACTS_FILE;
    }
    if (const char* v = std::getenv("UA_LOG_FILE")) logFile = v;
    if (const char* v = std::getenv("UA_LOG_LEVEL")) logLevel = v;
    if (const char* v = std::getenv("UA_FEATURES_ALLOW_BETA")) allowBeta = isTruthy(v);
}

Expected<Config> Config::load(const fs::path& path) {
    fs::path file = path;
    if (file.empty()) {
        const char* env = std::getenv("UA_CONFIG_FILE");
        file = env ? fs::path(env) : fs::path(Constants::DEFAULT_CONFIG_FILE);
    }

    std::string text;
    std::error_code ec;
    if (fs::exists(file, ec)) {
        auto content = FileUtil::readFile(file);
        if (!content) return content.error();
        text = content.value();
    } else {
        Logger::instance().debug("No config file at " + file.string() + ", using defaults");
    }

    auto parsed = parse(text, file);
    if (!parsed) return parsed;
    Config c = parsed.value();
    c.applyEnvironment();
    return c;
}

}
