#pragma once

#include <filesystem>
#include <string>

#include "util/Expected.hpp"

namespace proclient {

/**
 * @brief Client configuration
 *
 * Resolution order per key: built-in default, then the YAML config file,
 * then UA_* environment overrides.
 *
 * Config file (YAML):
 *   data_dir: /var/lib/ubuntu-advantage
 *   log_file: /var/log/ubuntu-advantage.log
 *   log_level: debug
 *   contract_file: /var/lib/ubuntu-advantage/contracts.json
 *   os_release_file: /etc/os-release
 *   reboot_required_file: /var/run/reboot-required
 *   features:
 *     allow_beta: false
 */
struct Config {
    std::filesystem::path configFile;
    std::filesystem::path dataDir;
    std::filesystem::path logFile;
    std::string logLevel{"debug"};
    std::filesystem::path contractFile;
    std::filesystem::path osReleaseFile;
    std::filesystem::path rebootRequiredFile;
    bool allowBeta{false};

    std::filesystem::path lockFile() const;

    /// Built-in defaults only
    static Config defaults();

    /**
     * @brief Load configuration
     * @param path Config file; empty means UA_CONFIG_FILE or the default path
     *
     * A missing file is not an error. A file that is not valid YAML, or
     * whose values have the wrong type, yields InvalidArgs.
     */
    static Expected<Config> load(const std::filesystem::path& path = {});

    /// Parse YAML text on top of defaults (no environment overrides)
    static Expected<Config> parse(const std::string& yaml, const std::filesystem::path& source = {});

    /// Apply UA_DATA_DIR, UA_LOG_FILE, UA_LOG_LEVEL, UA_FEATURES_ALLOW_BETA
    void applyEnvironment();
};

/// "true", "yes", "1" (any case) are truthy
bool isTruthy(const std::string& value);

}
