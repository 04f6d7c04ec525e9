#pragma once

/**
 * @brief Fixed strings and defaults used throughout the client
 *
 * Centralizes paths and protocol constants to keep them out of control flow.
 */
namespace proclient {

namespace Constants {
    // Structured result format
    constexpr const char* SCHEMA_VERSION = "0.1";

    // Default locations (overridable by configuration)
    constexpr const char* DEFAULT_CONFIG_FILE = "/etc/ubuntu-advantage/uaclient.conf";
    constexpr const char* DEFAULT_DATA_DIR = "/var/lib/ubuntu-advantage";
    constexpr const char* DEFAULT_LOG_FILE = "/var/log/ubuntu-advantage.log";
    constexpr const char* DEFAULT_OS_RELEASE_FILE = "/etc/os-release";
    constexpr const char* DEFAULT_REBOOT_REQUIRED_FILE = "/var/run/reboot-required";

    // Files under data_dir
    constexpr const char* MACHINE_TOKEN_FILE = "private/machine-token.json";
    constexpr const char* CONTRACTS_FILE = "contracts.json";
    constexpr const char* LOCK_FILE = "lock";

    // Owner-only permissions for files holding the machine token
    constexpr unsigned PRIVATE_FILE_MODE = 0600;

    constexpr const char* UNKNOWN_SERIES = "unknown";
}
}
