#pragma once

#include <filesystem>
#include <map>
#include <string>

#include "util/Expected.hpp"

namespace proclient {

/**
 * @brief Facts about the running system that gate service availability
 */
struct PlatformInfo {
    std::string distribution{"UNKNOWN"};
    std::string version;   // e.g. "22.04 LTS (Jammy Jellyfish)"
    std::string release;   // e.g. "22.04"
    std::string series;    // e.g. "jammy"
};

namespace Platform {

/// Parse KEY=value lines of an os-release file, stripping quotes
std::map<std::string, std::string> parseOsRelease(const std::string& content);

/**
 * @brief Load platform info from an os-release file
 *
 * Series comes from VERSION_CODENAME, else from the parenthesised codename
 * in VERSION ("22.04 LTS (Jammy Jellyfish)" -> "jammy"). A missing file or
 * unparseable version yields series "unknown".
 */
PlatformInfo detect(const std::filesystem::path& osReleaseFile);

/**
 * @brief Stable identifier of this machine
 *
 * First non-empty of /etc/machine-id, /var/lib/dbus/machine-id and
 * <dataDir>/machine-id; otherwise a random id is generated and stored in
 * <dataDir>/machine-id.
 */
std::string machineId(const std::filesystem::path& dataDir);

/// True if the reboot-required marker file exists
bool rebootRequired(const std::filesystem::path& markerFile);

}

}
