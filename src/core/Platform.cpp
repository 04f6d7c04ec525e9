#include "core/Platform.hpp"

#include <algorithm>
#include <cctype>
#include <random>
#include <regex>
#include <sstream>

#include "core/Constants.hpp"
#include "util/FileUtil.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace proclient::Platform {

static std::string strip(const std::string& s, const char* chars) {
    size_t b = s.find_first_not_of(chars);
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(chars);
    return s.substr(b, e - b + 1);
}

std::map<std::string, std::string> parseOsRelease(const std::string& content) {
    std::map<std::string, std::string> data;
    std::istringstream in(content);
    std::string line;
    while (std::getline(in, line)) {
        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = strip(line.substr(0, eq), " \t");
        std::string value = strip(strip(line.substr(eq + 1), " \t\r"), "\"'");
        if (!key.empty() && !value.empty()) data[key] = value;
    }
    return data;
}

PlatformInfo detect(const fs::path& osReleaseFile) {
    PlatformInfo info;
    info.series = Constants::UNKNOWN_SERIES;

    auto content = FileUtil::readFile(osReleaseFile);
    if (!content) {
        Logger::instance().warn("Could not read " + osReleaseFile.string() + ": " + content.error().message);
        return info;
    }
    auto data = parseOsRelease(content.value());
    if (data.count("NAME")) info.distribution = data["NAME"];

    // Strip an LTS point release (20.04.1 LTS -> 20.04 LTS)
    std::string version = std::regex_replace(data["VERSION"], std::regex(R"(\.\d LTS)"), " LTS");
    info.version = version;

    std::smatch m;
    static const std::regex versionRe(R"((\d+\.\d+) (LTS )?\((\w+).*)");
    if (std::regex_match(version, m, versionRe)) {
        info.release = m[1].str();
        info.series = m[3].str();
    } else if (data.count("VERSION_ID")) {
        info.release = data["VERSION_ID"];
    }
    if (data.count("VERSION_CODENAME")) info.series = data["VERSION_CODENAME"];

    std::transform(info.series.begin(), info.series.end(), info.series.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    Logger::instance().debug("Detected series '" + info.series + "' from " + osReleaseFile.string());
    return info;
}

std::string machineId(const fs::path& dataDir) {
    const fs::path fallback = dataDir / "machine-id";
    for (const fs::path& p : {fs::path("/etc/machine-id"), fs::path("/var/lib/dbus/machine-id"), fallback}) {
        std::error_code ec;
        if (!fs::exists(p, ec)) continue;
        auto content = FileUtil::readFile(p);
        if (!content) continue;
        std::string id = strip(content.value(), " \t\r\n");
        if (!id.empty()) return id;
    }

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);
    std::string id;
    for (int i = 0; i < 32; ++i) id += "0123456789abcdef"[dis(gen)];

    auto res = FileUtil::writeFileAtomic(fallback, id + "\n");
    if (!res) Logger::instance().warn("Could not persist machine id: " + res.error().message);
    return id;
}

bool rebootRequired(const fs::path& markerFile) {
    std::error_code ec;
    return !markerFile.empty() && fs::exists(markerFile, ec);
}

}
