#include "util/Logger.hpp"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace proclient {

static std::string utcTimestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return os.str();
}

LogLevel Logger::parseLevel(const std::string& v, LogLevel fallback) {
    if (v == "debug" || v == "DEBUG" || v == "3") return LogLevel::Debug;
    if (v == "info" || v == "INFO" || v == "2") return LogLevel::Info;
    if (v == "warn" || v == "warning" || v == "WARNING" || v == "1") return LogLevel::Warn;
    if (v == "error" || v == "ERROR" || v == "0") return LogLevel::Error;
    return fallback;
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "error";
        case LogLevel::Warn: return "warn ";
        case LogLevel::Info: return "info ";
        case LogLevel::Debug: return "debug";
    }
    return "info ";
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::Logger() : currentLevel(LogLevel::Debug) {
    const char* env = std::getenv("PRO_LOG");
    if (env) {
        currentLevel = parseLevel(env);
        console = true;
    }
}

void Logger::setLevel(LogLevel level) { currentLevel = level; }
LogLevel Logger::level() const { return currentLevel; }
void Logger::setConsole(bool enabled) { console = enabled; }

bool Logger::setLogFile(const std::filesystem::path& path) {
    std::scoped_lock lock(mtx);
    if (file.is_open()) file.close();
    if (path.empty()) return true;
    file.open(path, std::ios::app);
    return file.is_open();
}

void Logger::write(LogLevel lvl, const std::string& msg) {
    if (currentLevel < lvl) return;
    std::scoped_lock lock(mtx);
    if (file.is_open()) {
        file << utcTimestamp() << " [" << levelName(lvl) << "] " << msg << "\n";
        file.flush();
    }
    if (console) std::cerr << "[" << levelName(lvl) << "] " << msg << "\n";
}

void Logger::error(const std::string& msg) { write(LogLevel::Error, msg); }
void Logger::warn(const std::string& msg) { write(LogLevel::Warn, msg); }
void Logger::info(const std::string& msg) { write(LogLevel::Info, msg); }
void Logger::debug(const std::string& msg) { write(LogLevel::Debug, msg); }

}
