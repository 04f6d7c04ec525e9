#pragma once

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace proclient {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/**
 * @brief Process-wide diagnostic logger
 *
 * Writes timestamped lines to the configured log file. Console output
 * (stderr) is only enabled when PRO_LOG is set, so rendered command
 * output on stdout stays machine-readable.
 */
class Logger {
public:
    static Logger& instance();

    /// Parse "debug|info|warn|error" or "0..3"; unknown strings give Info
    static LogLevel parseLevel(const std::string& text, LogLevel fallback = LogLevel::Info);
    static const char* levelName(LogLevel level);

    void setLevel(LogLevel level);
    LogLevel level() const;

    /// Attach the file sink; returns false if the file can't be opened
    bool setLogFile(const std::filesystem::path& path);
    void setConsole(bool enabled);
    bool consoleEnabled() const { return console; }

    void error(const std::string& msg);
    void warn(const std::string& msg);
    void info(const std::string& msg);
    void debug(const std::string& msg);

private:
    Logger();
    void write(LogLevel lvl, const std::string& msg);

    LogLevel currentLevel;
    bool console{false};
    std::ofstream file;
    std::mutex mtx;
};

}
