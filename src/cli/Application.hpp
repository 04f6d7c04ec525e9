#pragma once

#include <functional>
#include <string>
#include <vector>

#include "core/Config.hpp"

namespace proclient {

/**
 * @brief Process-level driver behind main()
 *
 * Order of work: privilege check, config load, logging setup, context
 * wiring, dispatch. A non-root caller is turned away before the config
 * file is read, so a broken or unreadable config never masks the
 * privilege message.
 */
class Application {
public:
    explicit Application(std::function<bool()> isRoot);

    /// Run one command line (arguments after the program name); returns the exit status
    int run(const std::vector<std::string>& args);

    /// Apply log level and file sink from @p config; false if the log file could not be opened
    static bool configureLogging(const Config& config);

private:
    std::function<bool()> isRoot;
};

}
