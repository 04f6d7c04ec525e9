#include "cli/Application.hpp"

#include <iostream>
#include <utility>

#include "cli/AppContext.hpp"
#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "core/Messages.hpp"
#include "util/Logger.hpp"

namespace proclient {

Application::Application(std::function<bool()> isRoot) : isRoot(std::move(isRoot)) {}

bool Application::configureLogging(const Config& config) {
    auto& log = Logger::instance();
    if (!log.consoleEnabled()) {
        log.setLevel(Logger::parseLevel(config.logLevel, LogLevel::Debug));
    }
    // Unprivileged runs can't open the system log; keep going without it
    if (!log.setLogFile(config.logFile)) {
        log.debug("Could not open log file " + config.logFile.string());
        return false;
    }
    return true;
}

int Application::run(const std::vector<std::string>& args) {
    if (!isRoot || !isRoot()) {
        std::cerr << Messages::NONROOT_USER << "\n";
        return 1;
    }

    auto cfg = Config::load();
    if (!cfg) {
        std::cerr << cfg.error().message << "\n";
        return 1;
    }
    configureLogging(cfg.value());

    AppContext ctx = AppContext::fromConfig(cfg.value());
    ctx.isRoot = isRoot;
    CommandInvoker invoker;
    auto& factory = CommandFactory::instance();
    if (args.empty()) {
        auto help = factory.create("help");
        if (!help) return 1;
        return invoker.invoke(*help, ctx, {}) ? 0 : 1;
    }

    const std::string& cmdName = args.front();
    std::vector<std::string> rest(args.begin() + 1, args.end());
    auto cmd = factory.create(cmdName);
    if (!cmd) {
        std::cerr << "Unknown command: " << cmdName << "\n";
        auto help = factory.create("help");
        if (help && !invoker.invoke(*help, ctx, {})) {
            Logger::instance().debug("Could not show usage after unknown command " + cmdName);
        }
        return 1;
    }
    return invoker.invoke(*cmd, ctx, rest) ? 0 : 1;
}

}
