#include "cli/CommandInvoker.hpp"

#include <iostream>

#include "core/Messages.hpp"
#include "util/Logger.hpp"

namespace proclient {

Expected<void> CommandInvoker::invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args) {
    if (!ctx.isRoot || !ctx.isRoot()) {
        std::cerr << Messages::NONROOT_USER << "\n";
        return Error{ErrorCode::PermissionDenied, Messages::NONROOT_USER};
    }

    Logger::instance().debug(std::string("Executing command: ") + cmd.name());
    auto res = cmd.execute(ctx, args);
    if (!res) {
        const auto& msg = res.error().message;
        Logger::instance().error(std::string(cmd.name()) + ": " + (msg.empty() ? "operation failed" : msg));
        if (!msg.empty()) std::cerr << msg << "\n";
        return res;
    }
    return {};
}

}
