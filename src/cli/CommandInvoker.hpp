#pragma once

#include <vector>

#include "cli/ICommand.hpp"

namespace proclient {

class CommandInvoker {
public:
    /**
     * @brief Run a command after the privilege check
     *
     * Non-root callers are rejected before the command sees the catalog or
     * the attachment state. Non-empty error messages are printed verbatim
     * to stderr; empty ones mean the command already rendered its failure.
     */
    Expected<void> invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args);
};

}
