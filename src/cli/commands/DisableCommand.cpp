#include "cli/commands/DisableCommand.hpp"

#include "cli/commands/CommandSupport.hpp"

namespace proclient {

Expected<void> DisableCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    return CommandSupport::runServiceBatch(Action::Disable, ctx, args);
}

}
