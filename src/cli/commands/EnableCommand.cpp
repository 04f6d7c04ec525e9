#include "cli/commands/EnableCommand.hpp"

#include "cli/commands/CommandSupport.hpp"

namespace proclient {

Expected<void> EnableCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    return CommandSupport::runServiceBatch(Action::Enable, ctx, args);
}

}
