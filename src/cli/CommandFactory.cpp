#include "cli/CommandFactory.hpp"

#include <algorithm>

#include "cli/commands/AttachCommand.hpp"
#include "cli/commands/AutoAttachCommand.hpp"
#include "cli/commands/DetachCommand.hpp"
#include "cli/commands/DisableCommand.hpp"
#include "cli/commands/EnableCommand.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/RefreshCommand.hpp"
#include "cli/commands/StatusCommand.hpp"

namespace proclient {

CommandFactory& CommandFactory::instance() {
    static CommandFactory f;
    return f;
}

void CommandFactory::registerBuiltins() {
    auto& f = instance();
    f.registerCreator("attach", [] { return std::make_unique<AttachCommand>(); });
    f.registerCreator("auto-attach", [] { return std::make_unique<AutoAttachCommand>(); });
    f.registerCreator("detach", [] { return std::make_unique<DetachCommand>(); });
    f.registerCreator("enable", [] { return std::make_unique<EnableCommand>(); });
    f.registerCreator("disable", [] { return std::make_unique<DisableCommand>(); });
    f.registerCreator("refresh", [] { return std::make_unique<RefreshCommand>(); });
    f.registerCreator("status", [] { return std::make_unique<StatusCommand>(); });
    f.registerCreator("help", [] { return std::make_unique<HelpCommand>(); });
}

void CommandFactory::registerCreator(const std::string& name, Creator creator) {
    creators[name] = std::move(creator);
}

std::unique_ptr<ICommand> CommandFactory::create(const std::string& name) const {
    auto it = creators.find(name);
    if (it == creators.end()) return nullptr;
    return it->second();
}

void CommandFactory::listCommands(std::vector<std::unique_ptr<ICommand>>& out) const {
    out.clear();
    out.reserve(creators.size());
    for (const auto& kv : creators) {
        out.emplace_back(kv.second());
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return std::string(a->name()) < std::string(b->name());
    });
}

}
