#include "core/Operation.hpp"

namespace proclient {

const char* actionVerb(Action action) {
    switch (action) {
        case Action::Enable: return "enable";
        case Action::Disable: return "disable";
        case Action::Attach: return "attach";
        case Action::Detach: return "detach";
        case Action::Refresh: return "refresh";
    }
    return "enable";
}

bool actionRequiresAttachment(Action action) {
    return action == Action::Enable || action == Action::Disable;
}

}
