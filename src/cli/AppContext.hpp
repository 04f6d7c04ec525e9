#pragma once

#include <functional>
#include <iostream>
#include <memory>

#include "core/AttachmentState.hpp"
#include "core/Config.hpp"
#include "core/ContractSource.hpp"
#include "core/Platform.hpp"
#include "core/ServiceBackend.hpp"
#include "core/ServiceCatalog.hpp"

namespace proclient {

/**
 * @brief Collaborators handed to every command
 *
 * Everything mutable (attachment state, contracts, service backend) is
 * injected here rather than reached through globals, so tests can swap in
 * in-memory implementations.
 */
struct AppContext {
    Config config{Config::defaults()};
    const ServiceCatalog* catalog{&ServiceCatalog::builtin()};
    PlatformInfo platform;
    std::shared_ptr<IAttachmentStore> store;
    std::shared_ptr<IContractSource> contracts;
    std::shared_ptr<IServiceBackend> backend;
    std::function<bool()> isRoot;      // Effective uid check
    std::istream* input{&std::cin};    // Source of confirmation answers

    /// Wire file-backed collaborators from a loaded configuration
    static AppContext fromConfig(const Config& config);
};

}
