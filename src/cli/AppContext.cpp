#include "cli/AppContext.hpp"

#include <unistd.h>

namespace proclient {

AppContext AppContext::fromConfig(const Config& config) {
    AppContext ctx;
    ctx.config = config;
    ctx.platform = Platform::detect(config.osReleaseFile);
    ctx.store = std::make_shared<FileAttachmentStore>(config.dataDir);
    ctx.contracts = std::make_shared<FileContractSource>(config.contractFile);
    ctx.backend = std::make_shared<StateServiceBackend>(*ctx.catalog, ctx.platform.series);
    ctx.isRoot = [] { return ::geteuid() == 0; };
    return ctx;
}

}
