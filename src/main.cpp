// pro: Ubuntu Pro client entry using Command Pattern over the entitlement engine.

#include <unistd.h>

#include <string>
#include <vector>

#include "cli/Application.hpp"
#include "cli/CommandFactory.hpp"

using namespace proclient;

int main(int argc, char** argv) {
    CommandFactory::registerBuiltins();
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    Application app([] { return ::geteuid() == 0; });
    return app.run(args);
}
