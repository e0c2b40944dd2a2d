#include "cli/cli_dispatcher.hpp"
#include "cli/engine_commands.hpp"

#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    CliDispatcher dispatcher("HoldemEngine", Version{ .major = 1, .minor = 0, .patch = 0 });
    EngineContext context;
    if (!registerAllCommands(dispatcher, context)) {
        std::cerr << "Error: Could not register commands.\n";
        return 1;
    }

    if (argc == 2) {
        std::string scenarioPath = argv[1];
        bool success = dispatcher.execute("load " + scenarioPath) && dispatcher.execute("play");
        return success ? 0 : 1;
    }
    if (argc > 2) {
        std::cerr << "Usage: holdem_engine [scenario.yml]\n";
        return 1;
    }

    dispatcher.run(std::cin);

    return 0;
}
