#ifndef ENGINE_COMMANDS_HPP
#define ENGINE_COMMANDS_HPP

#include "cli/cli_dispatcher.hpp"
#include "cli/scenario.hpp"

#include <optional>

struct EngineContext {
    std::optional<Scenario> scenario;
    std::optional<ScenarioOutcome> outcome;
};

bool registerAllCommands(CliDispatcher& dispatcher, EngineContext& context);

#endif // ENGINE_COMMANDS_HPP
