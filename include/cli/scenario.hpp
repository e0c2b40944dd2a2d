#ifndef SCENARIO_HPP
#define SCENARIO_HPP

#include "game/game_types.hpp"
#include "game/holdem/action_rules.hpp"
#include "game/holdem/holdem_hand.hpp"
#include "game/holdem/table.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

struct ScenarioAction {
    SeatIndex seat;
    PlayerDecision decision;
};

struct Scenario {
    TableSettings settings;
    Seats seats;
    SeatIndex buttonSeat;
    SeatArray<std::vector<CardID>> holeCards;
    std::vector<CardID> board;
    StreetArray<std::vector<ScenarioAction>> actions;

    // A ledger-only scenario lists what every seat put in the pot instead of
    // replaying the betting, and only derives and pays out the pots
    bool isLedgerOnly;
    SeatArray<int> contributions;
    SeatArray<bool> folded;
};

struct ScenarioOutcome {
    // Stacks after the payout
    Seats seats;

    // Empty for ledger-only scenarios
    std::optional<HoldemHand> hand;

    HandResult result;
    int numUnusedActions;
};

Result<Scenario> loadScenario(const YAML::Node& root);
Result<Scenario> loadScenarioFile(const std::string& filePath);

Result<ScenarioOutcome> runScenario(const Scenario& scenario);

#endif // SCENARIO_HPP
