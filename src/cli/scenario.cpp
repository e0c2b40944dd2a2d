#include "cli/scenario.hpp"

#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "game/holdem/action_rules.hpp"
#include "game/holdem/config.hpp"
#include "game/holdem/decision_source.hpp"
#include "game/holdem/hand_evaluation.hpp"
#include "game/holdem/holdem_hand.hpp"
#include "game/holdem/parse_input.hpp"
#include "game/holdem/pot.hpp"
#include "game/holdem/table.hpp"
#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace {
template <typename T>
bool loadField(T& field, const YAML::Node& node, const std::vector<std::string>& indices, std::size_t depth) {
    if (!node.IsDefined() || node.IsNull()) {
        return false;
    }

    try {
        if (depth == indices.size()) {
            field = node.as<T>();
            return true;
        }

        return loadField(field, node[indices[depth]], indices, depth + 1);
    }
    catch (const YAML::Exception&) {
        return false;
    }
}

template <typename T>
std::optional<std::string> loadFieldRequired(T& field, const YAML::Node& root, const std::vector<std::string>& indices) {
    if (!loadField(field, root, indices, 0)) {
        return "Could not load field " + join(indices, "::") + ".";
    }
    return std::nullopt;
}

template <typename T>
void loadFieldOptional(T& field, const YAML::Node& root, const std::vector<std::string>& indices, const T& defaultValue) {
    if (!loadField(field, root, indices, 0)) {
        field = defaultValue;
    }
}

bool hasField(const YAML::Node& root, const std::string& name) {
    return root.IsMap() && root[name].IsDefined() && !root[name].IsNull();
}

std::optional<SeatIndex> findSeatByName(const Seats& seats, const std::string& name) {
    for (SeatIndex seat = 0; seat < MaxNumSeats; ++seat) {
        if (seats[seat].isOccupied && seats[seat].name == name) {
            return seat;
        }
    }
    return std::nullopt;
}

// Every entry of a seat has the same shape, only ledger-only scenarios carry contributions
std::optional<std::string> loadSeats(Scenario& scenario, const YAML::Node& seatsNode) {
    if (!seatsNode.IsSequence() || seatsNode.size() == 0) {
        return "Error loading scenario: \"seats\" must be a non-empty list.";
    }
    if (seatsNode.size() > static_cast<std::size_t>(MaxNumSeats)) {
        return "Error loading scenario: At most " + std::to_string(MaxNumSeats) + " seats are supported.";
    }

    for (std::size_t i = 0; i < seatsNode.size(); ++i) {
        const YAML::Node seatNode = seatsNode[i];
        std::string errorPrefix = "Error loading seat " + std::to_string(i) + ": ";

        int seat;
        loadFieldOptional(seat, seatNode, { "seat" }, static_cast<int>(i));
        if (seat < 0 || seat >= MaxNumSeats) {
            return errorPrefix + "Seat index must be between 0 and " + std::to_string(MaxNumSeats - 1) + ".";
        }
        if (scenario.seats[seat].isOccupied) {
            return errorPrefix + "Seat " + std::to_string(seat) + " is listed more than once.";
        }

        SeatState& seatState = scenario.seats[seat];
        if (std::optional<std::string> error = loadFieldRequired(seatState.name, seatNode, { "name" })) {
            return errorPrefix + *error;
        }
        if (seatState.name.empty() || seatState.name.find(' ') != std::string::npos) {
            return errorPrefix + "Name \"" + seatState.name + "\" must be a single word.";
        }
        if (findSeatByName(scenario.seats, seatState.name)) {
            return errorPrefix + "Name \"" + seatState.name + "\" is used more than once.";
        }

        if (scenario.isLedgerOnly) {
            loadFieldOptional(seatState.stack, seatNode, { "stack" }, 0);
            if (std::optional<std::string> error = loadFieldRequired(scenario.contributions[seat], seatNode, { "contribution" })) {
                return errorPrefix + *error;
            }
            loadFieldOptional(scenario.folded[seat], seatNode, { "folded" }, false);
        }
        else {
            if (std::optional<std::string> error = loadFieldRequired(seatState.stack, seatNode, { "stack" })) {
                return errorPrefix + *error;
            }
        }

        if (seatState.stack < 0 || seatState.stack > holdem::MaxChips) {
            return errorPrefix + "Stack must be between 0 and " + std::to_string(holdem::MaxChips) + ".";
        }

        std::string cardsString;
        loadFieldOptional(cardsString, seatNode, { "cards" }, std::string{});
        Result<std::vector<CardID>> cardsResult = buildCardListFromString(cardsString);
        if (cardsResult.isError()) {
            return errorPrefix + cardsResult.getError();
        }
        scenario.holeCards[seat] = cardsResult.getValue();

        seatState.streetBet = 0;
        seatState.isOccupied = true;
        seatState.hasFolded = false;
        seatState.isAllIn = false;
    }

    return std::nullopt;
}

std::optional<std::string> loadTable(Scenario& scenario, const YAML::Node& root) {
    SeatIndex firstSeat = getOccupiedSeats(scenario.seats).front();
    loadFieldOptional(scenario.buttonSeat, root, { "table", "button" }, firstSeat);

    if (scenario.isLedgerOnly) {
        scenario.settings = {
            .structure = BettingStructure::NoLimit,
            .smallBlind = 0,
            .bigBlind = 0,
            .ante = 0,
            .actionPolicy = ActionPolicy::Normalize
        };
        if (scenario.buttonSeat < 0 || scenario.buttonSeat >= MaxNumSeats) {
            return "Error loading scenario: Button seat " + std::to_string(scenario.buttonSeat) + " does not exist.";
        }
        return std::nullopt;
    }

    TableSettings& settings = scenario.settings;
    if (std::optional<std::string> error = loadFieldRequired(settings.smallBlind, root, { "table", "small-blind" })) {
        return "Error loading scenario: " + *error;
    }
    if (std::optional<std::string> error = loadFieldRequired(settings.bigBlind, root, { "table", "big-blind" })) {
        return "Error loading scenario: " + *error;
    }
    loadFieldOptional(settings.ante, root, { "table", "ante" }, 0);

    std::string structureString;
    loadFieldOptional(structureString, root, { "table", "structure" }, std::string{ "no-limit" });
    Result<BettingStructure> structureResult = parseBettingStructure(structureString);
    if (structureResult.isError()) {
        return structureResult.getError();
    }
    settings.structure = structureResult.getValue();

    bool isStrict;
    loadFieldOptional(isStrict, root, { "table", "strict-actions" }, false);
    settings.actionPolicy = isStrict ? ActionPolicy::Strict : ActionPolicy::Normalize;

    Result<TableSettings> settingsResult = validateTableSettings(settings);
    if (settingsResult.isError()) {
        return settingsResult.getError();
    }
    return std::nullopt;
}

std::optional<std::string> loadActions(Scenario& scenario, const YAML::Node& root) {
    for (Street street : { Street::Preflop, Street::Flop, Street::Turn, Street::River }) {
        std::vector<std::string> actionStrings;
        loadFieldOptional(actionStrings, root, { "actions", getStreetName(street) }, {});

        for (const std::string& actionString : actionStrings) {
            std::vector<std::string> tokens = parseTokens(actionString, ' ');
            if (tokens.size() < 2) {
                return "Error loading " + getStreetName(street) + " actions: \"" + actionString + "\" must be a player name followed by an action.";
            }

            std::optional<SeatIndex> seat = findSeatByName(scenario.seats, tokens[0]);
            if (!seat) {
                return "Error loading " + getStreetName(street) + " actions: Unknown player \"" + tokens[0] + "\".";
            }

            std::vector<std::string> decisionTokens(tokens.begin() + 1, tokens.end());
            Result<PlayerDecision> decisionResult = parseDecision(join(decisionTokens, " "));
            if (decisionResult.isError()) {
                return decisionResult.getError();
            }

            scenario.actions[street].push_back({ .seat = *seat, .decision = decisionResult.getValue() });
        }
    }
    return std::nullopt;
}

Result<ScenarioOutcome> runLedgerOnlyScenario(const Scenario& scenario) {
    Pot pot;
    for (SeatIndex seat = 0; seat < MaxNumSeats; ++seat) {
        if (!scenario.seats[seat].isOccupied) {
            continue;
        }

        Result<int> contribution = pot.addContribution(seat, scenario.contributions[seat]);
        if (contribution.isError()) {
            return EngineError{ contribution.getErrorKind(), scenario.seats[seat].name + ": " + contribution.getError() };
        }
    }

    ScenarioOutcome outcome;
    outcome.seats = scenario.seats;
    outcome.numUnusedActions = 0;

    SeatArray<bool> folded;
    for (SeatIndex seat = 0; seat < MaxNumSeats; ++seat) {
        folded[seat] = scenario.seats[seat].isOccupied && scenario.folded[seat];
        outcome.seats[seat].hasFolded = folded[seat];
    }

    // Any live seat that shows cards gets evaluated, even if the pot ends up uncontested
    for (SeatIndex seat = 0; seat < MaxNumSeats; ++seat) {
        if (!scenario.seats[seat].isOccupied || folded[seat] || scenario.holeCards[seat].empty()) {
            continue;
        }

        std::vector<CardID> cards = scenario.holeCards[seat];
        cards.insert(cards.end(), scenario.board.begin(), scenario.board.end());

        Result<Hand> handResult = getBestHand(cards);
        if (handResult.isError()) {
            return EngineError{ handResult.getErrorKind(), scenario.seats[seat].name + ": " + handResult.getError() };
        }
        outcome.result.showdownHands[seat] = handResult.getValue();
    }

    Result<PotDistribution> distributionResult = pot.distribute(outcome.result.showdownHands, folded, scenario.buttonSeat);
    if (distributionResult.isError()) {
        return distributionResult.getEngineError();
    }
    outcome.result.distribution = distributionResult.getValue();

    if (!outcome.result.distribution.wasUncontested) {
        Result<std::vector<PotTier>> tiersResult = pot.derivePots(folded);
        if (tiersResult.isError()) {
            return tiersResult.getEngineError();
        }
        outcome.result.tiers = tiersResult.getValue();
    }

    for (SeatIndex seat = 0; seat < MaxNumSeats; ++seat) {
        outcome.seats[seat].stack += outcome.result.distribution.winnings[seat];
    }
    return outcome;
}

Result<ScenarioOutcome> runPlayedScenario(const Scenario& scenario) {
    Result<HoldemHand> handResult = HoldemHand::create(scenario.settings, scenario.seats, scenario.buttonSeat);
    if (handResult.isError()) {
        return handResult.getEngineError();
    }
    HoldemHand& hand = handResult.getValue();

    for (SeatIndex seat = 0; seat < MaxNumSeats; ++seat) {
        if (scenario.holeCards[seat].empty()) {
            continue;
        }

        Result<CardSet> cardsResult = hand.setHoleCards(seat, scenario.holeCards[seat]);
        if (cardsResult.isError()) {
            return cardsResult.getEngineError();
        }
    }

    Result<CardSet> boardResult = hand.setBoard(scenario.board);
    if (boardResult.isError()) {
        return boardResult.getEngineError();
    }

    Result<int> forcedBetsResult = hand.postForcedBets();
    if (forcedBetsResult.isError()) {
        return forcedBetsResult.getEngineError();
    }

    int numScriptedActions = 0;
    int numConsumedActions = 0;
    for (Street street : { Street::Preflop, Street::Flop, Street::Turn, Street::River }) {
        numScriptedActions += static_cast<int>(scenario.actions[street].size());
    }

    while (!hand.isBettingOver()) {
        Street street = hand.getStreet();

        ScriptedDecisionSource decisionSource;
        for (const ScenarioAction& action : scenario.actions[street]) {
            decisionSource.addDecision(action.seat, action.decision);
        }

        Result<int> streetResult = hand.playStreet(decisionSource);
        if (streetResult.isError()) {
            return streetResult.getEngineError();
        }
        numConsumedActions += static_cast<int>(scenario.actions[street].size()) - decisionSource.getNumRemainingDecisions();
    }

    Result<HandResult> settleResult = hand.settle();
    if (settleResult.isError()) {
        return settleResult.getEngineError();
    }

    ScenarioOutcome outcome;
    outcome.seats = hand.getSeats();
    outcome.result = settleResult.getValue();
    outcome.numUnusedActions = numScriptedActions - numConsumedActions;
    outcome.hand = std::move(hand);
    return outcome;
}
} // namespace

Result<Scenario> loadScenario(const YAML::Node& root) {
    if (!root.IsMap()) {
        return "Error loading scenario: Expected a map at the top level.";
    }

    Scenario scenario;
    scenario.buttonSeat = 0;
    scenario.contributions.fill(0);
    scenario.folded.fill(false);
    for (SeatIndex seat = 0; seat < MaxNumSeats; ++seat) {
        scenario.seats[seat] = { .name = "", .stack = 0, .streetBet = 0, .isOccupied = false, .hasFolded = false, .isAllIn = false };
    }

    const YAML::Node seatsNode = root["seats"];
    if (!seatsNode.IsDefined()) {
        return "Error loading scenario: Could not load field seats.";
    }

    scenario.isLedgerOnly = false;
    if (seatsNode.IsSequence()) {
        for (std::size_t i = 0; i < seatsNode.size(); ++i) {
            scenario.isLedgerOnly |= hasField(seatsNode[i], "contribution");
        }
    }

    if (std::optional<std::string> error = loadSeats(scenario, seatsNode)) {
        return *error;
    }
    if (std::optional<std::string> error = loadTable(scenario, root)) {
        return *error;
    }

    std::string boardString;
    loadFieldOptional(boardString, root, { "board" }, std::string{});
    Result<std::vector<CardID>> boardResult = buildBoardFromString(boardString);
    if (boardResult.isError()) {
        return boardResult.getError();
    }
    scenario.board = boardResult.getValue();

    if (scenario.isLedgerOnly) {
        if (hasField(root, "actions")) {
            return "Error loading scenario: A scenario with contributions cannot also list actions.";
        }
    }
    else if (std::optional<std::string> error = loadActions(scenario, root)) {
        return *error;
    }

    return scenario;
}

Result<Scenario> loadScenarioFile(const std::string& filePath) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filePath);
    }
    catch (const YAML::Exception& e) {
        return "Error loading scenario: Could not load " + filePath + ". " + e.what();
    }

    return loadScenario(root);
}

Result<ScenarioOutcome> runScenario(const Scenario& scenario) {
    if (scenario.isLedgerOnly) {
        return runLedgerOnlyScenario(scenario);
    }
    return runPlayedScenario(scenario);
}
