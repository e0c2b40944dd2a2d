#include "cli/engine_commands.hpp"

#include "cli/cli_dispatcher.hpp"
#include "cli/scenario.hpp"
#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "game/holdem/betting_round.hpp"
#include "game/holdem/equity.hpp"
#include "game/holdem/hand_evaluation.hpp"
#include "game/holdem/holdem_hand.hpp"
#include "game/holdem/parse_input.hpp"
#include "game/holdem/pot.hpp"
#include "io/output.hpp"
#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {
void printNoScenarioError() {
    std::cerr << "Error: No scenario loaded. Please run \"load <file>\" first.\n";
}

void printNoOutcomeError() {
    std::cerr << "Error: No hand has been played yet. Please run \"play\" first.\n";
}

std::string getSeatNames(const std::vector<SeatIndex>& seatList, const Seats& seats) {
    std::vector<std::string> names;
    for (SeatIndex seat : seatList) {
        names.push_back(seats[seat].name);
    }
    return join(names, ", ");
}

std::string describeAction(const ActionRecord& record, const Seats& seats) {
    std::string description = seats[record.seat].name + " ";
    switch (record.action) {
        case ActionType::Fold:
            description += "folds";
            break;
        case ActionType::Check:
            description += "checks";
            break;
        case ActionType::Call:
            description += "calls " + std::to_string(record.chipsCommitted);
            break;
        case ActionType::Raise:
            description += "raises to " + std::to_string(record.streetBetAfter);
            break;
        default:
            description += getActionTypeName(record.action);
            break;
    }

    if (record.isAllIn && record.chipsCommitted > 0) {
        description += " and is all in";
    }
    if (record.wasNormalized) {
        description += " (requested " + getActionTypeName(record.requested.action) + ": " + record.normalizationReason + ")";
    }
    return description;
}

void printActionLog(const HoldemHand& hand) {
    const Seats& seats = hand.getSeats();

    for (const ForcedBet& forcedBet : hand.getForcedBets()) {
        std::string type = (forcedBet.type == ForcedBetType::Ante) ? "an ante"
            : (forcedBet.type == ForcedBetType::SmallBlind) ? "the small blind" : "the big blind";
        std::cout << seats[forcedBet.seat].name << " posts " << type << " of " << forcedBet.amount << ".\n";
    }

    std::optional<Street> currentStreet;
    for (const ActionRecord& record : hand.getActionLog()) {
        if (currentStreet != record.street) {
            currentStreet = record.street;
            std::cout << getStreetName(record.street) << ":\n";
        }
        std::cout << "    " << describeAction(record, seats) << ".\n";
    }
}

void printPots(const ScenarioOutcome& outcome) {
    const HandResult& result = outcome.result;

    if (result.distribution.wasUncontested) {
        std::cout << "Pot was won uncontested, no side pots were formed.\n";
        return;
    }

    for (std::size_t i = 0; i < result.tiers.size(); ++i) {
        const PotTier& tier = result.tiers[i];
        std::string potName = (i == 0) ? "Main pot" : "Side pot " + std::to_string(i);
        std::cout << potName << ": " << tier.amount << " (eligible: " << getSeatNames(tier.eligibleSeats, outcome.seats) << ")\n";
    }
}

void printPayouts(const ScenarioOutcome& outcome) {
    const HandResult& result = outcome.result;

    for (SeatIndex seat = 0; seat < MaxNumSeats; ++seat) {
        if (result.showdownHands[seat]) {
            std::cout << outcome.seats[seat].name << " shows " << describeHand(*result.showdownHands[seat]) << ".\n";
        }
    }

    for (const PotAward& award : result.distribution.awards) {
        std::cout << getSeatNames(award.winners, outcome.seats) << ((award.winners.size() > 1) ? " split " : " wins ") << award.amount;
        if (award.winningHand) {
            std::cout << " with " << describeHand(*award.winningHand);
        }
        std::cout << ".\n";
    }

    std::cout << "Payouts:\n";
    for (SeatIndex seat = 0; seat < MaxNumSeats; ++seat) {
        if (outcome.seats[seat].isOccupied) {
            std::cout << "    " << outcome.seats[seat].name << ": +" << result.distribution.winnings[seat]
                << " (stack " << outcome.seats[seat].stack << ")\n";
        }
    }
}

bool handleLoad(EngineContext& context, const std::string& argument) {
    Result<Scenario> scenarioResult = loadScenarioFile(argument);
    if (scenarioResult.isError()) {
        std::cerr << "Error: " << scenarioResult.getError() << "\n";
        return false;
    }

    context.scenario = scenarioResult.getValue();
    context.outcome.reset();

    int numSeats = static_cast<int>(getOccupiedSeats(context.scenario->seats).size());
    std::cout << "Successfully loaded " << (context.scenario->isLedgerOnly ? "ledger" : "hand") << " scenario with "
        << numSeats << " seats from " << argument << ".\n";
    return true;
}

bool handlePlay(EngineContext& context) {
    if (!context.scenario) {
        printNoScenarioError();
        return false;
    }

    Result<ScenarioOutcome> outcomeResult = runScenario(*context.scenario);
    if (outcomeResult.isError()) {
        std::cerr << "Error: " << getErrorKindName(outcomeResult.getErrorKind()) << ": " << outcomeResult.getError() << "\n";
        return false;
    }

    context.outcome = outcomeResult.getValue();
    const ScenarioOutcome& outcome = *context.outcome;

    if (outcome.hand) {
        printActionLog(*outcome.hand);
        if (outcome.numUnusedActions > 0) {
            std::cout << "Warning: " << outcome.numUnusedActions << " scripted actions were never used.\n";
        }
    }

    printPots(outcome);
    printPayouts(outcome);
    return true;
}

bool handlePots(EngineContext& context) {
    if (!context.outcome) {
        printNoOutcomeError();
        return false;
    }

    printPots(*context.outcome);
    return true;
}

bool handleEvaluate(const std::string& argument) {
    Result<std::vector<CardID>> cardsResult = buildCardListFromString(argument);
    if (cardsResult.isError()) {
        std::cerr << "Error: " << cardsResult.getError() << "\n";
        return false;
    }

    Result<Hand> handResult = getBestHand(cardsResult.getValue());
    if (handResult.isError()) {
        std::cerr << "Error: " << handResult.getError() << "\n";
        return false;
    }

    const Hand& hand = handResult.getValue();
    std::vector<CardID> bestCards(hand.cards.begin(), hand.cards.end());
    std::cout << describeHand(hand) << " [" << join(getCardListNames(bestCards), " ") << "]\n";
    return true;
}

bool handleEquity(EngineContext& context) {
    if (!context.scenario) {
        printNoScenarioError();
        return false;
    }

    const Scenario& scenario = *context.scenario;
    std::vector<SeatIndex> players;
    std::vector<std::vector<CardID>> holeCards;
    for (SeatIndex seat = 0; seat < MaxNumSeats; ++seat) {
        if (scenario.seats[seat].isOccupied && !scenario.folded[seat] && !scenario.holeCards[seat].empty()) {
            players.push_back(seat);
            holeCards.push_back(scenario.holeCards[seat]);
        }
    }

    Result<EquityResult> equityResult = calculateEquity(holeCards, scenario.board);
    if (equityResult.isError()) {
        std::cerr << "Error: " << equityResult.getError() << "\n";
        return false;
    }

    const EquityResult& equity = equityResult.getValue();
    std::cout << "Enumerated " << equity.numRunouts << " runouts.\n";
    for (std::size_t i = 0; i < players.size(); ++i) {
        std::cout << scenario.seats[players[i]].name << ": "
            << formatFixedPoint(equity.equities[i] * 100.0, 2) << "% equity (win "
            << formatFixedPoint(equity.winProbabilities[i] * 100.0, 2) << "%, tie "
            << formatFixedPoint(equity.tieProbabilities[i] * 100.0, 2) << "%)\n";
    }
    return true;
}

bool handleSave(EngineContext& context, const std::string& argument) {
    if (!context.scenario || !context.outcome) {
        printNoOutcomeError();
        return false;
    }

    std::string handRecord = buildHandRecordJSON(
        context.outcome->seats,
        context.scenario->buttonSeat,
        context.outcome->result,
        context.outcome->hand
    );

    Result<int> writeResult = writeHandRecord(handRecord, argument);
    if (writeResult.isError()) {
        std::cerr << "Error: " << writeResult.getError() << "\n";
        return false;
    }

    std::cout << "Successfully saved hand record to " << argument << ".\n";
    return true;
}
} // namespace

bool registerAllCommands(CliDispatcher& dispatcher, EngineContext& context) {
    bool success = true;

    success &= dispatcher.registerCommand(
        "load",
        "scenario.yml",
        "Loads a hand or ledger scenario. See scenarios/ for examples.",
        [&context](const std::string& argument) { return handleLoad(context, argument); }
    );

    success &= dispatcher.registerCommand(
        "play",
        "Plays the loaded scenario and prints the action log, the pots, and the payouts.",
        [&context]() { return handlePlay(context); }
    );

    success &= dispatcher.registerCommand(
        "pots",
        "Prints the main pot and side pots of the last hand played.",
        [&context]() { return handlePots(context); }
    );

    success &= dispatcher.registerCommand(
        "evaluate",
        "cards",
        "Prints the best five card hand out of 5 to 7 cards, e.g. \"evaluate As,Ks,Qs,Js,Ts,2c,3d\".",
        [](const std::string& argument) { return handleEvaluate(argument); }
    );

    success &= dispatcher.registerCommand(
        "equity",
        "Prints every player's showdown equity for the hole cards and board of the loaded scenario.",
        [&context]() { return handleEquity(context); }
    );

    success &= dispatcher.registerCommand(
        "save",
        "file.json",
        "Saves the record of the last hand played as JSON.",
        [&context](const std::string& argument) { return handleSave(context, argument); }
    );

    return success;
}
