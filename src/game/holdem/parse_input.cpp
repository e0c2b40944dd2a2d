#include "game/holdem/parse_input.hpp"

#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "game/holdem/action_rules.hpp"
#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

Result<std::vector<CardID>> buildCardListFromString(const std::string& cardListString) {
    std::string normalized = cardListString;
    std::replace(normalized.begin(), normalized.end(), ',', ' ');
    std::vector<std::string> cardStrings = parseTokens(normalized, ' ');

    std::vector<CardID> cards;
    CardSet seenCards = 0;
    for (const std::string& cardString : cardStrings) {
        Result<CardID> cardIDResult = getCardIDFromName(cardString);
        if (cardIDResult.isError()) {
            return cardIDResult.getError();
        }

        CardID cardID = cardIDResult.getValue();
        if (setContainsCard(seenCards, cardID)) {
            return "Error building card list: \"" + cardString + "\" appears more than once.";
        }

        seenCards |= cardIDToSet(cardID);
        cards.push_back(cardID);
    }

    return cards;
}

Result<std::vector<CardID>> buildBoardFromString(const std::string& boardString) {
    Result<std::vector<CardID>> boardResult = buildCardListFromString(boardString);
    if (boardResult.isError()) {
        return boardResult;
    }

    int boardSize = static_cast<int>(boardResult.getValue().size());
    if (boardSize != 0 && (boardSize < 3 || boardSize > 5)) {
        return "Error building board: Size must be 0, 3, 4, or 5 (preflop, flop, turn, or river).";
    }

    return boardResult;
}

Result<PlayerDecision> parseDecision(const std::string& decisionString) {
    std::vector<std::string> tokens = parseTokens(toLower(decisionString), ' ');
    if (tokens.empty()) {
        return "Error parsing action: Action is empty.";
    }

    const std::string& actionName = tokens[0];
    std::string errorString = "Error parsing action: \"" + decisionString + "\" is not a valid action.";

    auto requireNoAmount = [&tokens, &errorString](ActionType action) -> Result<PlayerDecision> {
        if (tokens.size() != 1) {
            return errorString + " (" + tokens[0] + " does not take an amount)";
        }
        return PlayerDecision{ .action = action, .amount = 0 };
    };

    if (actionName == "fold") {
        return requireNoAmount(ActionType::Fold);
    }
    if (actionName == "check") {
        return requireNoAmount(ActionType::Check);
    }
    if (actionName == "call") {
        return requireNoAmount(ActionType::Call);
    }
    if (actionName == "all-in" || actionName == "allin" || actionName == "all_in") {
        return requireNoAmount(ActionType::AllIn);
    }

    if (actionName == "raise" || actionName == "bet") {
        if (tokens.size() != 2) {
            return errorString + " (Expected a total to raise to)";
        }

        std::optional<int> amountOption = parseInt(tokens[1]);
        if (!amountOption) {
            return errorString + " (Amount is not a valid integer)";
        }
        if (*amountOption <= 0) {
            return errorString + " (Amount must be positive)";
        }
        return PlayerDecision{ .action = ActionType::Raise, .amount = *amountOption };
    }

    return errorString;
}

Result<BettingStructure> parseBettingStructure(const std::string& structureString) {
    std::string name = toLower(trim(structureString));
    if (name == "no-limit" || name == "nolimit" || name == "nl") {
        return BettingStructure::NoLimit;
    }
    if (name == "fixed-limit" || name == "fixedlimit" || name == "limit" || name == "fl") {
        return BettingStructure::FixedLimit;
    }
    return "Error parsing betting structure: \"" + structureString + "\" must be no-limit or fixed-limit.";
}

Result<Street> parseStreet(const std::string& streetString) {
    std::string name = toLower(trim(streetString));
    for (Street street : { Street::Preflop, Street::Flop, Street::Turn, Street::River }) {
        if (name == getStreetName(street)) {
            return street;
        }
    }
    return "Error parsing street: \"" + streetString + "\" must be preflop, flop, turn, or river.";
}
