#include "game/game_utils.hpp"

#include "game/game_types.hpp"

#include <algorithm>
#include <bit>
#include <cctype>
#include <cassert>
#include <cstdint>
#include <string>

namespace {
const std::string CardValueNames = "23456789TJQKA";
const std::string CardSuitNames = "cdhs";
} // namespace

Result<CardID> getCardIDFromName(const std::string& cardName) {
    if (cardName.size() != 2) {
        return "Error parsing card: \"" + cardName + "\" must be a value followed by a suit (e.g. As, Td, 2c).";
    }

    char valueChar = static_cast<char>(std::toupper(static_cast<unsigned char>(cardName[0])));
    char suitChar = static_cast<char>(std::tolower(static_cast<unsigned char>(cardName[1])));

    std::size_t value = CardValueNames.find(valueChar);
    if (value == std::string::npos) {
        return "Error parsing card: \"" + cardName + "\" has an invalid value.";
    }

    std::size_t suit = CardSuitNames.find(suitChar);
    if (suit == std::string::npos) {
        return "Error parsing card: \"" + cardName + "\" has an invalid suit.";
    }

    CardID cardID = static_cast<std::uint8_t>((value * 4) + suit);
    return cardID;
}

std::string getNameFromCardID(CardID cardID) {
    Value cardValue = getCardValue(cardID);
    Suit cardSuit = getCardSuit(cardID);
    std::string cardName = { CardValueNames[static_cast<int>(cardValue)], CardSuitNames[static_cast<int>(cardSuit)] };
    return cardName;
}

Value getCardValue(CardID cardID) {
    assert(cardID < 52);
    return static_cast<Value>(cardID / 4);
}

Suit getCardSuit(CardID cardID) {
    assert(cardID < 52);
    return static_cast<Suit>(cardID % 4);
}

CardID getCardID(Value value, Suit suit) {
    return static_cast<CardID>((static_cast<int>(value) * 4) + static_cast<int>(suit));
}

int getValueRank(Value value) {
    return static_cast<int>(value) + 2;
}

int getLowAceRank(Value value) {
    return (value == Value::Ace) ? 1 : getValueRank(value);
}

std::string getValueName(Value value) {
    static const std::string Names[] = {
        "Two", "Three", "Four", "Five", "Six", "Seven", "Eight",
        "Nine", "Ten", "Jack", "Queen", "King", "Ace"
    };
    return Names[static_cast<int>(value)];
}

std::string getPluralValueName(Value value) {
    if (value == Value::Six) {
        return "Sixes";
    }
    return getValueName(value) + "s";
}

CardSet cardIDToSet(CardID cardID) {
    assert(cardID < 52);
    return (1ULL << cardID);
}

int getSetSize(CardSet cardSet) {
    return std::popcount(cardSet);
}

bool setContainsCard(CardSet cardSet, CardID cardID) {
    assert(cardID < 52);
    return (cardSet >> cardID) & 1;
}

CardID getLowestCardInSet(CardSet cardSet) {
    assert(getSetSize(cardSet) > 0);

    CardID lowestCard = static_cast<CardID>(std::countr_zero(cardSet));
    assert(lowestCard < 52);
    return lowestCard;
}

CardID popLowestCardFromSet(CardSet& cardSet) {
    CardID lowestCard = getLowestCardInSet(cardSet);
    cardSet &= ~cardIDToSet(lowestCard);
    return lowestCard;
}

CardSet cardListToSet(const std::vector<CardID>& cards) {
    CardSet cardSet = 0;
    for (CardID card : cards) {
        cardSet |= cardIDToSet(card);
    }
    return cardSet;
}

std::vector<std::string> getCardSetNames(CardSet cardSet) {
    int setSize = getSetSize(cardSet);
    std::vector<std::string> cardNames(setSize);
    for (int i = 0; i < setSize; ++i) {
        cardNames[i] = getNameFromCardID(popLowestCardFromSet(cardSet));
    }
    assert(cardSet == 0);

    // Descending order
    std::reverse(cardNames.begin(), cardNames.end());
    return cardNames;
}

std::vector<std::string> getCardListNames(const std::vector<CardID>& cards) {
    std::vector<std::string> cardNames;
    cardNames.reserve(cards.size());
    for (CardID card : cards) {
        cardNames.push_back(getNameFromCardID(card));
    }
    return cardNames;
}

Street nextStreet(Street street) {
    switch (street) {
        case Street::Preflop:
            return Street::Flop;
        case Street::Flop:
            return Street::Turn;
        case Street::Turn:
            return Street::River;
        default:
            assert(false);
            return Street::River;
    }
}

std::string getStreetName(Street street) {
    switch (street) {
        case Street::Preflop:
            return "preflop";
        case Street::Flop:
            return "flop";
        case Street::Turn:
            return "turn";
        case Street::River:
            return "river";
        default:
            assert(false);
            return "???";
    }
}

std::string getActionTypeName(ActionType actionType) {
    switch (actionType) {
        case ActionType::Fold:
            return "Fold";
        case ActionType::Check:
            return "Check";
        case ActionType::Call:
            return "Call";
        case ActionType::Raise:
            return "Raise";
        case ActionType::AllIn:
            return "All-in";
        default:
            assert(false);
            return "???";
    }
}

std::string getHandCategoryName(HandCategory category) {
    switch (category) {
        case HandCategory::HighCard:
            return "High Card";
        case HandCategory::Pair:
            return "Pair";
        case HandCategory::TwoPair:
            return "Two Pair";
        case HandCategory::ThreeOfAKind:
            return "Three of a Kind";
        case HandCategory::Straight:
            return "Straight";
        case HandCategory::Flush:
            return "Flush";
        case HandCategory::FullHouse:
            return "Full House";
        case HandCategory::FourOfAKind:
            return "Four of a Kind";
        case HandCategory::StraightFlush:
            return "Straight Flush";
        case HandCategory::RoyalFlush:
            return "Royal Flush";
        default:
            assert(false);
            return "???";
    }
}

std::string getBettingStructureName(BettingStructure structure) {
    return (structure == BettingStructure::FixedLimit) ? "fixed-limit" : "no-limit";
}
