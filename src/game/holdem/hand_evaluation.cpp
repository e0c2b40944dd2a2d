#include "game/holdem/hand_evaluation.hpp"

#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "game/holdem/config.hpp"
#include "util/result.hpp"

#include <algorithm>
#include <array>
#include <cassert>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {
using FiveCards = std::array<CardID, holdem::HandSize>;

// Orders the cards so that the largest groups come first and ties are broken by value.
// A wheel is written 5-4-3-2-A, since the ace plays low.
FiveCards sortCardsForDisplay(const FiveCards& cards, const std::array<int, 13>& valueCounts, bool isWheel) {
    FiveCards sortedCards = cards;
    std::sort(sortedCards.begin(), sortedCards.end(), [&valueCounts](CardID lhs, CardID rhs) {
        int lhsCount = valueCounts[static_cast<int>(getCardValue(lhs))];
        int rhsCount = valueCounts[static_cast<int>(getCardValue(rhs))];
        if (lhsCount != rhsCount) {
            return lhsCount > rhsCount;
        }
        return lhs > rhs;
    });

    if (isWheel) {
        std::rotate(sortedCards.begin(), sortedCards.begin() + 1, sortedCards.end());
    }

    return sortedCards;
}
} // namespace

bool Hand::operator==(const Hand& rhs) const {
    return (category == rhs.category) && (tiebreaks == rhs.tiebreaks);
}

std::strong_ordering Hand::operator<=>(const Hand& rhs) const {
    if (auto cmp = (category <=> rhs.category); cmp != 0) {
        return cmp;
    }
    return tiebreaks <=> rhs.tiebreaks;
}

Hand classifyFiveCardHand(const FiveCards& cards) {
    std::array<int, 13> valueCounts = {};
    for (CardID card : cards) {
        assert(card < holdem::DeckSize);
        ++valueCounts[static_cast<int>(getCardValue(card))];
    }

    std::array<std::pair<int, Value>, 13> valueFrequencies;
    for (int i = 0; i < 13; ++i) {
        valueFrequencies[i] = { valueCounts[i], static_cast<Value>(i) };
    }
    std::sort(valueFrequencies.begin(), valueFrequencies.end(), std::greater<std::pair<int, Value>>());

    // Card values in descending order
    std::array<Value, 5> sortedCardValues;
    for (int i = 0; i < 5; ++i) {
        sortedCardValues[i] = getCardValue(cards[i]);
    }
    std::sort(sortedCardValues.begin(), sortedCardValues.end(), std::greater<Value>());

    bool hasNoPairs = (valueFrequencies[0].first == 1);
    bool isRegularStraight = hasNoPairs && (static_cast<int>(sortedCardValues[0]) - static_cast<int>(sortedCardValues[4]) == 4);
    bool isWheelStraight = hasNoPairs && (sortedCardValues[0] == Value::Ace) && (sortedCardValues[1] == Value::Five);

    bool isFlush = true;
    for (int i = 1; i < 5; ++i) {
        isFlush &= (getCardSuit(cards[i]) == getCardSuit(cards[0]));
    }

    Hand hand;
    hand.cards = sortCardsForDisplay(cards, valueCounts, isWheelStraight);

    if (isFlush && (isRegularStraight || isWheelStraight)) {
        if (isRegularStraight && sortedCardValues[0] == Value::Ace) {
            hand.category = HandCategory::RoyalFlush;
            hand.tiebreaks = {};
        }
        else {
            hand.category = HandCategory::StraightFlush;
            hand.tiebreaks = { isWheelStraight ? Value::Five : sortedCardValues[0] };
        }
    }
    else if (valueFrequencies[0].first == 4) {
        hand.category = HandCategory::FourOfAKind;
        hand.tiebreaks = { valueFrequencies[0].second, valueFrequencies[1].second };
    }
    else if (valueFrequencies[0].first == 3 && valueFrequencies[1].first == 2) {
        hand.category = HandCategory::FullHouse;
        hand.tiebreaks = { valueFrequencies[0].second, valueFrequencies[1].second };
    }
    else if (isFlush) {
        hand.category = HandCategory::Flush;
        hand.tiebreaks.assign(sortedCardValues.begin(), sortedCardValues.end());
    }
    else if (isRegularStraight || isWheelStraight) {
        hand.category = HandCategory::Straight;
        hand.tiebreaks = { isWheelStraight ? Value::Five : sortedCardValues[0] };
    }
    else if (valueFrequencies[0].first == 3) {
        hand.category = HandCategory::ThreeOfAKind;
        hand.tiebreaks = { valueFrequencies[0].second, valueFrequencies[1].second, valueFrequencies[2].second };
    }
    else if (valueFrequencies[0].first == 2 && valueFrequencies[1].first == 2) {
        hand.category = HandCategory::TwoPair;
        hand.tiebreaks = { valueFrequencies[0].second, valueFrequencies[1].second, valueFrequencies[2].second };
    }
    else if (valueFrequencies[0].first == 2) {
        hand.category = HandCategory::Pair;
        hand.tiebreaks = { valueFrequencies[0].second, valueFrequencies[1].second, valueFrequencies[2].second, valueFrequencies[3].second };
    }
    else {
        hand.category = HandCategory::HighCard;
        hand.tiebreaks.assign(sortedCardValues.begin(), sortedCardValues.end());
    }

    return hand;
}

Result<Hand> getBestHand(const std::vector<CardID>& cards) {
    int numCards = static_cast<int>(cards.size());
    if (numCards < holdem::HandSize) {
        return EngineError{
            ErrorKind::InvalidHandInput,
            "Error evaluating hand: Need at least 5 cards, got " + std::to_string(numCards) + "."
        };
    }
    if (numCards > holdem::MaxCardsToEvaluate) {
        return EngineError{
            ErrorKind::InvalidHandInput,
            "Error evaluating hand: At most 7 cards can be evaluated, got " + std::to_string(numCards) + "."
        };
    }

    CardSet seenCards = 0;
    for (CardID card : cards) {
        if (card >= holdem::DeckSize) {
            return EngineError{ ErrorKind::InvalidHandInput, "Error evaluating hand: Invalid card id." };
        }
        if (setContainsCard(seenCards, card)) {
            return EngineError{
                ErrorKind::InvalidHandInput,
                "Error evaluating hand: \"" + getNameFromCardID(card) + "\" appears more than once."
            };
        }
        seenCards |= cardIDToSet(card);
    }

    // Try every five card subset, C(7, 5) = 21 in the common case
    std::optional<Hand> bestHand;
    for (int a = 0; a < numCards; ++a) {
        for (int b = a + 1; b < numCards; ++b) {
            for (int c = b + 1; c < numCards; ++c) {
                for (int d = c + 1; d < numCards; ++d) {
                    for (int e = d + 1; e < numCards; ++e) {
                        Hand hand = classifyFiveCardHand({ cards[a], cards[b], cards[c], cards[d], cards[e] });
                        if (!bestHand || hand > *bestHand) {
                            bestHand = hand;
                        }
                    }
                }
            }
        }
    }

    assert(bestHand);
    return *bestHand;
}

HandRank getHandRank(const Hand& hand) {
    // Integer representation:
    // Bits [23, 20]: Hand category (1 is high card, 10 is royal flush)
    // Bits [19, 16]: Tie-break 0
    // Bits [15, 12]: Tie-break 1
    // Bits [11, 8]:  Tie-break 2
    // Bits [7, 4]:   Tie-break 3
    // Bits [3, 0]:   Tie-break 4
    // Any bits with non existent tie-breaks are set to 0

    HandRank handRank = 0;

    // Adding 1 to the category to ensure that 0 is an invalid hand ranking
    HandRank categoryID = static_cast<HandRank>(hand.category) + 1;
    handRank |= (categoryID << 20);

    for (std::size_t i = 0; i < hand.tiebreaks.size(); ++i) {
        HandRank valueID = static_cast<HandRank>(hand.tiebreaks[i]);
        int offset = 16 - (4 * static_cast<int>(i));
        assert(offset >= 0);
        handRank |= (valueID << offset);
    }

    return handRank;
}

HandRank getFiveCardHandRank(CardSet hand) {
    assert(getSetSize(hand) == 5);

    FiveCards cards;
    for (int i = 0; i < 5; ++i) {
        cards[i] = popLowestCardFromSet(hand);
    }
    assert(hand == 0);

    return getHandRank(classifyFiveCardHand(cards));
}

HandRank getBestHandRank(CardSet cards) {
    int numCards = getSetSize(cards);
    assert(numCards >= holdem::HandSize && numCards <= holdem::MaxCardsToEvaluate);

    std::array<CardID, holdem::MaxCardsToEvaluate> cardArray;
    CardSet temp = cards;
    for (int i = 0; i < numCards; ++i) {
        cardArray[i] = popLowestCardFromSet(temp);
    }
    assert(temp == 0);

    HandRank bestRank = 0;
    for (int a = 0; a < numCards; ++a) {
        for (int b = a + 1; b < numCards; ++b) {
            for (int c = b + 1; c < numCards; ++c) {
                for (int d = c + 1; d < numCards; ++d) {
                    for (int e = d + 1; e < numCards; ++e) {
                        HandRank rank = getHandRank(classifyFiveCardHand({ cardArray[a], cardArray[b], cardArray[c], cardArray[d], cardArray[e] }));
                        bestRank = std::max(bestRank, rank);
                    }
                }
            }
        }
    }

    return bestRank;
}

HandCategory getHandRankCategory(HandRank handRank) {
    HandRank categoryID = (handRank >> 20) & 0xF;
    assert(categoryID >= 1 && categoryID <= 10);
    return static_cast<HandCategory>(categoryID - 1);
}

std::string describeHand(const Hand& hand) {
    const auto& t = hand.tiebreaks;

    switch (hand.category) {
        case HandCategory::HighCard:
            return "High Card, " + getValueName(t[0]);
        case HandCategory::Pair:
            return "Pair of " + getPluralValueName(t[0]);
        case HandCategory::TwoPair:
            return "Two Pair, " + getPluralValueName(t[0]) + " and " + getPluralValueName(t[1]);
        case HandCategory::ThreeOfAKind:
            return "Three of a Kind, " + getPluralValueName(t[0]);
        case HandCategory::Straight:
            return "Straight, " + getValueName(t[0]) + " high";
        case HandCategory::Flush:
            return "Flush, " + getValueName(t[0]) + " high";
        case HandCategory::FullHouse:
            return "Full House, " + getPluralValueName(t[0]) + " full of " + getPluralValueName(t[1]);
        case HandCategory::FourOfAKind:
            return "Four of a Kind, " + getPluralValueName(t[0]);
        case HandCategory::StraightFlush:
            return "Straight Flush, " + getValueName(t[0]) + " high";
        case HandCategory::RoyalFlush:
            return "Royal Flush";
        default:
            assert(false);
            return "???";
    }
}
