#ifndef HAND_EVALUATION_HPP
#define HAND_EVALUATION_HPP

#include "game/game_types.hpp"
#include "game/holdem/config.hpp"
#include "util/result.hpp"

#include <array>
#include <compare>
#include <cstdint>
#include <string>
#include <vector>

// A five card hand. Comparison only looks at the category and tie-breaks,
// so two hands made from different suits compare equal (a split pot).
struct Hand {
    HandCategory category;

    // Ordered by priority: e.g. two pair is { high pair, low pair, kicker }
    std::vector<Value> tiebreaks;

    // The five cards, grouped cards first, then by descending value
    std::array<CardID, holdem::HandSize> cards;

    bool operator==(const Hand& rhs) const;
    std::strong_ordering operator<=>(const Hand& rhs) const;
};

Hand classifyFiveCardHand(const std::array<CardID, holdem::HandSize>& cards);
Result<Hand> getBestHand(const std::vector<CardID>& cards);

HandRank getHandRank(const Hand& hand);
HandRank getFiveCardHandRank(CardSet hand);
HandRank getBestHandRank(CardSet cards);
HandCategory getHandRankCategory(HandRank handRank);

std::string describeHand(const Hand& hand);

#endif // HAND_EVALUATION_HPP
