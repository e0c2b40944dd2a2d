#ifndef EQUITY_HPP
#define EQUITY_HPP

#include "game/game_types.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <vector>

struct EquityResult {
    // Share of the pot each player expects, sums to 1
    std::vector<double> equities;

    std::vector<double> winProbabilities;
    std::vector<double> tieProbabilities;
    std::int64_t numRunouts;
};

// Enumerates every way the board can be completed with the cards left in the deck.
// Each player needs exactly two hole cards. Uses every available thread when built with OpenMP.
Result<EquityResult> calculateEquity(
    const std::vector<std::vector<CardID>>& holeCards,
    const std::vector<CardID>& board,
    CardSet deadCards = 0
);

#endif // EQUITY_HPP
