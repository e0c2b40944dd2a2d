#include "game/holdem/equity.hpp"

#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "game/holdem/config.hpp"
#include "game/holdem/hand_evaluation.hpp"
#include "util/result.hpp"

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace {
constexpr CardSet Deck = (1ULL << holdem::DeckSize) - 1;

void collectRunouts(const std::vector<CardID>& deck, int start, int numCardsLeft, CardSet partialRunout, std::vector<CardSet>& runouts) {
    if (numCardsLeft == 0) {
        runouts.push_back(partialRunout);
        return;
    }

    int deckSize = static_cast<int>(deck.size());
    for (int i = start; i <= deckSize - numCardsLeft; ++i) {
        collectRunouts(deck, i + 1, numCardsLeft - 1, partialRunout | cardIDToSet(deck[i]), runouts);
    }
}

struct EquityTotals {
    std::vector<double> equities;
    std::vector<std::int64_t> wins;
    std::vector<std::int64_t> ties;

    explicit EquityTotals(int numPlayers) : equities(numPlayers, 0.0), wins(numPlayers, 0), ties(numPlayers, 0) {}

    void add(const EquityTotals& other) {
        for (std::size_t i = 0; i < equities.size(); ++i) {
            equities[i] += other.equities[i];
            wins[i] += other.wins[i];
            ties[i] += other.ties[i];
        }
    }
};

void scoreRunout(const std::vector<CardSet>& holeCardSets, CardSet board, std::vector<HandRank>& ranks, EquityTotals& totals) {
    int numPlayers = static_cast<int>(holeCardSets.size());

    HandRank bestRank = 0;
    for (int player = 0; player < numPlayers; ++player) {
        ranks[player] = getBestHandRank(holeCardSets[player] | board);
        bestRank = std::max(bestRank, ranks[player]);
    }

    int numWinners = static_cast<int>(std::count(ranks.begin(), ranks.end(), bestRank));
    for (int player = 0; player < numPlayers; ++player) {
        if (ranks[player] != bestRank) {
            continue;
        }

        totals.equities[player] += 1.0 / numWinners;
        if (numWinners == 1) {
            ++totals.wins[player];
        }
        else {
            ++totals.ties[player];
        }
    }
}
} // namespace

Result<EquityResult> calculateEquity(
    const std::vector<std::vector<CardID>>& holeCards,
    const std::vector<CardID>& board,
    CardSet deadCards
) {
    int numPlayers = static_cast<int>(holeCards.size());
    if (numPlayers < 2 || numPlayers > MaxNumSeats) {
        return "Error calculating equity: Need between 2 and " + std::to_string(MaxNumSeats) + " players, got " + std::to_string(numPlayers) + ".";
    }
    if (static_cast<int>(board.size()) > holdem::BoardSize) {
        return "Error calculating equity: The board has at most 5 cards, got " + std::to_string(board.size()) + ".";
    }
    if ((deadCards & ~Deck) != 0) {
        return "Error calculating equity: Dead cards contain an invalid card.";
    }

    CardSet usedCards = deadCards;
    auto useCards = [&usedCards](const std::vector<CardID>& cards) -> std::optional<std::string> {
        for (CardID card : cards) {
            if (card >= holdem::DeckSize) {
                return "Error calculating equity: Invalid card id " + std::to_string(static_cast<int>(card)) + ".";
            }
            if (setContainsCard(usedCards, card)) {
                return "Error calculating equity: \"" + getNameFromCardID(card) + "\" is used more than once.";
            }
            usedCards |= cardIDToSet(card);
        }
        return std::nullopt;
    };

    std::vector<CardSet> holeCardSets;
    for (const std::vector<CardID>& hand : holeCards) {
        if (static_cast<int>(hand.size()) != holdem::NumHoleCards) {
            return "Error calculating equity: Every player needs exactly 2 hole cards, got " + std::to_string(hand.size()) + ".";
        }
        if (std::optional<std::string> error = useCards(hand)) {
            return *error;
        }
        holeCardSets.push_back(cardListToSet(hand));
    }

    if (std::optional<std::string> error = useCards(board)) {
        return *error;
    }
    CardSet boardSet = cardListToSet(board);

    std::vector<CardID> remainingDeck;
    CardSet remainingCards = Deck & ~usedCards;
    while (remainingCards != 0) {
        remainingDeck.push_back(popLowestCardFromSet(remainingCards));
    }

    int numCardsToDeal = holdem::BoardSize - static_cast<int>(board.size());
    if (static_cast<int>(remainingDeck.size()) < numCardsToDeal) {
        return "Error calculating equity: Not enough cards left to complete the board.";
    }

    std::vector<CardSet> runouts;
    collectRunouts(remainingDeck, 0, numCardsToDeal, boardSet, runouts);
    std::int64_t numRunouts = static_cast<std::int64_t>(runouts.size());
    assert(numRunouts > 0);

    EquityTotals totals(numPlayers);

    #ifdef _OPENMP
    #pragma omp parallel
    {
        EquityTotals threadTotals(numPlayers);
        std::vector<HandRank> ranks(numPlayers);

        #pragma omp for schedule(static)
        for (std::int64_t i = 0; i < numRunouts; ++i) {
            scoreRunout(holeCardSets, runouts[i], ranks, threadTotals);
        }

        #pragma omp critical
        totals.add(threadTotals);
    }
    #else
    std::vector<HandRank> ranks(numPlayers);
    for (std::int64_t i = 0; i < numRunouts; ++i) {
        scoreRunout(holeCardSets, runouts[i], ranks, totals);
    }
    #endif

    EquityResult result;
    result.numRunouts = numRunouts;
    for (int player = 0; player < numPlayers; ++player) {
        result.equities.push_back(totals.equities[player] / static_cast<double>(numRunouts));
        result.winProbabilities.push_back(static_cast<double>(totals.wins[player]) / static_cast<double>(numRunouts));
        result.tieProbabilities.push_back(static_cast<double>(totals.ties[player]) / static_cast<double>(numRunouts));
    }
    return result;
}
