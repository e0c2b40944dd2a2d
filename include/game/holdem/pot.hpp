#ifndef POT_HPP
#define POT_HPP

#include "game/game_types.hpp"
#include "game/holdem/hand_evaluation.hpp"
#include "util/result.hpp"

#include <optional>
#include <vector>

struct PotTier {
    int amount;
    int contributionLevel;
    std::vector<SeatIndex> eligibleSeats;

    bool operator==(const PotTier&) const = default;
};

struct PotAward {
    int tierIndex;
    int amount;
    std::vector<SeatIndex> winners;
    std::optional<Hand> winningHand;
};

struct PotDistribution {
    SeatArray<int> winnings;
    std::vector<PotAward> awards;
    bool wasUncontested;
};

// Contribution ledger for a single hand. Chips only ever go in, the ledger is
// cleared with reset() once the hand has been paid out.
class Pot {
public:
    Pot();

    Result<int> addContribution(SeatIndex seat, int amount);
    int getContribution(SeatIndex seat) const;
    bool hasContributed(SeatIndex seat) const;
    int getTotal() const;
    double getPotOdds(int callAmount) const;

    // Main pot first, then side pots in increasing contribution level
    Result<std::vector<PotTier>> derivePots(const SeatArray<bool>& folded) const;

    // Seats that are eligible for a tier must have a hand in showdownHands.
    // Odd chips go to the winner closest to the left of the button.
    Result<PotDistribution> distribute(
        const SeatArray<std::optional<Hand>>& showdownHands,
        const SeatArray<bool>& folded,
        SeatIndex buttonSeat
    ) const;

    void reset();

private:
    std::vector<SeatIndex> getLiveSeats(const SeatArray<bool>& folded) const;

    SeatArray<int> m_contributions;
    SeatArray<bool> m_hasContributed;
    int m_total;
};

#endif // POT_HPP
