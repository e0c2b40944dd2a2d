#include "game/holdem/pot.hpp"

#include "game/game_types.hpp"
#include "game/holdem/config.hpp"
#include "game/holdem/hand_evaluation.hpp"
#include "util/result.hpp"

#include <algorithm>
#include <cassert>
#include <optional>
#include <string>
#include <vector>

namespace {
// Distance from the first seat left of the button, so the small blind (or the
// first live seat after it) comes first and the button comes last
int getSeatsLeftOfButton(SeatIndex seat, SeatIndex buttonSeat) {
    return (seat - buttonSeat - 1 + 2 * MaxNumSeats) % MaxNumSeats;
}

EngineError accountingError(const std::string& message) {
    return EngineError{ ErrorKind::PotAccountingViolation, "Pot accounting violation: " + message };
}
} // namespace

Pot::Pot() : m_total{ 0 } {
    m_contributions.fill(0);
    m_hasContributed.fill(false);
}

Result<int> Pot::addContribution(SeatIndex seat, int amount) {
    if (seat < 0 || seat >= MaxNumSeats) {
        return "Error adding contribution: Seat " + std::to_string(seat) + " does not exist.";
    }
    if (amount < 0) {
        return "Error adding contribution: Amount must be non-negative, got " + std::to_string(amount) + ".";
    }
    if (amount > holdem::MaxChips - m_contributions[seat]) {
        return "Error adding contribution: Seat " + std::to_string(seat) + " would contribute more than " + std::to_string(holdem::MaxChips) + " chips.";
    }

    m_contributions[seat] += amount;
    m_hasContributed[seat] = true;
    m_total += amount;
    return m_contributions[seat];
}

int Pot::getContribution(SeatIndex seat) const {
    return m_contributions[seat];
}

bool Pot::hasContributed(SeatIndex seat) const {
    return m_hasContributed[seat];
}

int Pot::getTotal() const {
    return m_total;
}

double Pot::getPotOdds(int callAmount) const {
    if (callAmount <= 0) {
        return 0.0;
    }
    return static_cast<double>(callAmount) / static_cast<double>(m_total + callAmount);
}

Result<std::vector<PotTier>> Pot::derivePots(const SeatArray<bool>& folded) const {
    // Distinct contribution levels across every contributor, folded or not
    std::vector<int> levels;
    for (SeatIndex seat = 0; seat < MaxNumSeats; ++seat) {
        if (m_hasContributed[seat] && m_contributions[seat] > 0) {
            levels.push_back(m_contributions[seat]);
        }
    }
    std::sort(levels.begin(), levels.end());
    levels.erase(std::unique(levels.begin(), levels.end()), levels.end());

    std::vector<PotTier> tiers;
    int previousLevel = 0;
    int carriedAmount = 0;

    for (int level : levels) {
        int numContributors = 0;
        std::vector<SeatIndex> eligibleSeats;
        for (SeatIndex seat = 0; seat < MaxNumSeats; ++seat) {
            if (m_hasContributed[seat] && m_contributions[seat] >= level) {
                ++numContributors;
                if (!folded[seat]) {
                    eligibleSeats.push_back(seat);
                }
            }
        }
        assert(numContributors > 0);

        int amount = (level - previousLevel) * numContributors + carriedAmount;
        previousLevel = level;

        if (eligibleSeats.empty()) {
            // Everyone who reached this level folded, so the chips roll into the next tier someone can win
            carriedAmount = amount;
            continue;
        }

        tiers.push_back({ .amount = amount, .contributionLevel = level, .eligibleSeats = std::move(eligibleSeats) });
        carriedAmount = 0;
    }

    if (carriedAmount > 0) {
        if (tiers.empty()) {
            return accountingError("every contributor has folded, " + std::to_string(carriedAmount) + " chips cannot be awarded.");
        }

        // Nobody live reached the top levels, the chips stay with the highest tier that can be won
        tiers.back().amount += carriedAmount;
    }

    int tierTotal = 0;
    for (const PotTier& tier : tiers) {
        tierTotal += tier.amount;
    }
    if (tierTotal != m_total) {
        return accountingError("tiers hold " + std::to_string(tierTotal) + " chips but " + std::to_string(m_total) + " were contributed.");
    }

    return tiers;
}

Result<PotDistribution> Pot::distribute(
    const SeatArray<std::optional<Hand>>& showdownHands,
    const SeatArray<bool>& folded,
    SeatIndex buttonSeat
) const {
    PotDistribution distribution;
    distribution.winnings.fill(0);
    distribution.wasUncontested = false;

    std::vector<SeatIndex> liveSeats = getLiveSeats(folded);
    if (liveSeats.empty()) {
        return accountingError("no live player is left to receive the pot.");
    }

    if (liveSeats.size() == 1) {
        // Everyone else folded, the last player takes everything without a showdown
        SeatIndex winner = liveSeats.front();
        distribution.winnings[winner] = m_total;
        distribution.awards.push_back({ .tierIndex = 0, .amount = m_total, .winners = { winner }, .winningHand = std::nullopt });
        distribution.wasUncontested = true;
        return distribution;
    }

    Result<std::vector<PotTier>> tiersResult = derivePots(folded);
    if (tiersResult.isError()) {
        return tiersResult.getEngineError();
    }
    const std::vector<PotTier>& tiers = tiersResult.getValue();

    for (int tierIndex = 0; tierIndex < static_cast<int>(tiers.size()); ++tierIndex) {
        const PotTier& tier = tiers[tierIndex];
        assert(!tier.eligibleSeats.empty());

        std::optional<Hand> bestHand;
        std::vector<SeatIndex> winners;
        for (SeatIndex seat : tier.eligibleSeats) {
            if (!showdownHands[seat]) {
                return EngineError{
                    ErrorKind::InvalidHandInput,
                    "Error distributing pot: Seat " + std::to_string(seat) + " is eligible for a pot but has no hand."
                };
            }

            const Hand& hand = *showdownHands[seat];
            if (!bestHand || hand > *bestHand) {
                bestHand = hand;
                winners = { seat };
            }
            else if (hand == *bestHand) {
                winners.push_back(seat);
            }
        }

        std::sort(winners.begin(), winners.end(), [buttonSeat](SeatIndex lhs, SeatIndex rhs) {
            return getSeatsLeftOfButton(lhs, buttonSeat) < getSeatsLeftOfButton(rhs, buttonSeat);
        });

        int numWinners = static_cast<int>(winners.size());
        int share = tier.amount / numWinners;
        int remainder = tier.amount % numWinners;
        for (SeatIndex winner : winners) {
            distribution.winnings[winner] += share;
        }
        distribution.winnings[winners.front()] += remainder;

        distribution.awards.push_back({ .tierIndex = tierIndex, .amount = tier.amount, .winners = winners, .winningHand = bestHand });
    }

    int totalPaid = 0;
    for (SeatIndex seat = 0; seat < MaxNumSeats; ++seat) {
        totalPaid += distribution.winnings[seat];
    }
    if (totalPaid != m_total) {
        return accountingError("paid out " + std::to_string(totalPaid) + " chips from a pot of " + std::to_string(m_total) + ".");
    }

    return distribution;
}

void Pot::reset() {
    m_contributions.fill(0);
    m_hasContributed.fill(false);
    m_total = 0;
}

std::vector<SeatIndex> Pot::getLiveSeats(const SeatArray<bool>& folded) const {
    std::vector<SeatIndex> liveSeats;
    for (SeatIndex seat = 0; seat < MaxNumSeats; ++seat) {
        if (m_hasContributed[seat] && !folded[seat]) {
            liveSeats.push_back(seat);
        }
    }
    return liveSeats;
}
