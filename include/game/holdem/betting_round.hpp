#ifndef BETTING_ROUND_HPP
#define BETTING_ROUND_HPP

#include "game/game_types.hpp"
#include "game/holdem/action_rules.hpp"
#include "game/holdem/decision_source.hpp"
#include "game/holdem/pot.hpp"
#include "game/holdem/table.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>

struct ActionRecord {
    SeatIndex seat;
    Street street;
    PlayerDecision requested;
    ActionType action;
    int chipsCommitted;
    int streetBetAfter;
    int potAfter;
    bool isAllIn;
    bool isFullRaise;
    bool wasNormalized;
    std::string normalizationReason;
};

// Drives a single street. Borrows the seats and the hand's pot, so both must
// outlive the round. Street bets are cleared on construction for every street
// after preflop, preflop keeps the posted blinds.
class BettingRound {
public:
    BettingRound(Street street, const TableSettings& settings, const TablePositions& positions, Seats& seats, Pot& pot);

    Street getStreet() const;
    bool isComplete() const;
    std::optional<SeatIndex> getSeatToAct() const;

    int getHighestBet() const;
    int getMinRaiseIncrement() const;
    int getNumBetsThisStreet() const;
    bool hasActed(SeatIndex seat) const;
    bool isRaiseClosed(SeatIndex seat) const;

    LegalBounds getLegalBounds(SeatIndex seat) const;
    DecisionContext getDecisionContext() const;

    // Applies a decision for the seat to act. Under the strict policy an illegal
    // decision is rejected and the round is left untouched.
    Result<ActionRecord> applyDecision(const PlayerDecision& decision);

private:
    Result<ActionRecord> execute(SeatIndex seat, const PlayerDecision& requested, const EffectiveAction& effective);
    Result<int> commitChips(SeatIndex seat, int targetBet);
    void applyRaise(SeatIndex seat, int previousHighestBet, int previousMinRaise, ActionRecord& record);
    std::optional<SeatIndex> findNextSeatToAct(SeatIndex seat) const;
    bool isSeatInHand(SeatIndex seat) const;
    bool canSeatAct(SeatIndex seat) const;

    Street m_street;
    TableSettings m_settings;
    TablePositions m_positions;
    Seats& m_seats;
    Pot& m_pot;

    int m_highestBet;
    int m_minRaiseIncrement;
    int m_numBets;
    SeatArray<bool> m_hasActed;
    SeatArray<bool> m_isRaiseClosed;
    std::optional<SeatIndex> m_seatToAct;
};

#endif // BETTING_ROUND_HPP
