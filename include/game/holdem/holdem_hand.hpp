#ifndef HOLDEM_HAND_HPP
#define HOLDEM_HAND_HPP

#include "game/game_types.hpp"
#include "game/holdem/betting_round.hpp"
#include "game/holdem/decision_source.hpp"
#include "game/holdem/hand_evaluation.hpp"
#include "game/holdem/pot.hpp"
#include "game/holdem/table.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <vector>

enum class ForcedBetType : std::uint8_t {
    Ante,
    SmallBlind,
    BigBlind
};

struct ForcedBet {
    SeatIndex seat;
    ForcedBetType type;
    int amount;
};

struct HandResult {
    PotDistribution distribution;

    // Empty when the pot was won uncontested
    std::vector<PotTier> tiers;

    SeatArray<std::optional<Hand>> showdownHands;
};

// Drives one hand at one table: forced bets, a betting round per street and the
// final payout. The hand owns its copy of the seats and the contribution ledger.
class HoldemHand {
public:
    static Result<HoldemHand> create(const TableSettings& settings, const Seats& seats, SeatIndex buttonSeat);

    // Antes go straight into the pot, blinds also count as the preflop street bet
    Result<int> postForcedBets();

    Result<CardSet> setHoleCards(SeatIndex seat, const std::vector<CardID>& cards);
    Result<CardSet> setBoard(const std::vector<CardID>& cards);

    // Plays the current street until the betting round is complete and moves on
    // to the next one. Returns the number of actions taken. A rejected action
    // aborts the hand.
    Result<int> playStreet(IDecisionSource& decisionSource);
    Result<int> playAllStreets(IDecisionSource& decisionSource);

    Result<HandResult> settle();

    const TableSettings& getSettings() const;
    const TablePositions& getPositions() const;
    const Seats& getSeats() const;
    const Pot& getPot() const;
    Street getStreet() const;
    bool isBettingOver() const;
    bool isSettled() const;
    int getNumPlayersInHand() const;
    const std::vector<CardID>& getBoard() const;
    const std::vector<CardID>& getHoleCards(SeatIndex seat) const;
    const std::vector<ForcedBet>& getForcedBets() const;
    const std::vector<ActionRecord>& getActionLog() const;

private:
    HoldemHand(const TableSettings& settings, const Seats& seats, const TablePositions& positions);

    Result<int> postForcedBet(SeatIndex seat, ForcedBetType type, int amount);
    CardSet getCardsInUse(std::optional<SeatIndex> excludedSeat, bool includeBoard) const;
    bool isBettingPossible() const;
    SeatArray<bool> getFoldedSeats() const;
    void finishStreet();

    TableSettings m_settings;
    TablePositions m_positions;
    Seats m_seats;
    Pot m_pot;

    Street m_street;
    bool m_hasPostedForcedBets;
    bool m_isBettingOver;
    bool m_isSettled;
    bool m_isAborted;

    SeatArray<std::vector<CardID>> m_holeCards;
    std::vector<CardID> m_board;
    std::vector<ForcedBet> m_forcedBets;
    std::vector<ActionRecord> m_actionLog;
};

#endif // HOLDEM_HAND_HPP
