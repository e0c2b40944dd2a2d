#include "game/holdem/holdem_hand.hpp"

#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "game/holdem/betting_round.hpp"
#include "game/holdem/config.hpp"
#include "game/holdem/decision_source.hpp"
#include "game/holdem/hand_evaluation.hpp"
#include "game/holdem/pot.hpp"
#include "game/holdem/table.hpp"
#include "util/result.hpp"

#include <algorithm>
#include <cassert>
#include <optional>
#include <string>
#include <vector>

namespace {
Result<CardSet> addCardsToSet(CardSet usedCards, const std::vector<CardID>& cards) {
    for (CardID card : cards) {
        if (card >= holdem::DeckSize) {
            return "Error dealing cards: Invalid card id " + std::to_string(static_cast<int>(card)) + ".";
        }
        if (setContainsCard(usedCards, card)) {
            return "Error dealing cards: \"" + getNameFromCardID(card) + "\" has already been dealt.";
        }
        usedCards |= cardIDToSet(card);
    }
    return usedCards;
}
} // namespace

Result<HoldemHand> HoldemHand::create(const TableSettings& settings, const Seats& seats, SeatIndex buttonSeat) {
    Result<TableSettings> settingsResult = validateTableSettings(settings);
    if (settingsResult.isError()) {
        return settingsResult.getEngineError();
    }

    Result<TablePositions> positionsResult = getTablePositions(seats, buttonSeat);
    if (positionsResult.isError()) {
        return positionsResult.getEngineError();
    }

    for (SeatIndex seat = 0; seat < MaxNumSeats; ++seat) {
        if (seats[seat].isOccupied && seats[seat].stack <= 0) {
            return "Error starting hand: " + seats[seat].name + " in seat " + std::to_string(seat) + " has no chips.";
        }
        if (seats[seat].isOccupied && seats[seat].stack > holdem::MaxChips) {
            return "Error starting hand: " + seats[seat].name + " in seat " + std::to_string(seat) + " has more than " + std::to_string(holdem::MaxChips) + " chips.";
        }
    }

    return HoldemHand{ settings, seats, positionsResult.getValue() };
}

HoldemHand::HoldemHand(const TableSettings& settings, const Seats& seats, const TablePositions& positions) :
    m_settings{ settings },
    m_positions{ positions },
    m_seats{ seats },
    m_street{ Street::Preflop },
    m_hasPostedForcedBets{ false },
    m_isBettingOver{ false },
    m_isSettled{ false },
    m_isAborted{ false } {
    for (SeatIndex seat = 0; seat < MaxNumSeats; ++seat) {
        SeatState& seatState = m_seats[seat];
        seatState.streetBet = 0;
        seatState.hasFolded = false;
        seatState.isAllIn = false;
    }
}

Result<int> HoldemHand::postForcedBets() {
    if (m_hasPostedForcedBets) {
        return "Error posting blinds: Forced bets have already been posted.";
    }

    if (m_settings.ante > 0) {
        for (SeatIndex seat = 0; seat < MaxNumSeats; ++seat) {
            if (!m_seats[seat].isOccupied) {
                continue;
            }

            Result<int> anteResult = postForcedBet(seat, ForcedBetType::Ante, m_settings.ante);
            if (anteResult.isError()) {
                return anteResult;
            }
        }
    }

    Result<int> smallBlindResult = postForcedBet(m_positions.smallBlindSeat, ForcedBetType::SmallBlind, m_settings.smallBlind);
    if (smallBlindResult.isError()) {
        return smallBlindResult;
    }

    Result<int> bigBlindResult = postForcedBet(m_positions.bigBlindSeat, ForcedBetType::BigBlind, m_settings.bigBlind);
    if (bigBlindResult.isError()) {
        return bigBlindResult;
    }

    m_hasPostedForcedBets = true;
    return m_pot.getTotal();
}

Result<int> HoldemHand::postForcedBet(SeatIndex seat, ForcedBetType type, int amount) {
    SeatState& seatState = m_seats[seat];

    // A short stack posts whatever it has left and is all in
    int paid = std::min(amount, seatState.stack);
    if (paid <= 0) {
        return 0;
    }

    Result<int> contribution = m_pot.addContribution(seat, paid);
    if (contribution.isError()) {
        return contribution;
    }

    seatState.stack -= paid;
    if (type != ForcedBetType::Ante) {
        seatState.streetBet += paid;
    }
    if (seatState.stack == 0) {
        seatState.isAllIn = true;
    }

    m_forcedBets.push_back({ .seat = seat, .type = type, .amount = paid });
    return paid;
}

Result<CardSet> HoldemHand::setHoleCards(SeatIndex seat, const std::vector<CardID>& cards) {
    if (seat < 0 || seat >= MaxNumSeats || !m_seats[seat].isOccupied) {
        return "Error dealing cards: Seat " + std::to_string(seat) + " is not occupied.";
    }
    if (static_cast<int>(cards.size()) != holdem::NumHoleCards) {
        return "Error dealing cards: " + m_seats[seat].name + " must have exactly 2 hole cards, got " + std::to_string(cards.size()) + ".";
    }

    Result<CardSet> usedCards = addCardsToSet(getCardsInUse(seat, true), cards);
    if (usedCards.isError()) {
        return usedCards;
    }

    m_holeCards[seat] = cards;
    return cardListToSet(cards);
}

Result<CardSet> HoldemHand::setBoard(const std::vector<CardID>& cards) {
    if (static_cast<int>(cards.size()) > holdem::BoardSize) {
        return "Error dealing board: The board has at most 5 cards, got " + std::to_string(cards.size()) + ".";
    }

    Result<CardSet> usedCards = addCardsToSet(getCardsInUse(std::nullopt, false), cards);
    if (usedCards.isError()) {
        return usedCards;
    }

    m_board = cards;
    return cardListToSet(cards);
}

Result<int> HoldemHand::playStreet(IDecisionSource& decisionSource) {
    if (m_isAborted) {
        return "Error playing street: The hand was aborted.";
    }
    if (m_isSettled) {
        return "Error playing street: The hand has already been settled.";
    }
    if (!m_hasPostedForcedBets) {
        return "Error playing street: Forced bets have not been posted.";
    }
    if (m_isBettingOver) {
        return "Error playing street: Betting is over for this hand.";
    }

    if (!isBettingPossible()) {
        finishStreet();
        return 0;
    }

    BettingRound round{ m_street, m_settings, m_positions, m_seats, m_pot };

    int numActions = 0;
    while (round.getSeatToAct()) {
        PlayerDecision decision = decisionSource.decide(round.getDecisionContext());

        Result<ActionRecord> record = round.applyDecision(decision);
        if (record.isError()) {
            m_isAborted = true;
            return record.getEngineError();
        }

        m_actionLog.push_back(record.getValue());
        ++numActions;
    }

    finishStreet();
    return numActions;
}

Result<int> HoldemHand::playAllStreets(IDecisionSource& decisionSource) {
    int numActions = 0;
    while (!m_isBettingOver) {
        Result<int> streetResult = playStreet(decisionSource);
        if (streetResult.isError()) {
            return streetResult;
        }
        numActions += streetResult.getValue();
    }
    return numActions;
}

Result<HandResult> HoldemHand::settle() {
    if (m_isAborted) {
        return "Error settling hand: The hand was aborted.";
    }
    if (m_isSettled) {
        return "Error settling hand: The hand has already been settled.";
    }
    if (!m_hasPostedForcedBets) {
        return "Error settling hand: Forced bets have not been posted.";
    }

    int numPlayersInHand = getNumPlayersInHand();
    if (numPlayersInHand > 1 && !m_isBettingOver) {
        return "Error settling hand: Betting is still in progress on the " + getStreetName(m_street) + ".";
    }

    HandResult result;
    SeatArray<bool> folded = getFoldedSeats();

    if (numPlayersInHand > 1) {
        if (static_cast<int>(m_board.size()) != holdem::BoardSize) {
            return EngineError{
                ErrorKind::InvalidHandInput,
                "Error settling hand: A showdown needs a full board, got " + std::to_string(m_board.size()) + " cards."
            };
        }

        for (SeatIndex seat = 0; seat < MaxNumSeats; ++seat) {
            if (!m_seats[seat].isOccupied || folded[seat]) {
                continue;
            }
            if (static_cast<int>(m_holeCards[seat].size()) != holdem::NumHoleCards) {
                return EngineError{
                    ErrorKind::InvalidHandInput,
                    "Error settling hand: " + m_seats[seat].name + " reached showdown without hole cards."
                };
            }

            std::vector<CardID> cards = m_holeCards[seat];
            cards.insert(cards.end(), m_board.begin(), m_board.end());

            Result<Hand> handResult = getBestHand(cards);
            if (handResult.isError()) {
                return handResult.getEngineError();
            }
            result.showdownHands[seat] = handResult.getValue();
        }

        Result<std::vector<PotTier>> tiersResult = m_pot.derivePots(folded);
        if (tiersResult.isError()) {
            return tiersResult.getEngineError();
        }
        result.tiers = tiersResult.getValue();
    }

    Result<PotDistribution> distributionResult = m_pot.distribute(result.showdownHands, folded, m_positions.buttonSeat);
    if (distributionResult.isError()) {
        return distributionResult.getEngineError();
    }
    result.distribution = distributionResult.getValue();

    for (SeatIndex seat = 0; seat < MaxNumSeats; ++seat) {
        m_seats[seat].stack += result.distribution.winnings[seat];
    }

    m_isBettingOver = true;
    m_isSettled = true;
    return result;
}

const TableSettings& HoldemHand::getSettings() const {
    return m_settings;
}

const TablePositions& HoldemHand::getPositions() const {
    return m_positions;
}

const Seats& HoldemHand::getSeats() const {
    return m_seats;
}

const Pot& HoldemHand::getPot() const {
    return m_pot;
}

Street HoldemHand::getStreet() const {
    return m_street;
}

bool HoldemHand::isBettingOver() const {
    return m_isBettingOver;
}

bool HoldemHand::isSettled() const {
    return m_isSettled;
}

int HoldemHand::getNumPlayersInHand() const {
    int numPlayers = 0;
    for (SeatIndex seat = 0; seat < MaxNumSeats; ++seat) {
        if (m_seats[seat].isOccupied && !m_seats[seat].hasFolded) {
            ++numPlayers;
        }
    }
    return numPlayers;
}

const std::vector<CardID>& HoldemHand::getBoard() const {
    return m_board;
}

const std::vector<CardID>& HoldemHand::getHoleCards(SeatIndex seat) const {
    return m_holeCards[seat];
}

const std::vector<ForcedBet>& HoldemHand::getForcedBets() const {
    return m_forcedBets;
}

const std::vector<ActionRecord>& HoldemHand::getActionLog() const {
    return m_actionLog;
}

CardSet HoldemHand::getCardsInUse(std::optional<SeatIndex> excludedSeat, bool includeBoard) const {
    CardSet usedCards = 0;
    for (SeatIndex seat = 0; seat < MaxNumSeats; ++seat) {
        if (excludedSeat && seat == *excludedSeat) {
            continue;
        }
        usedCards |= cardListToSet(m_holeCards[seat]);
    }
    if (includeBoard) {
        usedCards |= cardListToSet(m_board);
    }
    return usedCards;
}

bool HoldemHand::isBettingPossible() const {
    if (getNumPlayersInHand() <= 1) {
        return false;
    }

    int highestBet = 0;
    for (SeatIndex seat = 0; seat < MaxNumSeats; ++seat) {
        if (m_seats[seat].isOccupied && !m_seats[seat].hasFolded) {
            highestBet = std::max(highestBet, m_seats[seat].streetBet);
        }
    }

    // With everyone else all in, a lone player only acts if they still have a bet to call
    int numCanAct = 0;
    bool mustCall = false;
    for (SeatIndex seat = 0; seat < MaxNumSeats; ++seat) {
        const SeatState& seatState = m_seats[seat];
        if (seatState.isOccupied && !seatState.hasFolded && !seatState.isAllIn) {
            ++numCanAct;
            mustCall |= (seatState.streetBet < highestBet);
        }
    }
    return numCanAct >= 2 || (numCanAct == 1 && mustCall);
}

SeatArray<bool> HoldemHand::getFoldedSeats() const {
    SeatArray<bool> folded;
    for (SeatIndex seat = 0; seat < MaxNumSeats; ++seat) {
        folded[seat] = m_seats[seat].isOccupied && m_seats[seat].hasFolded;
    }
    return folded;
}

void HoldemHand::finishStreet() {
    for (SeatIndex seat = 0; seat < MaxNumSeats; ++seat) {
        m_seats[seat].streetBet = 0;
    }

    if (m_street == Street::River || getNumPlayersInHand() <= 1) {
        m_isBettingOver = true;
    }
    else {
        m_street = nextStreet(m_street);
    }
}
