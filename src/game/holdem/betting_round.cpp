#include "game/holdem/betting_round.hpp"

#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "game/holdem/action_rules.hpp"
#include "game/holdem/config.hpp"
#include "game/holdem/decision_source.hpp"
#include "game/holdem/pot.hpp"
#include "game/holdem/table.hpp"
#include "util/result.hpp"

#include <algorithm>
#include <cassert>
#include <optional>
#include <string>

BettingRound::BettingRound(
    Street street,
    const TableSettings& settings,
    const TablePositions& positions,
    Seats& seats,
    Pot& pot
) :
    m_street{ street },
    m_settings{ settings },
    m_positions{ positions },
    m_seats{ seats },
    m_pot{ pot },
    m_highestBet{ 0 },
    m_minRaiseIncrement{ 0 },
    m_numBets{ 0 },
    m_seatToAct{ std::nullopt } {
    m_hasActed.fill(false);
    m_isRaiseClosed.fill(false);

    if (m_street != Street::Preflop) {
        for (SeatIndex seat = 0; seat < MaxNumSeats; ++seat) {
            m_seats[seat].streetBet = 0;
        }
    }

    for (SeatIndex seat = 0; seat < MaxNumSeats; ++seat) {
        if (isSeatInHand(seat)) {
            m_highestBet = std::max(m_highestBet, m_seats[seat].streetBet);
        }
    }

    if (m_settings.structure == BettingStructure::FixedLimit) {
        m_minRaiseIncrement = getFixedLimitBetSize(m_settings, m_street);
    }
    else {
        m_minRaiseIncrement = m_settings.bigBlind;
    }

    // The posted big blind counts as the first bet of the preflop cap
    m_numBets = (m_street == Street::Preflop && m_highestBet > 0) ? 1 : 0;

    if (!isComplete()) {
        SeatIndex seatBeforeFirst = (m_street == Street::Preflop) ? m_positions.bigBlindSeat : m_positions.buttonSeat;
        m_seatToAct = findNextSeatToAct(seatBeforeFirst);
    }
}

Street BettingRound::getStreet() const {
    return m_street;
}

bool BettingRound::isComplete() const {
    int numInHand = 0;
    for (SeatIndex seat = 0; seat < MaxNumSeats; ++seat) {
        if (isSeatInHand(seat)) {
            ++numInHand;
        }
    }
    if (numInHand <= 1) {
        return true;
    }

    for (SeatIndex seat = 0; seat < MaxNumSeats; ++seat) {
        if (canSeatAct(seat) && (!m_hasActed[seat] || m_seats[seat].streetBet != m_highestBet)) {
            return false;
        }
    }
    return true;
}

std::optional<SeatIndex> BettingRound::getSeatToAct() const {
    return m_seatToAct;
}

int BettingRound::getHighestBet() const {
    return m_highestBet;
}

int BettingRound::getMinRaiseIncrement() const {
    return m_minRaiseIncrement;
}

int BettingRound::getNumBetsThisStreet() const {
    return m_numBets;
}

bool BettingRound::hasActed(SeatIndex seat) const {
    return m_hasActed[seat];
}

bool BettingRound::isRaiseClosed(SeatIndex seat) const {
    return m_isRaiseClosed[seat];
}

LegalBounds BettingRound::getLegalBounds(SeatIndex seat) const {
    const SeatState& seatState = m_seats[seat];
    bool isFixedLimit = (m_settings.structure == BettingStructure::FixedLimit);
    bool isCapped = isFixedLimit && (m_numBets >= holdem::FixedLimitMaxBetsPerStreet);

    LegalBounds bounds = {
        .highestBet = m_highestBet,
        .streetBet = seatState.streetBet,
        .stack = seatState.stack,
        .minRaiseTo = m_highestBet + m_minRaiseIncrement,
        .isRaiseOpen = !m_isRaiseClosed[seat] && !isCapped,
        .fixedLimitRaiseTo = std::nullopt
    };
    if (isFixedLimit) {
        bounds.fixedLimitRaiseTo = m_highestBet + getFixedLimitBetSize(m_settings, m_street);
    }
    return bounds;
}

DecisionContext BettingRound::getDecisionContext() const {
    assert(m_seatToAct);
    SeatIndex seat = *m_seatToAct;
    LegalBounds bounds = getLegalBounds(seat);

    DecisionContext context = {
        .seat = seat,
        .street = m_street,
        .highestBet = m_highestBet,
        .streetBet = bounds.streetBet,
        .stack = bounds.stack,
        .callAmount = bounds.getCallAmount(),
        .minRaiseIncrement = m_minRaiseIncrement,
        .minRaiseTo = bounds.fixedLimitRaiseTo ? *bounds.fixedLimitRaiseTo : bounds.minRaiseTo,
        .maxRaiseTo = bounds.getMaxRaiseTo(),
        .potTotal = m_pot.getTotal(),
        .potOdds = m_pot.getPotOdds(bounds.getCallAmount()),
        .canCheck = bounds.canCheck(),
        .canRaise = bounds.canRaise(),
        .fixedLimitBetSize = std::nullopt
    };
    if (m_settings.structure == BettingStructure::FixedLimit) {
        context.fixedLimitBetSize = getFixedLimitBetSize(m_settings, m_street);
    }
    return context;
}

Result<ActionRecord> BettingRound::applyDecision(const PlayerDecision& decision) {
    if (!m_seatToAct) {
        return EngineError{
            ErrorKind::IllegalAction,
            "Illegal action: The " + getStreetName(m_street) + " betting round is already complete."
        };
    }

    SeatIndex seat = *m_seatToAct;
    LegalBounds bounds = getLegalBounds(seat);

    if (m_settings.actionPolicy == ActionPolicy::Strict) {
        Result<EffectiveAction> validated = validateAction(decision, bounds);
        if (validated.isError()) {
            return EngineError{
                validated.getErrorKind(),
                m_seats[seat].name + ": " + validated.getError()
            };
        }
        return execute(seat, decision, validated.getValue());
    }

    return execute(seat, decision, normalizeAction(decision, bounds));
}

Result<ActionRecord> BettingRound::execute(SeatIndex seat, const PlayerDecision& requested, const EffectiveAction& effective) {
    int previousHighestBet = m_highestBet;
    int previousMinRaise = m_minRaiseIncrement;

    ActionRecord record = {
        .seat = seat,
        .street = m_street,
        .requested = requested,
        .action = effective.action,
        .chipsCommitted = 0,
        .streetBetAfter = m_seats[seat].streetBet,
        .potAfter = m_pot.getTotal(),
        .isAllIn = false,
        .isFullRaise = false,
        .wasNormalized = effective.wasNormalized,
        .normalizationReason = effective.normalizationReason
    };

    switch (effective.action) {
        case ActionType::Fold:
            m_seats[seat].hasFolded = true;
            break;

        case ActionType::Check:
            break;

        case ActionType::Call:
        case ActionType::Raise: {
            Result<int> committed = commitChips(seat, effective.targetBet);
            if (committed.isError()) {
                return committed.getEngineError();
            }
            record.chipsCommitted = committed.getValue();
            break;
        }

        default:
            assert(false);
            break;
    }

    m_hasActed[seat] = true;

    if (effective.action == ActionType::Raise) {
        applyRaise(seat, previousHighestBet, previousMinRaise, record);
    }

    record.streetBetAfter = m_seats[seat].streetBet;
    record.potAfter = m_pot.getTotal();
    record.isAllIn = m_seats[seat].isAllIn;

    m_seatToAct = isComplete() ? std::nullopt : findNextSeatToAct(seat);
    return record;
}

Result<int> BettingRound::commitChips(SeatIndex seat, int targetBet) {
    SeatState& seatState = m_seats[seat];
    int amount = std::min(targetBet - seatState.streetBet, seatState.stack);
    if (amount <= 0) {
        return 0;
    }

    // The ledger rejects the chips before the seat is touched, so a failure leaves both unchanged
    Result<int> contribution = m_pot.addContribution(seat, amount);
    if (contribution.isError()) {
        return contribution.getEngineError();
    }

    seatState.stack -= amount;
    seatState.streetBet += amount;
    if (seatState.stack == 0) {
        seatState.isAllIn = true;
    }
    return amount;
}

void BettingRound::applyRaise(SeatIndex seat, int previousHighestBet, int previousMinRaise, ActionRecord& record) {
    int newBet = m_seats[seat].streetBet;
    if (newBet <= previousHighestBet) {
        // A raise that was cut short by the stack ends up as a call
        record.action = ActionType::Call;
        return;
    }

    m_highestBet = newBet;
    int raiseSize = newBet - previousHighestBet;

    if (raiseSize >= previousMinRaise) {
        record.isFullRaise = true;
        m_minRaiseIncrement = raiseSize;
        ++m_numBets;
        m_isRaiseClosed.fill(false);

        for (SeatIndex other = 0; other < MaxNumSeats; ++other) {
            if (other != seat && canSeatAct(other)) {
                m_hasActed[other] = false;
            }
        }
    }
    else {
        // A short all-in does not reopen the betting for anyone who already acted
        for (SeatIndex other = 0; other < MaxNumSeats; ++other) {
            if (other != seat && canSeatAct(other) && m_hasActed[other]) {
                m_isRaiseClosed[other] = true;
            }
        }
    }
}

std::optional<SeatIndex> BettingRound::findNextSeatToAct(SeatIndex seat) const {
    for (int offset = 1; offset <= MaxNumSeats; ++offset) {
        SeatIndex nextSeat = (seat + offset) % MaxNumSeats;
        if (!canSeatAct(nextSeat)) {
            continue;
        }
        if (!m_hasActed[nextSeat] || m_seats[nextSeat].streetBet < m_highestBet) {
            return nextSeat;
        }
    }
    return std::nullopt;
}

bool BettingRound::isSeatInHand(SeatIndex seat) const {
    return m_seats[seat].isOccupied && !m_seats[seat].hasFolded;
}

bool BettingRound::canSeatAct(SeatIndex seat) const {
    return isSeatInHand(seat) && !m_seats[seat].isAllIn;
}
