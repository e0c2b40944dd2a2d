#include "game/holdem/decision_source.hpp"

#include "game/game_types.hpp"
#include "game/holdem/action_rules.hpp"

#include <deque>

void ScriptedDecisionSource::addDecision(SeatIndex seat, const PlayerDecision& decision) {
    m_decisions[seat].push_back(decision);
}

PlayerDecision ScriptedDecisionSource::decide(const DecisionContext& context) {
    std::deque<PlayerDecision>& queue = m_decisions[context.seat];
    if (queue.empty()) {
        return { .action = context.canCheck ? ActionType::Check : ActionType::Fold, .amount = 0 };
    }

    PlayerDecision decision = queue.front();
    queue.pop_front();
    return decision;
}

int ScriptedDecisionSource::getNumRemainingDecisions() const {
    int numRemaining = 0;
    for (SeatIndex seat = 0; seat < MaxNumSeats; ++seat) {
        numRemaining += static_cast<int>(m_decisions[seat].size());
    }
    return numRemaining;
}

PlayerDecision PassiveDecisionSource::decide(const DecisionContext& context) {
    return { .action = context.canCheck ? ActionType::Check : ActionType::Call, .amount = 0 };
}
