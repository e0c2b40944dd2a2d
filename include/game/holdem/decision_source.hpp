#ifndef DECISION_SOURCE_HPP
#define DECISION_SOURCE_HPP

#include "game/game_types.hpp"
#include "game/holdem/action_rules.hpp"

#include <deque>
#include <optional>
#include <vector>

struct DecisionContext {
    SeatIndex seat;
    Street street;
    int highestBet;
    int streetBet;
    int stack;
    int callAmount;
    int minRaiseIncrement;
    int minRaiseTo;
    int maxRaiseTo;
    int potTotal;
    double potOdds;
    bool canCheck;
    bool canRaise;
    std::optional<int> fixedLimitBetSize;
};

class IDecisionSource {
public:
    virtual ~IDecisionSource() = default;

    virtual PlayerDecision decide(const DecisionContext& context) = 0;
};

// Replays queued decisions per seat. A seat with nothing queued checks when it can and folds otherwise.
class ScriptedDecisionSource final : public IDecisionSource {
public:
    ScriptedDecisionSource() = default;

    void addDecision(SeatIndex seat, const PlayerDecision& decision);
    PlayerDecision decide(const DecisionContext& context) override;
    int getNumRemainingDecisions() const;

private:
    SeatArray<std::deque<PlayerDecision>> m_decisions;
};

// Never puts in more than needed to stay in the hand
class PassiveDecisionSource final : public IDecisionSource {
public:
    PlayerDecision decide(const DecisionContext& context) override;
};

#endif // DECISION_SOURCE_HPP
