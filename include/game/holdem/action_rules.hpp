#ifndef ACTION_RULES_HPP
#define ACTION_RULES_HPP

#include "game/game_types.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>

struct PlayerDecision {
    ActionType action;

    // Raise amounts are the total street bet to raise to, other actions ignore it
    int amount;

    bool operator==(const PlayerDecision&) const = default;
};

// Everything the rules need to know about one seat facing the current street
struct LegalBounds {
    int highestBet;
    int streetBet;
    int stack;
    int minRaiseTo;
    bool isRaiseOpen;
    std::optional<int> fixedLimitRaiseTo;

    int getMaxRaiseTo() const {
        return streetBet + stack;
    }

    int getCallAmount() const;
    bool canCheck() const;
    bool canRaise() const;
};

struct EffectiveAction {
    // Always one of Fold, Check, Call or Raise
    ActionType action;

    // Street bet once the action has been executed
    int targetBet;

    bool wasNormalized;
    std::string normalizationReason;
};

EffectiveAction normalizeAction(const PlayerDecision& decision, const LegalBounds& bounds);
Result<EffectiveAction> validateAction(const PlayerDecision& decision, const LegalBounds& bounds);

#endif // ACTION_RULES_HPP
