#include "game/holdem/action_rules.hpp"

#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "util/result.hpp"

#include <algorithm>
#include <cassert>
#include <string>

namespace {
EffectiveAction makeAction(ActionType action, int targetBet) {
    return { .action = action, .targetBet = targetBet, .wasNormalized = false, .normalizationReason = "" };
}

// Passive fallback for an aggressive action that cannot go through
EffectiveAction downgradeToCall(const LegalBounds& bounds, const std::string& reason) {
    EffectiveAction action = bounds.canCheck()
        ? makeAction(ActionType::Check, bounds.streetBet)
        : makeAction(ActionType::Call, std::min(bounds.highestBet, bounds.getMaxRaiseTo()));
    action.wasNormalized = true;
    action.normalizationReason = reason;
    return action;
}

EffectiveAction normalizeRaise(int requestedTarget, const LegalBounds& bounds) {
    if (!bounds.isRaiseOpen) {
        return downgradeToCall(bounds, "raising is closed for this player");
    }

    // Fixed limit raises are always exactly one bet over the current bet
    int target = bounds.fixedLimitRaiseTo ? *bounds.fixedLimitRaiseTo : requestedTarget;
    target = std::min(target, bounds.getMaxRaiseTo());

    if (target <= bounds.highestBet) {
        return downgradeToCall(bounds, "raise to " + std::to_string(target) + " does not exceed the current bet of " + std::to_string(bounds.highestBet));
    }

    // Only an all-in may be smaller than the minimum raise
    if (target < bounds.minRaiseTo && target < bounds.getMaxRaiseTo()) {
        return downgradeToCall(bounds, "raise to " + std::to_string(target) + " is below the minimum raise to " + std::to_string(bounds.minRaiseTo));
    }

    return makeAction(ActionType::Raise, target);
}
} // namespace

int LegalBounds::getCallAmount() const {
    return std::max(0, std::min(highestBet - streetBet, stack));
}

bool LegalBounds::canCheck() const {
    return streetBet >= highestBet;
}

bool LegalBounds::canRaise() const {
    return isRaiseOpen && getMaxRaiseTo() > highestBet;
}

EffectiveAction normalizeAction(const PlayerDecision& decision, const LegalBounds& bounds) {
    switch (decision.action) {
        case ActionType::Fold:
            return makeAction(ActionType::Fold, bounds.streetBet);

        case ActionType::Check:
            if (bounds.canCheck()) {
                return makeAction(ActionType::Check, bounds.streetBet);
            }
            else {
                EffectiveAction fold = makeAction(ActionType::Fold, bounds.streetBet);
                fold.wasNormalized = true;
                fold.normalizationReason = "cannot check facing a bet of " + std::to_string(bounds.highestBet);
                return fold;
            }

        case ActionType::Call:
            // Calling with nothing to call is just a check
            if (bounds.canCheck()) {
                return makeAction(ActionType::Check, bounds.streetBet);
            }
            return makeAction(ActionType::Call, std::min(bounds.highestBet, bounds.getMaxRaiseTo()));

        case ActionType::Raise:
            return normalizeRaise(decision.amount, bounds);

        case ActionType::AllIn:
            // Fixed limit has no all-in sizing, it is a regular raise that gets clamped
            if (bounds.fixedLimitRaiseTo) {
                return normalizeRaise(bounds.getMaxRaiseTo(), bounds);
            }
            if (bounds.getMaxRaiseTo() <= bounds.highestBet) {
                return makeAction(ActionType::Call, bounds.getMaxRaiseTo());
            }
            if (!bounds.isRaiseOpen) {
                return downgradeToCall(bounds, "raising is closed for this player");
            }
            return makeAction(ActionType::Raise, bounds.getMaxRaiseTo());

        default:
            assert(false);
            return makeAction(ActionType::Fold, bounds.streetBet);
    }
}

Result<EffectiveAction> validateAction(const PlayerDecision& decision, const LegalBounds& bounds) {
    EffectiveAction action = normalizeAction(decision, bounds);
    if (action.wasNormalized) {
        return EngineError{
            ErrorKind::IllegalAction,
            "Illegal action " + getActionTypeName(decision.action) + ": " + action.normalizationReason + "."
        };
    }
    return action;
}
