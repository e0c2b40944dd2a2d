#include <gtest/gtest.h>

#include "game/game_types.hpp"
#include "game/holdem/action_rules.hpp"
#include "game/holdem/betting_round.hpp"
#include "game/holdem/pot.hpp"
#include "game/holdem/table.hpp"
#include "util/result.hpp"

#include <initializer_list>
#include <optional>
#include <string>
#include <utility>

namespace {
TableSettings makeSettings(BettingStructure structure, ActionPolicy actionPolicy = ActionPolicy::Normalize) {
    return {
        .structure = structure,
        .smallBlind = 5,
        .bigBlind = 10,
        .ante = 0,
        .actionPolicy = actionPolicy
    };
}

Seats makeSeats(std::initializer_list<std::pair<SeatIndex, int>> stacks) {
    Seats seats;
    for (const auto& [seat, stack] : stacks) {
        seats[seat] = {
            .name = "Seat" + std::to_string(seat),
            .stack = stack,
            .streetBet = 0,
            .isOccupied = true,
            .hasFolded = false,
            .isAllIn = false
        };
    }
    return seats;
}

void postBlind(Seats& seats, Pot& pot, SeatIndex seat, int amount) {
    ASSERT_TRUE(pot.addContribution(seat, amount).isValue());
    seats[seat].stack -= amount;
    seats[seat].streetBet += amount;
}

PlayerDecision fold() {
    return { .action = ActionType::Fold, .amount = 0 };
}

PlayerDecision check() {
    return { .action = ActionType::Check, .amount = 0 };
}

PlayerDecision call() {
    return { .action = ActionType::Call, .amount = 0 };
}

PlayerDecision raiseTo(int amount) {
    return { .action = ActionType::Raise, .amount = amount };
}

PlayerDecision allIn() {
    return { .action = ActionType::AllIn, .amount = 0 };
}

ActionRecord act(BettingRound& round, const PlayerDecision& decision) {
    Result<ActionRecord> recordResult = round.applyDecision(decision);
    EXPECT_TRUE(recordResult.isValue());
    return recordResult.getValue();
}
} // namespace

TEST(BettingRoundTest, EveryoneChecksAndTheRoundCompletes) {
    Seats seats = makeSeats({ { 0, 1000 }, { 1, 1000 }, { 2, 1000 } });
    Pot pot;
    TablePositions positions = getTablePositions(seats, 0).getValue();
    BettingRound round(Street::Flop, makeSettings(BettingStructure::NoLimit), positions, seats, pot);

    EXPECT_FALSE(round.isComplete());
    EXPECT_EQ(round.getHighestBet(), 0);

    // Postflop action starts left of the button
    EXPECT_EQ(round.getSeatToAct(), 1);
    act(round, check());
    EXPECT_EQ(round.getSeatToAct(), 2);
    act(round, check());
    EXPECT_EQ(round.getSeatToAct(), 0);
    EXPECT_FALSE(round.isComplete());
    act(round, check());

    EXPECT_TRUE(round.isComplete());
    EXPECT_EQ(round.getSeatToAct(), std::nullopt);
    EXPECT_EQ(pot.getTotal(), 0);
    for (SeatIndex seat = 0; seat < 3; ++seat) {
        EXPECT_EQ(seats[seat].stack, 1000);
        EXPECT_EQ(seats[seat].streetBet, 0);
    }
}

TEST(BettingRoundTest, ShortAllInDoesNotReopenRaising) {
    Seats seats = makeSeats({ { 0, 1000 }, { 1, 1000 }, { 2, 150 } });
    Pot pot;
    TablePositions positions = getTablePositions(seats, 0).getValue();
    BettingRound round(Street::Flop, makeSettings(BettingStructure::NoLimit), positions, seats, pot);

    ActionRecord bet = act(round, raiseTo(100));
    EXPECT_TRUE(bet.isFullRaise);
    EXPECT_EQ(round.getMinRaiseIncrement(), 100);

    ActionRecord shortAllIn = act(round, allIn());
    EXPECT_EQ(shortAllIn.action, ActionType::Raise);
    EXPECT_TRUE(shortAllIn.isAllIn);
    EXPECT_FALSE(shortAllIn.isFullRaise);
    EXPECT_EQ(round.getHighestBet(), 150);
    EXPECT_EQ(round.getMinRaiseIncrement(), 100);

    // Seat 0 has not acted yet so it may still raise, seat 1 may not
    EXPECT_FALSE(round.isRaiseClosed(0));
    EXPECT_TRUE(round.isRaiseClosed(1));
    EXPECT_EQ(round.getLegalBounds(0).minRaiseTo, 250);

    act(round, call());
    EXPECT_EQ(round.getSeatToAct(), 1);
    EXPECT_FALSE(round.getDecisionContext().canRaise);

    ActionRecord blockedRaise = act(round, raiseTo(400));
    EXPECT_EQ(blockedRaise.action, ActionType::Call);
    EXPECT_TRUE(blockedRaise.wasNormalized);
    EXPECT_EQ(blockedRaise.chipsCommitted, 50);

    EXPECT_TRUE(round.isComplete());
    EXPECT_EQ(pot.getTotal(), 450);
}

TEST(BettingRoundTest, FullRaiseReopensTheAction) {
    Seats seats = makeSeats({ { 0, 1000 }, { 1, 1000 }, { 2, 1000 } });
    Pot pot;
    TablePositions positions = getTablePositions(seats, 0).getValue();
    BettingRound round(Street::Flop, makeSettings(BettingStructure::NoLimit), positions, seats, pot);

    act(round, raiseTo(20));
    ActionRecord reraise = act(round, raiseTo(60));
    EXPECT_TRUE(reraise.isFullRaise);
    EXPECT_FALSE(round.hasActed(1));
    EXPECT_EQ(round.getMinRaiseIncrement(), 40);

    act(round, fold());
    EXPECT_EQ(round.getSeatToAct(), 1);
    EXPECT_TRUE(round.getDecisionContext().canRaise);

    ActionRecord fourBet = act(round, raiseTo(200));
    EXPECT_TRUE(fourBet.isFullRaise);
    EXPECT_EQ(round.getMinRaiseIncrement(), 140);
    EXPECT_EQ(round.getNumBetsThisStreet(), 3);
    EXPECT_EQ(round.getSeatToAct(), 2);

    act(round, call());
    EXPECT_TRUE(round.isComplete());
    EXPECT_EQ(pot.getTotal(), 400);
}

TEST(BettingRoundTest, BigBlindGetsTheOption) {
    Seats seats = makeSeats({ { 0, 1000 }, { 1, 1000 }, { 2, 1000 } });
    Pot pot;
    TablePositions positions = getTablePositions(seats, 0).getValue();
    postBlind(seats, pot, positions.smallBlindSeat, 5);
    postBlind(seats, pot, positions.bigBlindSeat, 10);
    BettingRound round(Street::Preflop, makeSettings(BettingStructure::NoLimit), positions, seats, pot);

    EXPECT_EQ(round.getHighestBet(), 10);

    // Preflop action starts left of the big blind
    EXPECT_EQ(round.getSeatToAct(), 0);
    act(round, call());
    act(round, call());

    // Everyone matched the big blind, but the big blind has not acted yet
    EXPECT_FALSE(round.isComplete());
    EXPECT_EQ(round.getSeatToAct(), 2);
    EXPECT_TRUE(round.getDecisionContext().canCheck);

    ActionRecord option = act(round, check());
    EXPECT_EQ(option.action, ActionType::Check);
    EXPECT_TRUE(round.isComplete());
    EXPECT_EQ(pot.getTotal(), 30);
}

TEST(BettingRoundTest, HeadsUpButtonActsFirstPreflopAndLastPostflop) {
    Seats seats = makeSeats({ { 3, 500 }, { 7, 500 } });
    Pot pot;
    TablePositions positions = getTablePositions(seats, 7).getValue();
    EXPECT_EQ(positions.smallBlindSeat, 7);
    EXPECT_EQ(positions.bigBlindSeat, 3);

    postBlind(seats, pot, positions.smallBlindSeat, 5);
    postBlind(seats, pot, positions.bigBlindSeat, 10);
    TableSettings settings = makeSettings(BettingStructure::NoLimit);

    BettingRound preflop(Street::Preflop, settings, positions, seats, pot);
    EXPECT_EQ(preflop.getSeatToAct(), 7);
    act(preflop, call());
    EXPECT_EQ(preflop.getSeatToAct(), 3);
    act(preflop, check());
    EXPECT_TRUE(preflop.isComplete());

    BettingRound flop(Street::Flop, settings, positions, seats, pot);
    EXPECT_EQ(seats[3].streetBet, 0);
    EXPECT_EQ(seats[7].streetBet, 0);
    EXPECT_EQ(flop.getSeatToAct(), 3);
}

TEST(BettingRoundTest, FixedLimitCapsBetsAtFourIncludingTheBigBlind) {
    Seats seats = makeSeats({ { 0, 1000 }, { 1, 1000 }, { 2, 1000 } });
    Pot pot;
    TablePositions positions = getTablePositions(seats, 0).getValue();
    postBlind(seats, pot, positions.smallBlindSeat, 5);
    postBlind(seats, pot, positions.bigBlindSeat, 10);
    BettingRound round(Street::Preflop, makeSettings(BettingStructure::FixedLimit), positions, seats, pot);

    EXPECT_EQ(round.getNumBetsThisStreet(), 1);

    // Fixed limit raises are always one bet, whatever amount is requested
    ActionRecord raise = act(round, raiseTo(500));
    EXPECT_EQ(raise.streetBetAfter, 20);
    act(round, raiseTo(0));
    act(round, raiseTo(0));
    EXPECT_EQ(round.getHighestBet(), 40);
    EXPECT_EQ(round.getNumBetsThisStreet(), 4);

    EXPECT_EQ(round.getSeatToAct(), 0);
    EXPECT_FALSE(round.getDecisionContext().canRaise);
    ActionRecord capped = act(round, raiseTo(50));
    EXPECT_EQ(capped.action, ActionType::Call);
    EXPECT_TRUE(capped.wasNormalized);
    EXPECT_EQ(capped.streetBetAfter, 40);

    act(round, call());
    EXPECT_TRUE(round.isComplete());
    EXPECT_EQ(pot.getTotal(), 120);
}

TEST(BettingRoundTest, FixedLimitTurnUsesTheBigBet) {
    Seats seats = makeSeats({ { 0, 1000 }, { 1, 1000 } });
    Pot pot;
    TablePositions positions = getTablePositions(seats, 0).getValue();
    BettingRound round(Street::Turn, makeSettings(BettingStructure::FixedLimit), positions, seats, pot);

    EXPECT_EQ(round.getNumBetsThisStreet(), 0);
    EXPECT_EQ(round.getDecisionContext().fixedLimitBetSize, 20);

    ActionRecord bet = act(round, raiseTo(5));
    EXPECT_EQ(bet.streetBetAfter, 20);
    ActionRecord raise = act(round, allIn());
    EXPECT_EQ(raise.action, ActionType::Raise);
    EXPECT_EQ(raise.streetBetAfter, 40);
}

TEST(BettingRoundTest, CheckFacingABetBecomesAFold) {
    Seats seats = makeSeats({ { 0, 1000 }, { 1, 1000 }, { 2, 1000 } });
    Pot pot;
    TablePositions positions = getTablePositions(seats, 0).getValue();
    BettingRound round(Street::River, makeSettings(BettingStructure::NoLimit), positions, seats, pot);

    act(round, raiseTo(50));
    ActionRecord record = act(round, check());
    EXPECT_EQ(record.requested.action, ActionType::Check);
    EXPECT_EQ(record.action, ActionType::Fold);
    EXPECT_TRUE(record.wasNormalized);
    EXPECT_TRUE(seats[2].hasFolded);
}

TEST(BettingRoundTest, RaiseBelowTheMinimumBecomesACall) {
    Seats seats = makeSeats({ { 0, 1000 }, { 1, 1000 } });
    Pot pot;
    TablePositions positions = getTablePositions(seats, 0).getValue();
    BettingRound round(Street::Flop, makeSettings(BettingStructure::NoLimit), positions, seats, pot);

    act(round, raiseTo(100));
    ActionRecord record = act(round, raiseTo(150));
    EXPECT_EQ(record.action, ActionType::Call);
    EXPECT_TRUE(record.wasNormalized);
    EXPECT_EQ(record.chipsCommitted, 100);
    EXPECT_TRUE(round.isComplete());
}

TEST(BettingRoundTest, CallingMoreThanTheStackGoesAllIn) {
    Seats seats = makeSeats({ { 0, 1000 }, { 1, 60 } });
    Pot pot;
    TablePositions positions = getTablePositions(seats, 0).getValue();
    BettingRound round(Street::Flop, makeSettings(BettingStructure::NoLimit), positions, seats, pot);

    EXPECT_EQ(round.getSeatToAct(), 1);
    act(round, check());
    act(round, raiseTo(200));

    ActionRecord record = act(round, call());
    EXPECT_EQ(record.chipsCommitted, 60);
    EXPECT_TRUE(record.isAllIn);
    EXPECT_EQ(seats[1].stack, 0);
    EXPECT_TRUE(round.isComplete());
    EXPECT_EQ(pot.getTotal(), 260);
}

TEST(BettingRoundTest, StrictPolicyRejectsWithoutChangingState) {
    Seats seats = makeSeats({ { 0, 1000 }, { 1, 1000 } });
    Pot pot;
    TablePositions positions = getTablePositions(seats, 0).getValue();
    BettingRound round(Street::Flop, makeSettings(BettingStructure::NoLimit, ActionPolicy::Strict), positions, seats, pot);

    act(round, raiseTo(100));
    Seats seatsBefore = seats;

    Result<ActionRecord> rejected = round.applyDecision(check());
    ASSERT_TRUE(rejected.isError());
    EXPECT_EQ(rejected.getErrorKind(), ErrorKind::IllegalAction);
    EXPECT_EQ(round.getSeatToAct(), 0);
    EXPECT_EQ(pot.getTotal(), 100);
    EXPECT_EQ(round.getHighestBet(), 100);
    EXPECT_FALSE(seats[0].hasFolded);
    EXPECT_EQ(seats[0].stack, seatsBefore[0].stack);

    Result<ActionRecord> tooSmall = round.applyDecision(raiseTo(150));
    ASSERT_TRUE(tooSmall.isError());
    EXPECT_EQ(tooSmall.getErrorKind(), ErrorKind::IllegalAction);

    act(round, raiseTo(300));
    EXPECT_EQ(round.getHighestBet(), 300);
}

TEST(BettingRoundTest, ActingAfterTheRoundIsCompleteIsIllegal) {
    Seats seats = makeSeats({ { 0, 1000 }, { 1, 1000 } });
    Pot pot;
    TablePositions positions = getTablePositions(seats, 0).getValue();
    BettingRound round(Street::Flop, makeSettings(BettingStructure::NoLimit), positions, seats, pot);

    act(round, raiseTo(10));
    act(round, fold());
    EXPECT_TRUE(round.isComplete());

    Result<ActionRecord> late = round.applyDecision(check());
    ASSERT_TRUE(late.isError());
    EXPECT_EQ(late.getErrorKind(), ErrorKind::IllegalAction);
}

TEST(BettingRoundTest, SkipsEmptyFoldedAndAllInSeats) {
    Seats seats = makeSeats({ { 1, 1000 }, { 4, 1000 }, { 6, 1000 }, { 8, 1000 } });
    seats[4].hasFolded = true;
    seats[6].isAllIn = true;
    seats[6].stack = 0;
    Pot pot;
    TablePositions positions = getTablePositions(seats, 1).getValue();
    BettingRound round(Street::Turn, makeSettings(BettingStructure::NoLimit), positions, seats, pot);

    EXPECT_EQ(round.getSeatToAct(), 8);
    act(round, check());
    EXPECT_EQ(round.getSeatToAct(), 1);
    act(round, check());
    EXPECT_TRUE(round.isComplete());
}

TEST(BettingRoundTest, DecisionContextDescribesTheSeatToAct) {
    Seats seats = makeSeats({ { 0, 1000 }, { 1, 1000 } });
    Pot pot;
    TablePositions positions = getTablePositions(seats, 0).getValue();
    BettingRound round(Street::Flop, makeSettings(BettingStructure::NoLimit), positions, seats, pot);

    act(round, raiseTo(40));
    DecisionContext context = round.getDecisionContext();
    EXPECT_EQ(context.seat, 0);
    EXPECT_EQ(context.street, Street::Flop);
    EXPECT_EQ(context.callAmount, 40);
    EXPECT_EQ(context.minRaiseTo, 80);
    EXPECT_EQ(context.maxRaiseTo, 1000);
    EXPECT_EQ(context.potTotal, 40);
    EXPECT_DOUBLE_EQ(context.potOdds, 0.5);
    EXPECT_FALSE(context.canCheck);
    EXPECT_TRUE(context.canRaise);
    EXPECT_EQ(context.fixedLimitBetSize, std::nullopt);
}

TEST(ActionRulesTest, NormalizesIllegalDecisions) {
    LegalBounds facingBet = {
        .highestBet = 100,
        .streetBet = 20,
        .stack = 500,
        .minRaiseTo = 200,
        .isRaiseOpen = true,
        .fixedLimitRaiseTo = std::nullopt
    };
    EXPECT_EQ(facingBet.getCallAmount(), 80);
    EXPECT_FALSE(facingBet.canCheck());
    EXPECT_EQ(facingBet.getMaxRaiseTo(), 520);

    EffectiveAction checkAction = normalizeAction(check(), facingBet);
    EXPECT_EQ(checkAction.action, ActionType::Fold);
    EXPECT_TRUE(checkAction.wasNormalized);

    EffectiveAction notARaise = normalizeAction(raiseTo(90), facingBet);
    EXPECT_EQ(notARaise.action, ActionType::Call);
    EXPECT_EQ(notARaise.targetBet, 100);
    EXPECT_TRUE(notARaise.wasNormalized);

    EffectiveAction overStack = normalizeAction(raiseTo(5000), facingBet);
    EXPECT_EQ(overStack.action, ActionType::Raise);
    EXPECT_EQ(overStack.targetBet, 520);
    EXPECT_FALSE(overStack.wasNormalized);

    EffectiveAction shove = normalizeAction(allIn(), facingBet);
    EXPECT_EQ(shove.action, ActionType::Raise);
    EXPECT_EQ(shove.targetBet, 520);
}

TEST(ActionRulesTest, CallWithNothingToCallIsACheck) {
    LegalBounds unopened = {
        .highestBet = 0,
        .streetBet = 0,
        .stack = 500,
        .minRaiseTo = 10,
        .isRaiseOpen = true,
        .fixedLimitRaiseTo = std::nullopt
    };

    EffectiveAction action = normalizeAction(call(), unopened);
    EXPECT_EQ(action.action, ActionType::Check);
    EXPECT_FALSE(action.wasNormalized);
    EXPECT_TRUE(validateAction(call(), unopened).isValue());
}

TEST(ActionRulesTest, AllInBelowTheCallIsACall) {
    LegalBounds shortStack = {
        .highestBet = 100,
        .streetBet = 0,
        .stack = 30,
        .minRaiseTo = 200,
        .isRaiseOpen = true,
        .fixedLimitRaiseTo = std::nullopt
    };

    EXPECT_EQ(shortStack.getCallAmount(), 30);
    EXPECT_FALSE(shortStack.canRaise());

    EffectiveAction action = normalizeAction(allIn(), shortStack);
    EXPECT_EQ(action.action, ActionType::Call);
    EXPECT_EQ(action.targetBet, 30);
}

TEST(ActionRulesTest, ValidateRejectsWhatNormalizeWouldChange) {
    LegalBounds closed = {
        .highestBet = 100,
        .streetBet = 50,
        .stack = 500,
        .minRaiseTo = 150,
        .isRaiseOpen = false,
        .fixedLimitRaiseTo = std::nullopt
    };

    Result<EffectiveAction> raiseResult = validateAction(raiseTo(300), closed);
    ASSERT_TRUE(raiseResult.isError());
    EXPECT_EQ(raiseResult.getErrorKind(), ErrorKind::IllegalAction);

    Result<EffectiveAction> callResult = validateAction(call(), closed);
    ASSERT_TRUE(callResult.isValue());
    EXPECT_EQ(callResult.getValue().targetBet, 100);

    EXPECT_TRUE(validateAction(fold(), closed).isValue());
}
