#include <gtest/gtest.h>

#include "game/game_types.hpp"
#include "game/holdem/config.hpp"
#include "game/holdem/hand_evaluation.hpp"
#include "game/holdem/parse_input.hpp"
#include "game/holdem/pot.hpp"
#include "util/result.hpp"

#include <optional>
#include <random>
#include <string>
#include <vector>

namespace {
Hand evaluate(const std::string& cardString) {
    return getBestHand(buildCardListFromString(cardString).getValue()).getValue();
}

SeatArray<bool> noFolds() {
    SeatArray<bool> folded;
    folded.fill(false);
    return folded;
}

class PotTest : public ::testing::Test {
protected:
    static constexpr SeatIndex A = 0;
    static constexpr SeatIndex B = 1;
    static constexpr SeatIndex C = 2;

    void contribute(SeatIndex seat, int amount) {
        ASSERT_TRUE(pot.addContribution(seat, amount).isValue());
    }

    Pot pot;
    SeatArray<std::optional<Hand>> hands;
};
} // namespace

TEST_F(PotTest, SidePotsFromUnevenAllIns) {
    contribute(A, 1000);
    contribute(B, 500);
    contribute(C, 200);

    Result<std::vector<PotTier>> tiersResult = pot.derivePots(noFolds());
    ASSERT_TRUE(tiersResult.isValue());
    const std::vector<PotTier>& tiers = tiersResult.getValue();

    std::vector<PotTier> expectedTiers = {
        { .amount = 600, .contributionLevel = 200, .eligibleSeats = { A, B, C } },
        { .amount = 600, .contributionLevel = 500, .eligibleSeats = { A, B } },
        { .amount = 500, .contributionLevel = 1000, .eligibleSeats = { A } },
    };
    EXPECT_EQ(tiers, expectedTiers);
    EXPECT_EQ(pot.getTotal(), 1700);
}

TEST_F(PotTest, EachTierGoesToTheBestEligibleHand) {
    contribute(A, 1000);
    contribute(B, 500);
    contribute(C, 200);

    hands[A] = evaluate("2c 3d 5h 7s 9c");
    hands[B] = evaluate("Kc Kd 5h 7s 9c");
    hands[C] = evaluate("Ac Ad 5h 7s 9c");

    Result<PotDistribution> distributionResult = pot.distribute(hands, noFolds(), A);
    ASSERT_TRUE(distributionResult.isValue());
    const PotDistribution& distribution = distributionResult.getValue();

    EXPECT_FALSE(distribution.wasUncontested);
    EXPECT_EQ(distribution.winnings[C], 600);
    EXPECT_EQ(distribution.winnings[B], 600);
    EXPECT_EQ(distribution.winnings[A], 500);

    ASSERT_EQ(distribution.awards.size(), 3);
    EXPECT_EQ(distribution.awards[0].winners, std::vector<SeatIndex>{ C });
    EXPECT_EQ(distribution.awards[1].winners, std::vector<SeatIndex>{ B });
    EXPECT_EQ(distribution.awards[2].winners, std::vector<SeatIndex>{ A });
}

TEST_F(PotTest, FoldedChipsStayInThePot) {
    contribute(A, 100);
    contribute(B, 100);
    contribute(C, 100);

    SeatArray<bool> folded = noFolds();
    folded[A] = true;

    Result<std::vector<PotTier>> tiersResult = pot.derivePots(folded);
    ASSERT_TRUE(tiersResult.isValue());
    ASSERT_EQ(tiersResult.getValue().size(), 1);
    EXPECT_EQ(tiersResult.getValue()[0].amount, 300);
    EXPECT_EQ(tiersResult.getValue()[0].eligibleSeats, (std::vector<SeatIndex>{ B, C }));
}

TEST_F(PotTest, ChipsAboveEveryLivePlayerMergeIntoTheLastTier) {
    contribute(A, 300);
    contribute(B, 100);
    contribute(C, 200);

    SeatArray<bool> folded = noFolds();
    folded[A] = true;

    Result<std::vector<PotTier>> tiersResult = pot.derivePots(folded);
    ASSERT_TRUE(tiersResult.isValue());
    const std::vector<PotTier>& tiers = tiersResult.getValue();

    ASSERT_EQ(tiers.size(), 2);
    EXPECT_EQ(tiers[0].amount, 300);
    EXPECT_EQ(tiers[0].eligibleSeats, (std::vector<SeatIndex>{ B, C }));
    EXPECT_EQ(tiers[1].amount, 300);
    EXPECT_EQ(tiers[1].eligibleSeats, std::vector<SeatIndex>{ C });
}

TEST_F(PotTest, LastLivePlayerWinsUncontested) {
    contribute(A, 500);
    contribute(B, 100);
    contribute(C, 300);

    SeatArray<bool> folded = noFolds();
    folded[A] = true;
    folded[C] = true;

    // No hands are needed without a showdown
    Result<PotDistribution> distributionResult = pot.distribute(hands, folded, A);
    ASSERT_TRUE(distributionResult.isValue());
    const PotDistribution& distribution = distributionResult.getValue();

    EXPECT_TRUE(distribution.wasUncontested);
    EXPECT_EQ(distribution.winnings[B], 900);
    EXPECT_EQ(distribution.winnings[A], 0);
    EXPECT_EQ(distribution.winnings[C], 0);
}

TEST_F(PotTest, OddChipGoesToTheWinnerLeftOfTheButton) {
    contribute(0, 33);
    contribute(1, 34);
    contribute(3, 34);

    SeatArray<bool> folded = noFolds();
    folded[0] = true;

    hands[1] = evaluate("Ac Kd 9h 7s 3c");
    hands[3] = evaluate("Ad Kc 9s 7h 3d");

    Result<PotDistribution> buttonOnSeat2 = pot.distribute(hands, folded, 2);
    ASSERT_TRUE(buttonOnSeat2.isValue());
    EXPECT_EQ(buttonOnSeat2.getValue().winnings[3], 51);
    EXPECT_EQ(buttonOnSeat2.getValue().winnings[1], 50);

    Result<PotDistribution> buttonOnSeat0 = pot.distribute(hands, folded, 0);
    ASSERT_TRUE(buttonOnSeat0.isValue());
    EXPECT_EQ(buttonOnSeat0.getValue().winnings[1], 51);
    EXPECT_EQ(buttonOnSeat0.getValue().winnings[3], 50);
}

TEST_F(PotTest, RemainderOfAThreeWaySplitGoesToOneWinner) {
    contribute(A, 45);
    contribute(B, 45);
    contribute(C, 45);
    contribute(3, 2);

    SeatArray<bool> folded = noFolds();
    folded[3] = true;

    hands[A] = evaluate("Ac Kd 9h 7s 3c");
    hands[B] = evaluate("Ad Kc 9s 7h 3d");
    hands[C] = evaluate("Ah Ks 9c 7d 3h");

    // Main pot of 8 splits 2 each with 2 left over, the side pot of 129 splits evenly
    Result<PotDistribution> buttonOnSeat3 = pot.distribute(hands, folded, 3);
    ASSERT_TRUE(buttonOnSeat3.isValue());
    EXPECT_EQ(buttonOnSeat3.getValue().winnings[A], 47);
    EXPECT_EQ(buttonOnSeat3.getValue().winnings[B], 45);
    EXPECT_EQ(buttonOnSeat3.getValue().winnings[C], 45);
    EXPECT_EQ(buttonOnSeat3.getValue().winnings[3], 0);

    Result<PotDistribution> buttonOnSeat1 = pot.distribute(hands, folded, 1);
    ASSERT_TRUE(buttonOnSeat1.isValue());
    EXPECT_EQ(buttonOnSeat1.getValue().winnings[C], 47);
    EXPECT_EQ(buttonOnSeat1.getValue().winnings[A], 45);
    EXPECT_EQ(buttonOnSeat1.getValue().winnings[B], 45);
}

TEST_F(PotTest, ContributionsAboveTheChipLimitAreRejected) {
    Result<int> hugeContribution = pot.addContribution(A, 2000000000);
    ASSERT_TRUE(hugeContribution.isError());
    EXPECT_EQ(hugeContribution.getErrorKind(), ErrorKind::InvalidInput);
    EXPECT_EQ(pot.getTotal(), 0);
    EXPECT_FALSE(pot.hasContributed(A));

    contribute(A, holdem::MaxChips - 10);
    contribute(A, 10);
    Result<int> overLimit = pot.addContribution(A, 1);
    ASSERT_TRUE(overLimit.isError());
    EXPECT_EQ(overLimit.getErrorKind(), ErrorKind::InvalidInput);
    EXPECT_EQ(pot.getContribution(A), holdem::MaxChips);
}

TEST_F(PotTest, FullTableAtTheChipLimitPaysOutExactly) {
    for (SeatIndex seat = 0; seat < MaxNumSeats; ++seat) {
        contribute(seat, holdem::MaxChips);
    }
    EXPECT_EQ(pot.getTotal(), MaxNumSeats * holdem::MaxChips);

    hands[A] = evaluate("As Ks Qs Js Ts");
    for (SeatIndex seat = 1; seat < MaxNumSeats; ++seat) {
        hands[seat] = evaluate("2c 3d 4h 5s 7c");
    }

    Result<PotDistribution> distributionResult = pot.distribute(hands, noFolds(), 0);
    ASSERT_TRUE(distributionResult.isValue());
    EXPECT_EQ(distributionResult.getValue().winnings[A], MaxNumSeats * holdem::MaxChips);
}

TEST_F(PotTest, NegativeContributionIsRejected) {
    contribute(A, 50);

    Result<int> contributionResult = pot.addContribution(B, -5);
    ASSERT_TRUE(contributionResult.isError());
    EXPECT_EQ(contributionResult.getErrorKind(), ErrorKind::InvalidInput);
    EXPECT_EQ(pot.getTotal(), 50);
    EXPECT_FALSE(pot.hasContributed(B));
}

TEST_F(PotTest, ContributionsAccumulate) {
    contribute(A, 10);
    contribute(A, 30);
    contribute(B, 0);

    EXPECT_EQ(pot.getContribution(A), 40);
    EXPECT_EQ(pot.getContribution(B), 0);
    EXPECT_TRUE(pot.hasContributed(B));
    EXPECT_EQ(pot.getTotal(), 40);

    pot.reset();
    EXPECT_EQ(pot.getTotal(), 0);
    EXPECT_FALSE(pot.hasContributed(A));
}

TEST_F(PotTest, MissingHandForEligibleSeatIsAnError) {
    contribute(A, 100);
    contribute(B, 100);
    hands[A] = evaluate("Ac Kd 9h 7s 3c");

    Result<PotDistribution> distributionResult = pot.distribute(hands, noFolds(), A);
    ASSERT_TRUE(distributionResult.isError());
    EXPECT_EQ(distributionResult.getErrorKind(), ErrorKind::InvalidHandInput);
}

TEST_F(PotTest, EveryoneFoldedIsAnAccountingViolation) {
    contribute(A, 100);
    contribute(B, 100);

    SeatArray<bool> folded = noFolds();
    folded[A] = true;
    folded[B] = true;

    Result<std::vector<PotTier>> tiersResult = pot.derivePots(folded);
    ASSERT_TRUE(tiersResult.isError());
    EXPECT_EQ(tiersResult.getErrorKind(), ErrorKind::PotAccountingViolation);

    Result<PotDistribution> distributionResult = pot.distribute(hands, folded, A);
    ASSERT_TRUE(distributionResult.isError());
    EXPECT_EQ(distributionResult.getErrorKind(), ErrorKind::PotAccountingViolation);
}

TEST_F(PotTest, PotOdds) {
    contribute(A, 50);
    contribute(B, 50);

    EXPECT_DOUBLE_EQ(pot.getPotOdds(50), 50.0 / 150.0);
    EXPECT_DOUBLE_EQ(pot.getPotOdds(0), 0.0);
}

TEST(PotPropertyTest, TiersAlwaysSumToTheTotal) {
    std::mt19937 rng(7);
    std::uniform_int_distribution<int> amountDistribution(0, 1000);
    std::uniform_int_distribution<int> coinFlip(0, 1);

    for (int trial = 0; trial < 500; ++trial) {
        Pot pot;
        SeatArray<bool> folded;
        folded.fill(false);

        int numSeats = 2 + trial % (MaxNumSeats - 1);
        for (SeatIndex seat = 0; seat < numSeats; ++seat) {
            ASSERT_TRUE(pot.addContribution(seat, amountDistribution(rng)).isValue());
            folded[seat] = (coinFlip(rng) == 1);
        }

        // Keep the biggest contributor live so every chip has somewhere to go
        folded[0] = false;
        ASSERT_TRUE(pot.addContribution(0, 1001).isValue());

        Result<std::vector<PotTier>> tiersResult = pot.derivePots(folded);
        ASSERT_TRUE(tiersResult.isValue());

        int tierTotal = 0;
        for (const PotTier& tier : tiersResult.getValue()) {
            EXPECT_FALSE(tier.eligibleSeats.empty());
            tierTotal += tier.amount;
        }
        EXPECT_EQ(tierTotal, pot.getTotal());
    }
}
