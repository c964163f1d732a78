#include "wizard/Scoring.hh"

#include <gtest/gtest.h>

TEST(ScoringTest, testExactBid)
{
    EXPECT_EQ(10, Wizard::calculateRoundScore(0, 0));
    EXPECT_EQ(40, Wizard::calculateRoundScore(3, 3));
}

TEST(ScoringTest, testMissedBid)
{
    EXPECT_EQ(-20, Wizard::calculateRoundScore(2, 0));
    EXPECT_EQ(-10, Wizard::calculateRoundScore(0, 1));
    EXPECT_EQ(-30, Wizard::calculateRoundScore(1, 4));
}
