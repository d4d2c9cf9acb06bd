#include "uno/Scoring.hh"

#include <gtest/gtest.h>

using Uno::CardType;
using Uno::Color;
using Uno::Rank;

TEST(ScoringTest, testCardPoints)
{
    EXPECT_EQ(0, Uno::cardPoints(CardType(Color::RED, Rank::ZERO)));
    EXPECT_EQ(7, Uno::cardPoints(CardType(Color::BLUE, Rank::SEVEN)));
    EXPECT_EQ(9, Uno::cardPoints(CardType(Color::GREEN, Rank::NINE)));
    EXPECT_EQ(20, Uno::cardPoints(CardType(Color::YELLOW, Rank::SKIP)));
    EXPECT_EQ(20, Uno::cardPoints(CardType(Color::RED, Rank::REVERSE)));
    EXPECT_EQ(20, Uno::cardPoints(CardType(Color::RED, Rank::DRAW_TWO)));
    EXPECT_EQ(50, Uno::cardPoints(CardType {Rank::WILD}));
    EXPECT_EQ(50, Uno::cardPoints(CardType {Rank::WILD_DRAW_FOUR}));
}

TEST(ScoringTest, testHandPoints)
{
    EXPECT_EQ(0, Uno::handPoints({}));
    EXPECT_EQ(
        73,
        Uno::handPoints({
            CardType(Color::RED, Rank::THREE), CardType {Rank::WILD},
            CardType(Color::BLUE, Rank::DRAW_TWO)}));
}

TEST(ScoringTest, testWinnerPoints)
{
    auto state = Uno::GameState {};
    state.seats.emplace_back("alice", 0);
    state.seats.emplace_back("bob", 1);
    state.seats.emplace_back("carol", 2);
    state.seats[0].hand = {CardType(Color::RED, Rank::NINE)};
    state.seats[1].hand = {CardType(Color::RED, Rank::FOUR)};
    state.seats[2].hand = {CardType(Color::RED, Rank::SKIP)};
    EXPECT_EQ(24, Uno::winnerPoints(state, "bob"));
}
