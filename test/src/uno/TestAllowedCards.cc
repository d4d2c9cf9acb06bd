#include "uno/AllowedCards.hh"
#include "TestUtility.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using Uno::CardType;
using Uno::Cards;
using Uno::Color;
using Uno::Rank;

using testing::ElementsAre;
using testing::IsEmpty;

namespace {
const auto RED_FIVE = CardType(Color::RED, Rank::FIVE);
}

class AllowedCardsTest : public testing::Test {
protected:
    Cards hand {
        CardType(Color::BLUE, Rank::FIVE),
        CardType(Color::GREEN, Rank::SEVEN),
        CardType(Color::RED, Rank::SKIP),
        CardType {Rank::WILD},
        CardType(Color::YELLOW, Rank::TWO),
    };
};

TEST_F(AllowedCardsTest, testMatchingColor)
{
    const auto red_one = CardType(Color::RED, Rank::ONE);
    EXPECT_TRUE(Uno::isLegal(red_one, RED_FIVE, Color::RED));
    EXPECT_FALSE(Uno::isLegal(red_one, RED_FIVE, Color::BLUE));
}

TEST_F(AllowedCardsTest, testMatchingRank)
{
    EXPECT_TRUE(
        Uno::isLegal(CardType(Color::GREEN, Rank::FIVE), RED_FIVE, Color::RED));
}

TEST_F(AllowedCardsTest, testWildIsAlwaysLegal)
{
    for (const auto color : Uno::COLORS) {
        EXPECT_TRUE(Uno::isLegal(CardType {Rank::WILD}, RED_FIVE, color));
        EXPECT_TRUE(
            Uno::isLegal(CardType {Rank::WILD_DRAW_FOUR}, RED_FIVE, color));
    }
}

TEST_F(AllowedCardsTest, testMatchingCurrentColorAfterWild)
{
    const auto wild = CardType {Rank::WILD};
    EXPECT_TRUE(
        Uno::isLegal(CardType(Color::GREEN, Rank::TWO), wild, Color::GREEN));
    EXPECT_FALSE(
        Uno::isLegal(CardType(Color::RED, Rank::TWO), wild, Color::GREEN));
}

TEST_F(AllowedCardsTest, testLegalCardsInHandOrder)
{
    EXPECT_THAT(
        Uno::vectorize(Uno::legalCards(hand, RED_FIVE, Color::RED)),
        ElementsAre(hand[0], hand[2], hand[3]));
}

TEST_F(AllowedCardsTest, testLegalCardsAreSound)
{
    for (const auto color : Uno::COLORS) {
        for (const auto& card : Uno::legalCards(hand, RED_FIVE, color)) {
            EXPECT_TRUE(Uno::isLegal(card, RED_FIVE, color));
        }
    }
}

TEST_F(AllowedCardsTest, testLegalCardsIsRestartable)
{
    auto legal = Uno::legalCards(hand, RED_FIVE, Color::YELLOW);
    const auto first = Uno::vectorize(legal);
    const auto second = Uno::vectorize(legal);
    EXPECT_EQ(first, second);
    EXPECT_THAT(first, ElementsAre(hand[0], hand[3], hand[4]));
}

TEST_F(AllowedCardsTest, testNoLegalCards)
{
    const auto hand2 = Cards {CardType(Color::BLUE, Rank::ONE)};
    EXPECT_THAT(
        Uno::vectorize(Uno::legalCards(hand2, RED_FIVE, Color::RED)),
        IsEmpty());
}
