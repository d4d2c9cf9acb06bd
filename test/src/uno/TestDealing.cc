#include "uno/Dealing.hh"
#include "uno/UnoConstants.hh"

#include <gtest/gtest.h>

#include <stdexcept>

using Uno::CardType;
using Uno::Cards;
using Uno::Color;
using Uno::Rank;

namespace {

const auto PLAYERS = std::vector<Uno::PlayerId> {"alice", "bob", "carol"};

Cards numberedCards(const int n)
{
    auto ret = Cards {};
    for (auto i = 0; i < n; ++i) {
        ret.emplace_back(Uno::COLORS[i % 4], static_cast<Rank>(i % 10));
    }
    return ret;
}

}

TEST(DealingTest, testDealRoundRobinFromTop)
{
    const auto deck = numberedCards(10);
    const auto result = Uno::deal(PLAYERS, 2, deck);
    ASSERT_EQ(3u, result.hands.size());
    EXPECT_EQ((Cards {deck[9], deck[6]}), result.hands.at("alice"));
    EXPECT_EQ((Cards {deck[8], deck[5]}), result.hands.at("bob"));
    EXPECT_EQ((Cards {deck[7], deck[4]}), result.hands.at("carol"));
    EXPECT_EQ((Cards(deck.begin(), deck.begin() + 4)), result.remainingDeck);
}

TEST(DealingTest, testDealStandardDeck)
{
    const auto result = Uno::deal(
        PLAYERS, Uno::DEFAULT_CARDS_PER_PLAYER, Uno::buildStandardDeck());
    for (const auto& player : PLAYERS) {
        EXPECT_EQ(
            Uno::DEFAULT_CARDS_PER_PLAYER,
            static_cast<int>(result.hands.at(player).size()));
    }
    EXPECT_EQ(
        Uno::N_CARDS - 3 * Uno::DEFAULT_CARDS_PER_PLAYER,
        static_cast<int>(result.remainingDeck.size()));
}

TEST(DealingTest, testDealShortDeck)
{
    const auto result = Uno::deal(PLAYERS, 3, numberedCards(7));
    EXPECT_EQ(3u, result.hands.at("alice").size());
    EXPECT_EQ(2u, result.hands.at("bob").size());
    EXPECT_EQ(2u, result.hands.at("carol").size());
    EXPECT_TRUE(result.remainingDeck.empty());
}

TEST(DealingTest, testDealZeroCards)
{
    const auto deck = numberedCards(5);
    const auto result = Uno::deal(PLAYERS, 0, deck);
    EXPECT_TRUE(result.hands.at("bob").empty());
    EXPECT_EQ(deck, result.remainingDeck);
}

TEST(DealingTest, testDealNegativeCards)
{
    EXPECT_THROW(
        Uno::deal(PLAYERS, -1, numberedCards(5)), std::invalid_argument);
}

TEST(DealingTest, testInitialDiscardPrefersColoredNumber)
{
    const auto deck = Cards {
        CardType(Color::BLUE, Rank::FOUR),
        CardType(Color::RED, Rank::EIGHT),
        CardType(Color::GREEN, Rank::SKIP),
        CardType {Rank::WILD},
    };
    const auto result = Uno::selectInitialDiscard(deck);
    EXPECT_EQ(CardType(Color::RED, Rank::EIGHT), result.card);
    EXPECT_EQ(
        (Cards {
            CardType(Color::BLUE, Rank::FOUR),
            CardType(Color::GREEN, Rank::SKIP),
            CardType {Rank::WILD}}),
        result.remainingDeck);
}

TEST(DealingTest, testInitialDiscardFallsBackToActionCard)
{
    const auto deck = Cards {
        CardType(Color::YELLOW, Rank::REVERSE),
        CardType {Rank::WILD_DRAW_FOUR},
    };
    const auto result = Uno::selectInitialDiscard(deck);
    EXPECT_EQ(CardType(Color::YELLOW, Rank::REVERSE), result.card);
    EXPECT_EQ((Cards {CardType {Rank::WILD_DRAW_FOUR}}), result.remainingDeck);
}

TEST(DealingTest, testInitialDiscardFallsBackToTopCard)
{
    const auto deck = Cards {
        CardType {Rank::WILD}, CardType {Rank::WILD_DRAW_FOUR}};
    const auto result = Uno::selectInitialDiscard(deck);
    EXPECT_EQ(CardType {Rank::WILD_DRAW_FOUR}, result.card);
    EXPECT_EQ((Cards {CardType {Rank::WILD}}), result.remainingDeck);
}

TEST(DealingTest, testInitialDiscardFromEmptyDeck)
{
    EXPECT_THROW(Uno::selectInitialDiscard({}), std::invalid_argument);
}
