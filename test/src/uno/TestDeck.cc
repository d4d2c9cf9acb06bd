#include "uno/Deck.hh"
#include "uno/UnoConstants.hh"
#include "Utility.hh"

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <map>
#include <vector>

using Uno::CardType;
using Uno::Color;
using Uno::Rank;

TEST(DeckTest, testEnumerateCardType)
{
    EXPECT_EQ(CardType(Color::RED, Rank::ZERO), Uno::enumerateCardType(0));
    EXPECT_EQ(
        CardType(Color::BLUE, Rank::ZERO),
        Uno::enumerateCardType(Uno::N_CARDS_PER_COLOR));
    EXPECT_EQ(CardType {Rank::WILD}, Uno::enumerateCardType(100));
    EXPECT_EQ(CardType {Rank::WILD_DRAW_FOUR}, Uno::enumerateCardType(107));
    EXPECT_THROW(Uno::enumerateCardType(-1), std::invalid_argument);
    EXPECT_THROW(Uno::enumerateCardType(Uno::N_CARDS), std::invalid_argument);
}

TEST(DeckTest, testStandardDeckComposition)
{
    const auto deck = Uno::buildStandardDeck();
    ASSERT_EQ(Uno::N_CARDS, static_cast<int>(deck.size()));
    for (const auto color : Uno::COLORS) {
        EXPECT_EQ(
            1, std::count(deck.begin(), deck.end(), CardType(color, Rank::ZERO)));
        for (const auto rank : {
                Rank::ONE, Rank::FIVE, Rank::NINE, Rank::SKIP, Rank::REVERSE,
                Rank::DRAW_TWO}) {
            EXPECT_EQ(
                2, std::count(deck.begin(), deck.end(), CardType(color, rank)));
        }
        EXPECT_EQ(
            Uno::N_CARDS_PER_COLOR,
            std::count_if(
                deck.begin(), deck.end(),
                [color](const auto& card) { return card.color == color; }));
    }
    EXPECT_EQ(4, std::count(deck.begin(), deck.end(), CardType {Rank::WILD}));
    EXPECT_EQ(
        4, std::count(deck.begin(), deck.end(), CardType {Rank::WILD_DRAW_FOUR}));
}

TEST(DeckTest, testStandardDeckIsDeterministic)
{
    EXPECT_EQ(Uno::buildStandardDeck(), Uno::buildStandardDeck());
}

TEST(DeckTest, testShuffleIsPermutation)
{
    const auto deck = Uno::buildStandardDeck();
    auto rng = Uno::makeRng(1234);
    const auto shuffled = Uno::shuffle(deck, rng);
    EXPECT_EQ(Uno::buildStandardDeck(), deck);
    EXPECT_TRUE(
        std::is_permutation(
            deck.begin(), deck.end(), shuffled.begin(), shuffled.end()));
    EXPECT_NE(deck, shuffled);
}

TEST(DeckTest, testShuffleIsReproducibleFromSeed)
{
    const auto deck = Uno::buildStandardDeck();
    auto rng1 = Uno::makeRng(42);
    auto rng2 = Uno::makeRng(42);
    EXPECT_EQ(Uno::shuffle(deck, rng1), Uno::shuffle(deck, rng2));
}

TEST(DeckTest, testShuffleUniformity)
{
    // Each of the 6 orderings of three cards should appear about 1/6 of the
    // time
    const auto cards = Uno::Cards {
        CardType(Color::RED, Rank::ONE), CardType(Color::RED, Rank::TWO),
        CardType(Color::RED, Rank::THREE)};
    constexpr auto N_TRIALS = 60000;
    auto rng = Uno::makeRng(2024);
    auto counts = std::map<std::vector<Rank>, int> {};
    for ([[maybe_unused]] const auto n : Uno::to(N_TRIALS)) {
        auto ranks = std::vector<Rank> {};
        for (const auto& card : Uno::shuffle(cards, rng)) {
            ranks.emplace_back(card.rank);
        }
        ++counts[ranks];
    }
    ASSERT_EQ(6u, counts.size());
    for (const auto& [ordering, count] : counts) {
        EXPECT_NEAR(N_TRIALS / 6, count, N_TRIALS / 60);
    }
}
