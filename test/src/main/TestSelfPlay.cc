#include "engine/InMemoryGameStore.hh"
#include "engine/UnoEngine.hh"
#include "main/SelfPlay.hh"
#include "TestUtility.hh"

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <sstream>
#include <string>

using Uno::CardType;
using Uno::Cards;
using Uno::Color;
using Uno::Rank;
using Uno::Engine::TurnAction;
using Uno::Main::chooseMove;
using Uno::Main::preferredColor;

TEST(PreferredColorTest, testMostCommonColor)
{
    const auto hand = Cards {
        CardType(Color::RED, Rank::ONE), CardType(Color::BLUE, Rank::TWO),
        CardType(Color::BLUE, Rank::SKIP), CardType {Rank::WILD}};
    EXPECT_EQ(Color::BLUE, preferredColor(hand));
}

TEST(PreferredColorTest, testTieIsBrokenInColorOrder)
{
    const auto hand = Cards {
        CardType(Color::YELLOW, Rank::ONE), CardType(Color::GREEN, Rank::TWO)};
    EXPECT_EQ(Color::GREEN, preferredColor(hand));
}

TEST(PreferredColorTest, testNoColoredCards)
{
    EXPECT_EQ(Color::RED, preferredColor({}));
    EXPECT_EQ(Color::RED, preferredColor({CardType {Rank::WILD_DRAW_FOUR}}));
}

TEST(ChooseMoveTest, testDrawWhenNothingIsLegal)
{
    const auto move = chooseMove({CardType(Color::RED, Rank::ONE)}, {});
    EXPECT_EQ(TurnAction::DRAW_CARD, move.action);
    EXPECT_FALSE(move.card);
    EXPECT_FALSE(move.chosenColor);
}

TEST(ChooseMoveTest, testPlayFirstLegalCard)
{
    const auto hand = Cards {
        CardType(Color::RED, Rank::ONE), CardType(Color::RED, Rank::TWO)};
    const auto move = chooseMove(hand, {hand[1], hand[0]});
    EXPECT_EQ(TurnAction::PLAY_CARD, move.action);
    EXPECT_EQ(hand[1], move.card);
    EXPECT_FALSE(move.chosenColor);
}

TEST(ChooseMoveTest, testWildCardColorFromRestOfHand)
{
    const auto wild = CardType {Rank::WILD};
    const auto hand = Cards {
        CardType(Color::RED, Rank::TWO), wild,
        CardType(Color::YELLOW, Rank::THREE),
        CardType(Color::YELLOW, Rank::FOUR)};
    const auto move = chooseMove(hand, {wild});
    EXPECT_EQ(TurnAction::PLAY_CARD, move.action);
    EXPECT_EQ(wild, move.card);
    EXPECT_EQ("Yellow", move.chosenColor);
}

class SelfPlayTest : public testing::Test {
protected:
    Uno::Main::GameSetup makeSetup(const Uno::RngSeed seed)
    {
        auto setup = Uno::Main::GameSetup {};
        setup.players = {"alice", "bob", "carol"};
        setup.seed = seed;
        return setup;
    }

    Uno::Engine::UnoEngine engine {
        std::make_shared<Uno::Engine::InMemoryGameStore>(1u)};
    std::ostringstream out;
};

TEST_F(SelfPlayTest, testPlayGame)
{
    for (auto seed = 1u; seed <= 10u; ++seed) {
        const auto setup = makeSetup(seed);
        const auto result = Uno::Main::playGame(engine, setup, out);
        const auto state = engine.getGameState(result.gameId);
        EXPECT_EQ(Uno::GameStatus::FINISHED, state.status);
        EXPECT_EQ(state.winner, result.winner);
        EXPECT_LE(result.turns, setup.maxTurns);
        ASSERT_EQ(3u, result.scores.size());
        for (const auto& [player, score] : result.scores) {
            if (player == result.winner) {
                EXPECT_GT(score, 0);
            } else {
                EXPECT_EQ(0, score);
            }
        }
    }
    EXPECT_FALSE(out.str().empty());
}

TEST_F(SelfPlayTest, testTurnLimit)
{
    auto setup = makeSetup(1u);
    setup.maxTurns = 1;
    const auto result = Uno::Main::playGame(engine, setup, out);
    EXPECT_EQ(1, result.turns);
    EXPECT_FALSE(result.winner);
    EXPECT_EQ(
        Uno::GameStatus::FINISHED,
        engine.getGameState(result.gameId).status);
    EXPECT_TRUE(std::all_of(
        result.scores.begin(), result.scores.end(),
        [](const auto& entry) { return entry.second == 0; }));
}

TEST_F(SelfPlayTest, testSameSeedPlaysSameGame)
{
    const auto setup = makeSetup(42u);
    Uno::Main::playGame(engine, setup, out);
    auto out2 = std::ostringstream {};
    Uno::Main::playGame(engine, setup, out2);
    EXPECT_EQ(out.str(), out2.str());
}

TEST_F(SelfPlayTest, testTooFewPlayers)
{
    auto setup = makeSetup(1u);
    setup.players = {"alice"};
    Uno::expectFailure(
        Uno::Engine::EngineFailure::Kind::TOO_FEW_PLAYERS,
        [&]() { Uno::Main::playGame(engine, setup, out); });
}
