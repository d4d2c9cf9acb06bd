#include "engine/InMemoryGameStore.hh"

#include <boost/uuid/nil_generator.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using Uno::GameState;
using Uno::GameStatus;

namespace {
constexpr auto SEED = 1234u;
}

class InMemoryGameStoreTest : public testing::Test {
protected:
    Uno::Engine::InMemoryGameStore store {SEED};
};

TEST_F(InMemoryGameStoreTest, testCreateAssignsIdentifier)
{
    auto state = GameState {};
    state.maxPlayers = 6;
    const auto game_id = store.create(state);
    EXPECT_FALSE(game_id.is_nil());
    EXPECT_EQ(
        boost::uuids::uuid::version_random_number_based, game_id.version());
    const auto found = store.find(game_id);
    ASSERT_TRUE(found);
    EXPECT_EQ(game_id, found->id);
    EXPECT_EQ(6, found->maxPlayers);
    EXPECT_EQ(1, store.getNumberOfGames());
}

TEST_F(InMemoryGameStoreTest, testIdentifiersAreUnique)
{
    const auto game_id1 = store.create(GameState {});
    const auto game_id2 = store.create(GameState {});
    EXPECT_NE(game_id1, game_id2);
    EXPECT_EQ(2, store.getNumberOfGames());
}

TEST_F(InMemoryGameStoreTest, testFindUnknownGame)
{
    EXPECT_FALSE(store.find(boost::uuids::nil_uuid()));
}

TEST_F(InMemoryGameStoreTest, testModifyCommits)
{
    const auto game_id = store.create(GameState {});
    EXPECT_TRUE(
        store.modify(
            game_id,
            [](GameState& state) { state.status = GameStatus::STARTED; }));
    EXPECT_EQ(GameStatus::STARTED, store.find(game_id)->status);
}

TEST_F(InMemoryGameStoreTest, testModifyUnknownGame)
{
    auto called = false;
    EXPECT_FALSE(
        store.modify(
            boost::uuids::nil_uuid(),
            [&called](GameState&) { called = true; }));
    EXPECT_FALSE(called);
}

TEST_F(InMemoryGameStoreTest, testModifyIsAtomicOnFailure)
{
    const auto game_id = store.create(GameState {});
    EXPECT_THROW(
        store.modify(
            game_id,
            [](GameState& state)
            {
                state.status = GameStatus::FINISHED;
                state.seats.emplace_back("alice", 0);
                throw std::runtime_error {"failure"};
            }),
        std::runtime_error);
    const auto found = store.find(game_id);
    ASSERT_TRUE(found);
    EXPECT_EQ(GameStatus::WAITING, found->status);
    EXPECT_TRUE(found->seats.empty());
}

TEST_F(InMemoryGameStoreTest, testModificationsOfSameGameAreSerialized)
{
    constexpr auto N_THREADS = 8;
    constexpr auto N_INCREMENTS = 500;
    const auto game_id = store.create(GameState {});
    auto threads = std::vector<std::thread> {};
    for (auto i = 0; i < N_THREADS; ++i) {
        threads.emplace_back(
            [this, &game_id]()
            {
                for (auto j = 0; j < N_INCREMENTS; ++j) {
                    store.modify(
                        game_id,
                        [](GameState& state) { ++state.currentPlayerIndex; });
                }
            });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(
        N_THREADS * N_INCREMENTS, store.find(game_id)->currentPlayerIndex);
}
