#include "MockGameStore.hh"

#include <boost/uuid/string_generator.hpp>
#include <gtest/gtest.h>

#include <stdexcept>

using Uno::GameId;
using Uno::GameState;

using testing::_;
using testing::Return;

namespace {
const auto GAME_ID = boost::uuids::string_generator {}(
    "a3bb189e-8bf9-4888-9912-ace4e6543002");
}

class GameStoreTest : public testing::Test {
protected:
    Uno::Engine::MockGameStore store;
};

TEST_F(GameStoreTest, testCreate)
{
    EXPECT_CALL(store, handleCreate(_)).WillOnce(Return(GAME_ID));
    EXPECT_EQ(GAME_ID, store.create(GameState {}));
}

TEST_F(GameStoreTest, testFind)
{
    EXPECT_CALL(store, handleFind(GAME_ID)).WillOnce(Return(std::nullopt));
    EXPECT_FALSE(store.find(GAME_ID));
}

TEST_F(GameStoreTest, testModify)
{
    EXPECT_CALL(store, handleModify(GAME_ID, _)).WillOnce(Return(true));
    EXPECT_TRUE(store.modify(GAME_ID, [](GameState&) {}));
}

TEST_F(GameStoreTest, testModifyWithEmptyTransaction)
{
    EXPECT_CALL(store, handleModify(_, _)).Times(0);
    EXPECT_THROW(
        store.modify(GAME_ID, Uno::Engine::GameStore::Transaction {}),
        std::invalid_argument);
}
