#ifndef MOCKGAMESTORE_HH_
#define MOCKGAMESTORE_HH_

#include "engine/GameStore.hh"

#include <gmock/gmock.h>

namespace Uno {
namespace Engine {

class MockGameStore : public GameStore
{
public:
    MOCK_METHOD1(handleCreate, GameId(GameState));
    MOCK_CONST_METHOD1(handleFind, std::optional<GameState>(const GameId&));
    MOCK_METHOD2(handleModify, bool(const GameId&, const Transaction&));
};

}
}

#endif // MOCKGAMESTORE_HH_
