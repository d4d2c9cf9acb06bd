#include "engine/GameStore.hh"

#include <stdexcept>
#include <utility>

namespace Uno {
namespace Engine {

GameStore::~GameStore() = default;

GameId GameStore::create(GameState state)
{
    return handleCreate(std::move(state));
}

std::optional<GameState> GameStore::find(const GameId& gameId) const
{
    return handleFind(gameId);
}

bool GameStore::modify(const GameId& gameId, const Transaction& transaction)
{
    if (!transaction) {
        throw std::invalid_argument {"Empty transaction"};
    }
    return handleModify(gameId, transaction);
}

}
}
