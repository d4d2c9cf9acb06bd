#include "engine/InMemoryGameStore.hh"

#include "Logging.hh"

#include <utility>

namespace Uno {
namespace Engine {

InMemoryGameStore::InMemoryGameStore() :
    InMemoryGameStore {std::random_device {}()}
{
}

InMemoryGameStore::InMemoryGameStore(const RngSeed seed) :
    rng {makeRng(seed)},
    uuidGenerator {&rng}
{
}

int InMemoryGameStore::getNumberOfGames() const
{
    const auto lock = std::scoped_lock {registryMutex};
    return static_cast<int>(entries.size());
}

GameId InMemoryGameStore::handleCreate(GameState state)
{
    const auto lock = std::scoped_lock {registryMutex};
    auto gameId = uuidGenerator();
    while (entries.find(gameId) != entries.end()) {
        gameId = uuidGenerator();
    }
    state.id = gameId;
    auto entry = std::make_shared<Entry>();
    entry->state = std::move(state);
    entries.emplace(gameId, std::move(entry));
    log(LogLevel::DEBUG, "Stored new game %s", gameId);
    return gameId;
}

std::optional<GameState> InMemoryGameStore::handleFind(
    const GameId& gameId) const
{
    const auto entry = getEntry(gameId);
    if (!entry) {
        return std::nullopt;
    }
    const auto lock = std::scoped_lock {entry->mutex};
    return entry->state;
}

bool InMemoryGameStore::handleModify(
    const GameId& gameId, const Transaction& transaction)
{
    const auto entry = getEntry(gameId);
    if (!entry) {
        return false;
    }
    const auto lock = std::scoped_lock {entry->mutex};
    auto working = entry->state;
    transaction(working);
    entry->state = std::move(working);
    return true;
}

std::shared_ptr<InMemoryGameStore::Entry> InMemoryGameStore::getEntry(
    const GameId& gameId) const
{
    const auto lock = std::scoped_lock {registryMutex};
    const auto iter = entries.find(gameId);
    return iter != entries.end() ? iter->second : nullptr;
}

}
}
