/** \file
 *
 * \brief Definition of Uno::Engine::InMemoryGameStore class
 */

#ifndef ENGINE_INMEMORYGAMESTORE_HH_
#define ENGINE_INMEMORYGAMESTORE_HH_

#include "engine/GameStore.hh"
#include "uno/Random.hh"
#include "uno/UuidGenerator.hh"

#include <boost/core/noncopyable.hpp>

#include <map>
#include <memory>
#include <mutex>

namespace Uno {
namespace Engine {

/** \brief Game store keeping the games in memory
 *
 * Each game is protected by a mutex of its own, so that transactions of
 * different games may run concurrently while transactions of the same game
 * are serialized. New game identifiers are random UUIDs.
 */
class InMemoryGameStore : public GameStore, private boost::noncopyable {
public:

    /** \brief Create store with identifiers seeded from the OS
     */
    InMemoryGameStore();

    /** \brief Create store with a known seed for identifiers
     *
     * \param seed the seed of the generator used for game identifiers
     */
    explicit InMemoryGameStore(RngSeed seed);

    /** \brief Determine the number of stored games
     */
    int getNumberOfGames() const;

private:

    struct Entry {
        std::mutex mutex;
        GameState state;
    };

    GameId handleCreate(GameState state) override;

    std::optional<GameState> handleFind(const GameId& gameId) const override;

    bool handleModify(
        const GameId& gameId, const Transaction& transaction) override;

    std::shared_ptr<Entry> getEntry(const GameId& gameId) const;

    mutable std::mutex registryMutex;
    Rng rng;
    UuidGenerator uuidGenerator;
    std::map<GameId, std::shared_ptr<Entry>> entries;
};

}
}

#endif // ENGINE_INMEMORYGAMESTORE_HH_
