/** \file
 *
 * \brief Definition of Uno::Engine::GameStore interface
 */

#ifndef ENGINE_GAMESTORE_HH_
#define ENGINE_GAMESTORE_HH_

#include "uno/GameState.hh"
#include "uno/Uuid.hh"

#include <functional>
#include <optional>

namespace Uno {
namespace Engine {

/** \brief Persistence of game states
 *
 * GameStore is the collaborator through which UnoEngine reads and writes the
 * state of games. The engine itself holds no game state.
 *
 * Implementations must serialize modifications of the same game: while a
 * transaction of one game is running, no other transaction of the same game
 * may run, and find() must not observe a partially applied transaction.
 */
class GameStore {
public:

    /** \brief Read‐modify‐write operation on one game
     *
     * The transaction receives a working copy of the game state. The copy is
     * committed if and only if the transaction returns normally.
     */
    using Transaction = std::function<void(GameState&)>;

    virtual ~GameStore();

    /** \brief Store a new game
     *
     * The store assigns a new identifier to the game, overriding
     * GameState::id of \p state.
     *
     * \param state the initial state of the game
     *
     * \return the identifier of the new game
     */
    GameId create(GameState state);

    /** \brief Retrieve a snapshot of a game
     *
     * \param gameId the identifier of the game
     *
     * \return a copy of the state of the game, or none if there is no game
     * with \p gameId
     */
    std::optional<GameState> find(const GameId& gameId) const;

    /** \brief Atomically modify a game
     *
     * Any exception thrown by \p transaction is propagated to the caller, and
     * the stored state is left as it was.
     *
     * \param gameId the identifier of the game
     * \param transaction the modification
     *
     * \return true if the game was found and modified, false if there is no
     * game with \p gameId
     *
     * \throw std::invalid_argument if \p transaction is empty
     */
    bool modify(const GameId& gameId, const Transaction& transaction);

private:

    /** \brief Handle for storing a new game
     *
     * \sa create()
     */
    virtual GameId handleCreate(GameState state) = 0;

    /** \brief Handle for retrieving a snapshot of a game
     *
     * \sa find()
     */
    virtual std::optional<GameState> handleFind(const GameId& gameId) const = 0;

    /** \brief Handle for modifying a game
     *
     * It may be assumed that \p transaction is not empty.
     *
     * \sa modify()
     */
    virtual bool handleModify(
        const GameId& gameId, const Transaction& transaction) = 0;
};

}
}

#endif // ENGINE_GAMESTORE_HH_
