/** \file
 *
 * \brief Definition of Uno::GameState and Uno::PlayerSeat
 */

#ifndef GAMESTATE_HH_
#define GAMESTATE_HH_

#include "uno/CardType.hh"
#include "uno/Deck.hh"
#include "uno/PlayerId.hh"
#include "uno/Random.hh"
#include "uno/UnoConstants.hh"
#include "uno/Uuid.hh"

#include <iosfwd>
#include <optional>
#include <vector>

namespace Uno {

/** \brief Lifecycle status of a game
 */
enum class GameStatus {
    WAITING,   ///< Players are being seated
    STARTED,   ///< Cards have been dealt and turns are taken
    FINISHED,  ///< The game is over
};

/** \brief Direction of play
 *
 * The underlying value is the step added to the index of the current seat
 * when the turn advances.
 */
enum class Direction {
    CLOCKWISE = 1,
    COUNTERCLOCKWISE = -1,
};

/** \brief The signed step corresponding to a direction
 */
constexpr int directionStep(const Direction direction)
{
    return static_cast<int>(direction);
}

/** \brief The opposite direction
 */
constexpr Direction reversed(const Direction direction)
{
    return direction == Direction::CLOCKWISE ?
        Direction::COUNTERCLOCKWISE : Direction::CLOCKWISE;
}

/** \brief The state of a player within one game
 */
struct PlayerSeat {
    PlayerId playerId;           ///< \brief The player occupying the seat
    int turnOrder {};            ///< \brief Position of the seat in turn order
    Cards hand {};               ///< \brief Cards held by the player
    bool isCurrentTurn {false};  ///< \brief Whether the player is to act
    bool saidUno {false};        ///< \brief Whether UNO has been declared
    bool isReady {false};        ///< \brief Whether the player may be dealt
    int score {};                ///< \brief Points accumulated in this game

    PlayerSeat() = default;

    /** \brief Create an empty seat
     *
     * \param playerId see \ref playerId
     * \param turnOrder see \ref turnOrder
     */
    PlayerSeat(PlayerId playerId, int turnOrder);
};

/** \brief The aggregate state of one game
 *
 * GameState is a plain value. The engine reads a copy of it from the game
 * store, transforms the copy and writes it back. The seats vector is ordered
 * by PlayerSeat::turnOrder, so that the turn order of a seat is also its index
 * in \ref seats.
 */
struct GameState {
    GameId id {};                                ///< \brief Game identifier
    GameStatus status {GameStatus::WAITING};     ///< \brief Lifecycle status
    int maxPlayers {DEFAULT_MAX_PLAYERS};        ///< \brief Number of seats
    Direction direction {Direction::CLOCKWISE};  ///< \brief Direction of play
    int currentPlayerIndex {};                   ///< \brief Seat in turn
    Cards deck {};                               ///< \brief Undealt cards
    Cards discardPile {};                        ///< \brief Played cards
    std::optional<Color> currentColor {};        ///< \brief Color to match
    std::vector<PlayerSeat> seats {};            ///< \brief Seats in turn order
    std::optional<PlayerId> winner {};           ///< \brief Winner, if any
    Rng rng {};                                  ///< \brief Game's generator
};

/** \brief Find the seat of a player
 *
 * \param state the game state
 * \param playerId the player
 *
 * \return pointer to the seat of \p playerId, or nullptr if the player is not
 * seated in the game
 */
PlayerSeat* findSeat(GameState& state, const PlayerId& playerId);

/// \copydoc findSeat(GameState&, const PlayerId&)
const PlayerSeat* findSeat(const GameState& state, const PlayerId& playerId);

/** \brief Count the cards of a game
 *
 * \return the combined size of the deck, the discard pile and all hands
 */
int countCards(const GameState& state);

/** \brief Get the top card of the discard pile
 *
 * \return the top card, or none if the discard pile is empty
 */
std::optional<CardType> getTopCard(const GameState& state);

/** \brief Output a GameStatus to stream
 *
 * \param os the output stream
 * \param status the status to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, GameStatus status);

/** \brief Output a Direction to stream
 *
 * \param os the output stream
 * \param direction the direction to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, Direction direction);

}

#endif // GAMESTATE_HH_
