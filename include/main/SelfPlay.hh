/** \file
 *
 * \brief Playing a complete game with computer controlled players
 */

#ifndef MAIN_SELFPLAY_HH_
#define MAIN_SELFPLAY_HH_

#include "engine/UnoEngine.hh"
#include "uno/CardType.hh"
#include "uno/Deck.hh"
#include "uno/PlayerId.hh"
#include "uno/Random.hh"
#include "uno/UnoConstants.hh"
#include "uno/Uuid.hh"

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace Uno {
namespace Main {

/** \brief Parameters of a self-play game
 */
struct GameSetup {
    std::vector<PlayerId> players;                  ///< \brief Seated players
    int cardsPerPlayer {DEFAULT_CARDS_PER_PLAYER};  ///< \brief Initial hand
    int maxPlayers {DEFAULT_MAX_PLAYERS};           ///< \brief Seats
    std::optional<RngSeed> seed {};                 ///< \brief Game seed
    int maxTurns {10000};                           ///< \brief Turn limit
};

/** \brief Summary of a self-play game
 */
struct SelfPlayResult {
    GameId gameId;                           ///< \brief The game played
    std::optional<PlayerId> winner;          ///< \brief The winner, if any
    int turns;                               ///< \brief Turn actions taken
    std::vector<Engine::PlayerScore> scores; ///< \brief Final scores
};

/** \brief A move chosen for a player in turn
 */
struct Move {
    Engine::TurnAction action;               ///< \brief Play or draw
    std::optional<CardType> card;            ///< \brief Card to play
    std::optional<std::string> chosenColor;  ///< \brief Color for a wild
};

/** \brief Determine the most common color in a hand
 *
 * Ties are broken in the order of COLORS. A hand with no colored cards
 * prefers the first color.
 */
Color preferredColor(const Cards& hand);

/** \brief Choose a move
 *
 * The first legal card is played. The color chosen for a wild card is the
 * preferred color of the rest of the hand. If no card is legal, a card is
 * drawn.
 *
 * \param hand the hand of the player
 * \param legal the legal cards in the hand
 *
 * \return the move
 */
Move chooseMove(const Cards& hand, const Cards& legal);

/** \brief Play a complete game
 *
 * Creates a game, seats the players as ready, deals and lets the players in
 * turn take the move returned by chooseMove() until the game has a winner or
 * GameSetup::maxTurns actions have been taken. A player left with one card
 * says UNO immediately. If the turn limit is reached, or the player in turn
 * can neither play nor draw, the game is ended without a winner.
 *
 * \param engine the engine
 * \param setup the parameters of the game
 * \param out the stream to which a summary of each action is written
 *
 * \return summary of the game
 */
SelfPlayResult playGame(
    Engine::UnoEngine& engine, const GameSetup& setup, std::ostream& out);

}
}

#endif // MAIN_SELFPLAY_HH_
