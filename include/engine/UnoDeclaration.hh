/** \file
 *
 * \brief Saying UNO and challenging a player who forgot to say it
 */

#ifndef ENGINE_UNODECLARATION_HH_
#define ENGINE_UNODECLARATION_HH_

#include "uno/Deck.hh"
#include "uno/GameState.hh"
#include "uno/PlayerId.hh"

namespace Uno {
namespace Engine {

/** \brief Number of cards drawn by a player caught not saying UNO
 */
constexpr auto UNO_PENALTY_CARDS = 2;

/** \brief Outcome of an UNO challenge
 *
 * A challenge against a player who has already said UNO is not an error. It
 * is reported with \ref successful set to false.
 */
struct ChallengeResult {
    bool successful;      ///< \brief Whether the challenged player was caught
    PlayerId challenger;  ///< \brief The player who made the challenge
    PlayerId challenged;  ///< \brief The player who was challenged
    Cards penaltyCards;   ///< \brief Cards drawn by the challenged player
};

/** \brief Declare UNO for a seat
 *
 * \param seat the seat of the declaring player
 *
 * \throw EngineFailure with kind
 * EngineFailure::Kind::INVALID_UNO_DECLARATION if the hand does not contain
 * exactly one card, or UNO has already been declared
 */
void declareUno(PlayerSeat& seat);

/** \brief Resolve an UNO challenge
 *
 * If the challenged seat has not declared UNO, it draws UNO_PENALTY_CARDS
 * cards (as many as are available) and its declaration flag stays clear.
 * Otherwise nothing changes.
 *
 * \param state the game state
 * \param challenger the player making the challenge
 * \param challenged the seat of the challenged player, which must belong to
 * \p state
 *
 * \return the outcome of the challenge
 *
 * \throw EngineFailure with kind EngineFailure::Kind::INVALID_CHALLENGE if
 * the hand of \p challenged does not contain exactly one card
 */
ChallengeResult resolveChallenge(
    GameState& state, const PlayerId& challenger, PlayerSeat& challenged);

/** \brief Clear the UNO declaration unless exactly one card is held
 *
 * Called whenever the size of a hand changes.
 *
 * \param seat the seat
 */
void clearStaleDeclaration(PlayerSeat& seat);

}
}

#endif // ENGINE_UNODECLARATION_HH_
