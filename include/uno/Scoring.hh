/** \file
 *
 * \brief End of game scoring
 */

#ifndef SCORING_HH_
#define SCORING_HH_

#include "uno/CardType.hh"
#include "uno/Deck.hh"
#include "uno/GameState.hh"
#include "uno/PlayerId.hh"

namespace Uno {

/** \brief Points of an action card that is not wild
 */
constexpr auto ACTION_CARD_POINTS = 20;

/** \brief Points of a Wild or Wild Draw Four card
 */
constexpr auto WILD_CARD_POINTS = 50;

/** \brief Determine the points of a card left in a hand
 *
 * \param card the card
 *
 * \return face value for numbers, ACTION_CARD_POINTS for Skip, Reverse and
 * Draw Two, WILD_CARD_POINTS for wild cards
 */
int cardPoints(const CardType& card);

/** \brief Determine the points of a hand
 *
 * \param hand the hand
 *
 * \return the sum of cardPoints() over \p hand
 */
int handPoints(const Cards& hand);

/** \brief Determine the points scored by the winner of a game
 *
 * \param state the game state
 * \param winner the player who emptied the hand
 *
 * \return the sum of handPoints() over every seat except the one of \p winner
 */
int winnerPoints(const GameState& state, const PlayerId& winner);

}

#endif // SCORING_HH_
