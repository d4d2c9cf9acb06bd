/** \file
 *
 * \brief Turn advancement, action card effects and drawing from the deck
 *
 * The functions in this file operate on a GameState that the caller owns
 * exclusively for the duration of the call. They never retain references to
 * the state.
 */

#ifndef ENGINE_TURNSTATEMACHINE_HH_
#define ENGINE_TURNSTATEMACHINE_HH_

#include "uno/CardType.hh"
#include "uno/Deck.hh"
#include "uno/GameState.hh"

#include <iosfwd>
#include <optional>

namespace Uno {
namespace Engine {

/** \brief Compute the index of a seat relative to another
 *
 * The result is <tt>((current + direction * step) mod total + total) mod
 * total</tt>, i.e. the seat \p step positions away from \p current in \p
 * direction, wrapping around at both ends.
 *
 * \param current the index of the current seat
 * \param direction the direction of play
 * \param total the number of seats
 * \param step the number of positions advanced
 *
 * \return the index of the seat
 *
 * \throw std::invalid_argument if \p total is not positive
 */
int nextIndex(int current, Direction direction, int total, int step = 1);

/** \brief Effect of a played card on the turn order
 */
enum class CardEffect {
    ADVANCE,    ///< Turn passes to the next seat
    SKIP,       ///< The next seat loses its turn
    REVERSE,    ///< The direction of play is reversed
    DRAW_TWO,   ///< The next seat draws two cards and loses its turn
    DRAW_FOUR,  ///< The next seat draws four cards and loses its turn
};

/** \brief Determine the effect of a rank
 *
 * Numbers and plain Wild cards advance the turn. Every other rank has an
 * effect of its own.
 *
 * \param rank the rank of the played card
 *
 * \return the effect of playing a card of rank \p rank
 */
CardEffect effectOf(Rank rank);

/** \brief Outcome of resolving the effect of a played card
 *
 * \sa resolveEffect()
 */
struct EffectResolution {
    int nextIndex;                    ///< \brief The seat that acts next
    std::optional<int> skippedIndex;  ///< \brief The seat that lost its turn
    Cards penaltyCards;               ///< \brief Cards the skipped seat drew
};

/** \brief Recycle the discard pile into the deck
 *
 * All cards of the discard pile except the top card are shuffled using the
 * generator of the game and placed under the deck. The top card remains as
 * the only card of the discard pile.
 *
 * \param state the game state
 *
 * \return the number of cards moved into the deck
 */
int reshuffleDiscardIntoDeck(GameState& state);

/** \brief Draw one card from the deck
 *
 * If the deck is empty, the discard pile is first recycled using
 * reshuffleDiscardIntoDeck().
 *
 * \param state the game state
 *
 * \return the card drawn
 *
 * \throw EngineFailure with kind EngineFailure::Kind::DECK_EXHAUSTED if no
 * card can be drawn
 */
CardType drawCard(GameState& state);

/** \brief Draw penalty cards from the deck
 *
 * The deck is recycled from the discard pile as necessary. If there are not
 * enough cards in the deck and the discard pile combined, as many cards as
 * possible are drawn.
 *
 * \param state the game state
 * \param count the number of cards to draw
 *
 * \return the cards drawn
 */
Cards drawPenaltyCards(GameState& state, int count);

/** \brief Give the turn to a seat
 *
 * Sets GameState::currentPlayerIndex and makes the seat at \p index the only
 * seat whose PlayerSeat::isCurrentTurn flag is set.
 *
 * \param state the game state
 * \param index the index of the seat
 *
 * \throw std::out_of_range if \p index is not an index of a seat
 */
void giveTurnTo(GameState& state, int index);

/** \brief Clear the turn flag of every seat
 *
 * \param state the game state
 */
void clearTurns(GameState& state);

/** \brief Resolve the effect of a played card and advance the turn
 *
 * The card is assumed to have been played by the seat at
 * GameState::currentPlayerIndex. Depending on effectOf() the direction of
 * play is reversed, or the next seat is skipped, possibly after drawing
 * penalty cards. With exactly two seats a Reverse gives the turn back to the
 * seat that played it. Finally the turn is given to the seat that acts next.
 *
 * \param state the game state
 * \param cardPlayed the card that was played
 *
 * \return the resolution
 */
EffectResolution resolveEffect(GameState& state, const CardType& cardPlayed);

/** \brief Output a CardEffect to stream
 *
 * \param os the output stream
 * \param effect the effect to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, CardEffect effect);

}
}

#endif // ENGINE_TURNSTATEMACHINE_HH_
