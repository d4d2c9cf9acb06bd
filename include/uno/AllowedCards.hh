/** \file
 *
 * \brief Definition of Uno::isLegal and Uno::legalCards
 */

#ifndef ALLOWEDCARDS_HH_
#define ALLOWEDCARDS_HH_

#include "uno/CardType.hh"
#include "uno/Deck.hh"

#include <ranges>

namespace Uno {

/** \brief Determine if a card may be played
 *
 * A card may be played if it is a Wild or Wild Draw Four, if its color is \p
 * currentColor, or if its rank is the rank of \p topCard. The intrinsic color
 * of \p topCard plays no role, because the color to match is tracked
 * separately by the game.
 *
 * \param card the card to be played
 * \param topCard the card on top of the discard pile
 * \param currentColor the color that must be matched
 *
 * \return true if \p card is legal, false otherwise
 */
bool isLegal(const CardType& card, const CardType& topCard, Color currentColor);

/** \brief Get the cards in a hand that may be played
 *
 * The returned view lazily yields, in hand order, every card of \p hand for
 * which isLegal() returns true. Each call creates a fresh view over the
 * current contents of the hand.
 *
 * \note The view refers to \p hand, which must outlive it and must not be
 * modified while it is being iterated.
 *
 * \param hand the hand
 * \param topCard the card on top of the discard pile
 * \param currentColor the color that must be matched
 *
 * \return a view over the legal cards
 */
inline auto legalCards(
    const Cards& hand, const CardType topCard, const Color currentColor)
{
    return hand | std::views::filter(
        [topCard, currentColor](const CardType& card)
        {
            return isLegal(card, topCard, currentColor);
        });
}

}

#endif // ALLOWEDCARDS_HH_
