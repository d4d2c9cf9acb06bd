/** \file
 *
 * \brief Utilities for building and shuffling the UNO deck
 */

#ifndef DECK_HH_
#define DECK_HH_

#include "uno/CardType.hh"
#include "uno/Random.hh"

#include <boost/iterator/counting_iterator.hpp>
#include <boost/iterator/transform_iterator.hpp>

#include <vector>

namespace Uno {

/** \brief Sequence of cards
 *
 * Used for hands, the deck and the discard pile. When a sequence is used as a
 * stack, its back is the top.
 */
using Cards = std::vector<CardType>;

/** \brief Convert an integer to a card type of the standard deck
 *
 * The standard deck is enumerated color by color in the order of COLORS. Each
 * color contributes one zero, two of each 1–9, and two each of Skip, Reverse
 * and Draw Two, in that order. The last eight cards alternate between Wild and
 * Wild Draw Four.
 *
 * \param n number between 0 and 107
 *
 * \return card type at position \p n of the unshuffled deck
 *
 * \throw std::invalid_argument if n is not a valid position
 */
CardType enumerateCardType(int n);

/** \brief Iterator for iterating over the standard deck
 *
 * Cards are iterated in the same order as returned by enumerateCardType().
 *
 * \sa enumerateCardType()
 */
inline auto cardTypeIterator(int n)
{
    return boost::make_transform_iterator(
        boost::make_counting_iterator(n), enumerateCardType);
}

/** \brief Build the standard 108 card deck
 *
 * The construction is deterministic: the result is the same on every call.
 *
 * \return vector containing the cards in the order of enumerateCardType()
 */
Cards buildStandardDeck();

/** \brief Shuffle cards
 *
 * Returns a uniformly random permutation of \p cards. The argument is not
 * modified.
 *
 * \param cards the cards to shuffle
 * \param rng the random number generator used
 *
 * \return the shuffled cards
 */
Cards shuffle(const Cards& cards, Rng& rng);

}

#endif // DECK_HH_
