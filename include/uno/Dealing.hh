/** \file
 *
 * \brief Definition of dealing utilities
 */

#ifndef DEALING_HH_
#define DEALING_HH_

#include "uno/Deck.hh"
#include "uno/PlayerId.hh"

#include <map>
#include <vector>

namespace Uno {

/** \brief Outcome of dealing initial hands
 *
 * \sa deal()
 */
struct DealResult {
    std::map<PlayerId, Cards> hands;  ///< \brief Hand dealt to each player
    Cards remainingDeck;              ///< \brief Cards left undealt
};

/** \brief Outcome of selecting the first card of the discard pile
 *
 * \sa selectInitialDiscard()
 */
struct InitialDiscard {
    CardType card;        ///< \brief The card starting the discard pile
    Cards remainingDeck;  ///< \brief The deck without \ref card
};

/** \brief Deal cards round-robin
 *
 * Cards are dealt one at a time from the top (back) of \p deck, first to
 * players[0], then to players[1] and so on, for \p cardsPerPlayer rounds. If
 * the deck runs out, the remaining players simply receive fewer cards. Every
 * player in \p players has an entry in the resulting hands, even if it is
 * empty.
 *
 * \param players the players in turn order
 * \param cardsPerPlayer the number of rounds dealt
 * \param deck the deck dealt from
 *
 * \return the hands and the remaining deck
 *
 * \throw std::invalid_argument if \p cardsPerPlayer is negative
 */
DealResult deal(
    const std::vector<PlayerId>& players, int cardsPerPlayer, Cards deck);

/** \brief Select the card that starts the discard pile
 *
 * The deck is scanned from the top for the first colored number card. If there
 * is none, the first colored card (an action card) is taken. If the deck
 * consists of wild cards only, the top card is taken.
 *
 * \param deck the deck
 *
 * \return the selected card and the deck without it
 *
 * \throw std::invalid_argument if \p deck is empty
 */
InitialDiscard selectInitialDiscard(Cards deck);

}

#endif // DEALING_HH_
