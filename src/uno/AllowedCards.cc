#include "uno/AllowedCards.hh"

namespace Uno {

bool isLegal(
    const CardType& card, const CardType& topCard, const Color currentColor)
{
    if (isWild(card)) {
        return true;
    }
    return card.color == currentColor || card.rank == topCard.rank;
}

}
