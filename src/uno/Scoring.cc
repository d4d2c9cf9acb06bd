#include "uno/Scoring.hh"

#include <numeric>

namespace Uno {

int cardPoints(const CardType& card)
{
    if (isNumber(card.rank)) {
        return static_cast<int>(card.rank) - static_cast<int>(Rank::ZERO);
    }
    return isWild(card) ? WILD_CARD_POINTS : ACTION_CARD_POINTS;
}

int handPoints(const Cards& hand)
{
    return std::accumulate(
        hand.begin(), hand.end(), 0,
        [](const auto sum, const auto& card)
        {
            return sum + cardPoints(card);
        });
}

int winnerPoints(const GameState& state, const PlayerId& winner)
{
    auto ret = 0;
    for (const auto& seat : state.seats) {
        if (seat.playerId != winner) {
            ret += handPoints(seat.hand);
        }
    }
    return ret;
}

}
