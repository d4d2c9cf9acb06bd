#include "uno/Deck.hh"

#include "uno/UnoConstants.hh"

#include <algorithm>
#include <stdexcept>

namespace Uno {

namespace {

// Layout of the 25 cards of a single color in the unshuffled deck
constexpr auto COLOR_LAYOUT = std::array {
    Rank::ZERO,
    Rank::ONE, Rank::ONE, Rank::TWO, Rank::TWO, Rank::THREE, Rank::THREE,
    Rank::FOUR, Rank::FOUR, Rank::FIVE, Rank::FIVE, Rank::SIX, Rank::SIX,
    Rank::SEVEN, Rank::SEVEN, Rank::EIGHT, Rank::EIGHT, Rank::NINE, Rank::NINE,
    Rank::SKIP, Rank::SKIP, Rank::REVERSE, Rank::REVERSE,
    Rank::DRAW_TWO, Rank::DRAW_TWO,
};

static_assert(COLOR_LAYOUT.size() == N_CARDS_PER_COLOR);

}

CardType enumerateCardType(const int n)
{
    if (n < 0 || n >= N_CARDS) {
        throw std::invalid_argument {"Invalid card number"};
    }
    const auto n_colored = static_cast<int>(COLORS.size()) * N_CARDS_PER_COLOR;
    if (n < n_colored) {
        return CardType {
            COLORS[n / N_CARDS_PER_COLOR],
            COLOR_LAYOUT[n % N_CARDS_PER_COLOR]};
    }
    return CardType {
        (n - n_colored) % 2 == 0 ? Rank::WILD : Rank::WILD_DRAW_FOUR};
}

Cards buildStandardDeck()
{
    return Cards(cardTypeIterator(0), cardTypeIterator(N_CARDS));
}

Cards shuffle(const Cards& cards, Rng& rng)
{
    auto ret = cards;
    std::shuffle(ret.begin(), ret.end(), rng);
    return ret;
}

}
