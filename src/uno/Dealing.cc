#include "uno/Dealing.hh"

#include "Utility.hh"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace Uno {

namespace {

template<typename Predicate>
std::optional<InitialDiscard> takeFromTop(Cards& deck, Predicate&& predicate)
{
    const auto iter = std::find_if(deck.rbegin(), deck.rend(), predicate);
    if (iter == deck.rend()) {
        return std::nullopt;
    }
    const auto card = *iter;
    deck.erase(std::next(iter).base());
    return InitialDiscard {card, std::move(deck)};
}

}

DealResult deal(
    const std::vector<PlayerId>& players, const int cardsPerPlayer, Cards deck)
{
    if (cardsPerPlayer < 0) {
        throw std::invalid_argument {"Negative number of cards per player"};
    }
    auto ret = DealResult {};
    for (const auto& player : players) {
        ret.hands[player];
    }
    for ([[maybe_unused]] const auto round : to(cardsPerPlayer)) {
        for (const auto& player : players) {
            if (deck.empty()) {
                break;
            }
            ret.hands[player].emplace_back(deck.back());
            deck.pop_back();
        }
    }
    ret.remainingDeck = std::move(deck);
    return ret;
}

InitialDiscard selectInitialDiscard(Cards deck)
{
    if (deck.empty()) {
        throw std::invalid_argument {"Cannot select discard from empty deck"};
    }
    const auto is_colored_number = [](const auto& card)
    {
        return card.color && isNumber(card.rank);
    };
    if (auto ret = takeFromTop(deck, is_colored_number)) {
        return std::move(*ret);
    }
    if (auto ret = takeFromTop(
            deck, [](const auto& card) { return !isWild(card); })) {
        return std::move(*ret);
    }
    const auto card = deck.back();
    deck.pop_back();
    return InitialDiscard {card, std::move(deck)};
}

}
