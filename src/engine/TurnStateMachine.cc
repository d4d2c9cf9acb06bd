#include "engine/TurnStateMachine.hh"

#include "engine/EngineFailure.hh"
#include "Logging.hh"
#include "Utility.hh"

#include <iterator>
#include <ostream>
#include <stdexcept>
#include <utility>

namespace Uno {
namespace Engine {

namespace {

int penaltyFor(const CardEffect effect)
{
    return effect == CardEffect::DRAW_FOUR ? 4 : 2;
}

}

int nextIndex(
    const int current, const Direction direction, const int total,
    const int step)
{
    if (total <= 0) {
        throw std::invalid_argument {"Number of seats must be positive"};
    }
    return ((current + directionStep(direction) * step) % total + total) %
        total;
}

CardEffect effectOf(const Rank rank)
{
    switch (rank) {
    case Rank::SKIP:
        return CardEffect::SKIP;
    case Rank::REVERSE:
        return CardEffect::REVERSE;
    case Rank::DRAW_TWO:
        return CardEffect::DRAW_TWO;
    case Rank::WILD_DRAW_FOUR:
        return CardEffect::DRAW_FOUR;
    case Rank::ZERO:
    case Rank::ONE:
    case Rank::TWO:
    case Rank::THREE:
    case Rank::FOUR:
    case Rank::FIVE:
    case Rank::SIX:
    case Rank::SEVEN:
    case Rank::EIGHT:
    case Rank::NINE:
    case Rank::WILD:
        return CardEffect::ADVANCE;
    }
    throw std::invalid_argument {"Invalid rank"};
}

int reshuffleDiscardIntoDeck(GameState& state)
{
    auto& discard = state.discardPile;
    if (discard.size() <= 1) {
        return 0;
    }
    const auto top = discard.back();
    discard.pop_back();
    auto recycled = shuffle(discard, state.rng);
    const auto n_recycled = static_cast<int>(recycled.size());
    recycled.insert(
        recycled.end(), std::make_move_iterator(state.deck.begin()),
        std::make_move_iterator(state.deck.end()));
    state.deck = std::move(recycled);
    discard.assign(1, top);
    log(LogLevel::DEBUG,
        "Game %s: reshuffled %d cards from the discard pile into the deck",
        state.id, n_recycled);
    return n_recycled;
}

CardType drawCard(GameState& state)
{
    if (state.deck.empty() && reshuffleDiscardIntoDeck(state) == 0) {
        throw EngineFailure {
            EngineFailure::Kind::DECK_EXHAUSTED,
            "There are no cards left to draw"};
    }
    const auto card = state.deck.back();
    state.deck.pop_back();
    return card;
}

Cards drawPenaltyCards(GameState& state, const int count)
{
    auto ret = Cards {};
    for ([[maybe_unused]] const auto n : to(count)) {
        if (state.deck.empty() && reshuffleDiscardIntoDeck(state) == 0) {
            log(LogLevel::WARNING,
                "Game %s: only %d of %d penalty cards could be drawn",
                state.id, ret.size(), count);
            break;
        }
        ret.emplace_back(state.deck.back());
        state.deck.pop_back();
    }
    return ret;
}

void giveTurnTo(GameState& state, const int index)
{
    checkIndex(index, static_cast<int>(state.seats.size()));
    for (auto& seat : state.seats) {
        seat.isCurrentTurn = (seat.turnOrder == index);
    }
    state.currentPlayerIndex = index;
}

void clearTurns(GameState& state)
{
    for (auto& seat : state.seats) {
        seat.isCurrentTurn = false;
    }
}

EffectResolution resolveEffect(GameState& state, const CardType& cardPlayed)
{
    const auto total = static_cast<int>(state.seats.size());
    const auto current = state.currentPlayerIndex;
    const auto effect = effectOf(cardPlayed.rank);
    auto ret = EffectResolution {};

    switch (effect) {
    case CardEffect::ADVANCE:
        ret.nextIndex = nextIndex(current, state.direction, total);
        break;
    case CardEffect::REVERSE:
        state.direction = reversed(state.direction);
        if (total == 2) {
            ret.nextIndex = current;
        } else {
            ret.nextIndex = nextIndex(current, state.direction, total);
        }
        break;
    case CardEffect::SKIP:
        ret.skippedIndex = nextIndex(current, state.direction, total);
        ret.nextIndex = nextIndex(current, state.direction, total, 2);
        break;
    case CardEffect::DRAW_TWO:
    case CardEffect::DRAW_FOUR:
        {
            const auto penalized = nextIndex(current, state.direction, total);
            ret.penaltyCards = drawPenaltyCards(state, penaltyFor(effect));
            auto& seat = state.seats.at(penalized);
            seat.hand.insert(
                seat.hand.end(), ret.penaltyCards.begin(),
                ret.penaltyCards.end());
            seat.saidUno = false;
            ret.skippedIndex = penalized;
            ret.nextIndex = nextIndex(current, state.direction, total, 2);
        }
        break;
    }

    log(LogLevel::DEBUG, "Game %s: %s resolved as %s, next seat %d",
        state.id, cardPlayed, effect, ret.nextIndex);
    giveTurnTo(state, ret.nextIndex);
    return ret;
}

std::ostream& operator<<(std::ostream& os, const CardEffect effect)
{
    switch (effect) {
    case CardEffect::ADVANCE:
        return os << "advance";
    case CardEffect::SKIP:
        return os << "skip";
    case CardEffect::REVERSE:
        return os << "reverse";
    case CardEffect::DRAW_TWO:
        return os << "draw two";
    case CardEffect::DRAW_FOUR:
        return os << "draw four";
    }
    return os;
}

}
}
