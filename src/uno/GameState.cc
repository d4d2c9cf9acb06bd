#include "uno/GameState.hh"

#include <algorithm>
#include <numeric>
#include <ostream>
#include <utility>

namespace Uno {

namespace {

template<typename State>
auto findSeatHelper(State& state, const PlayerId& playerId)
{
    const auto iter = std::find_if(
        state.seats.begin(), state.seats.end(),
        [&playerId](const auto& seat) { return seat.playerId == playerId; });
    return iter != state.seats.end() ? std::addressof(*iter) : nullptr;
}

}

PlayerSeat::PlayerSeat(PlayerId playerId, const int turnOrder) :
    playerId {std::move(playerId)},
    turnOrder {turnOrder}
{
}

PlayerSeat* findSeat(GameState& state, const PlayerId& playerId)
{
    return findSeatHelper(state, playerId);
}

const PlayerSeat* findSeat(const GameState& state, const PlayerId& playerId)
{
    return findSeatHelper(state, playerId);
}

int countCards(const GameState& state)
{
    return std::accumulate(
        state.seats.begin(), state.seats.end(),
        static_cast<int>(state.deck.size() + state.discardPile.size()),
        [](const auto sum, const auto& seat)
        {
            return sum + static_cast<int>(seat.hand.size());
        });
}

std::optional<CardType> getTopCard(const GameState& state)
{
    if (state.discardPile.empty()) {
        return std::nullopt;
    }
    return state.discardPile.back();
}

std::ostream& operator<<(std::ostream& os, const GameStatus status)
{
    switch (status) {
    case GameStatus::WAITING:
        return os << "waiting";
    case GameStatus::STARTED:
        return os << "started";
    case GameStatus::FINISHED:
        return os << "finished";
    }
    return os;
}

std::ostream& operator<<(std::ostream& os, const Direction direction)
{
    return os << (direction == Direction::CLOCKWISE ?
                  "clockwise" : "counterclockwise");
}

}
