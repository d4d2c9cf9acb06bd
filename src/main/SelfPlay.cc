#include "main/SelfPlay.hh"

#include "engine/EngineFailure.hh"
#include "Logging.hh"

#include <algorithm>
#include <array>
#include <iterator>
#include <ostream>
#include <variant>

namespace Uno {
namespace Main {

using Engine::EngineFailure;
using Engine::TurnAction;

Color preferredColor(const Cards& hand)
{
    auto counts = std::array<int, COLORS.size()> {};
    for (const auto& card : hand) {
        if (card.color) {
            ++counts[static_cast<std::size_t>(*card.color)];
        }
    }
    const auto iter = std::max_element(counts.begin(), counts.end());
    return COLORS[std::distance(counts.begin(), iter)];
}

Move chooseMove(const Cards& hand, const Cards& legal)
{
    if (legal.empty()) {
        return {TurnAction::DRAW_CARD, std::nullopt, std::nullopt};
    }
    const auto& card = legal.front();
    if (!isWild(card)) {
        return {TurnAction::PLAY_CARD, card, std::nullopt};
    }
    auto rest = hand;
    rest.erase(std::find(rest.begin(), rest.end(), card));
    return {
        TurnAction::PLAY_CARD, card,
        std::string {colorName(preferredColor(rest))}};
}

SelfPlayResult playGame(
    Engine::UnoEngine& engine, const GameSetup& setup, std::ostream& out)
{
    const auto game_id = engine.createGame(setup.maxPlayers, setup.seed);
    for (const auto& player : setup.players) {
        engine.joinGame(game_id, player);
        engine.toggleReady(game_id, player);
    }
    engine.dealInitialHands(game_id, setup.cardsPerPlayer);

    auto turns = 0;
    while (turns < setup.maxTurns) {
        const auto state = engine.getGameState(game_id);
        if (state.status != GameStatus::STARTED) {
            break;
        }
        const auto& seat = state.seats.at(state.currentPlayerIndex);
        const auto legal = engine.getLegalCards(game_id, seat.playerId);
        const auto move = chooseMove(seat.hand, legal);
        try {
            const auto result = engine.executeTurn(
                game_id, seat.playerId, move.action, move.card,
                move.chosenColor);
            if (const auto* play = std::get_if<Engine::PlayResult>(&result)) {
                out << *play << '\n';
                if (play->unoWarning) {
                    engine.sayUno(game_id, seat.playerId);
                    out << seat.playerId << " says UNO!\n";
                }
            } else {
                out << std::get<Engine::DrawResult>(result) << '\n';
            }
        } catch (const EngineFailure& e) {
            if (e.getKind() != EngineFailure::Kind::DECK_EXHAUSTED) {
                throw;
            }
            log(LogLevel::WARNING,
                "Game %s: %s cannot play or draw, ending the game",
                game_id, seat.playerId);
            break;
        }
        ++turns;
    }

    auto state = engine.getGameState(game_id);
    if (state.status != GameStatus::FINISHED) {
        log(LogLevel::WARNING, "Game %s: no winner after %d turns",
            game_id, turns);
        engine.endGame(game_id);
        state = engine.getGameState(game_id);
    }
    return {game_id, state.winner, turns, engine.getScores(game_id)};
}

}
}
