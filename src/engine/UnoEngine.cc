#include "engine/UnoEngine.hh"

#include "engine/EngineFailure.hh"
#include "engine/TurnStateMachine.hh"
#include "uno/AllowedCards.hh"
#include "uno/Dealing.hh"
#include "uno/Scoring.hh"
#include "Logging.hh"
#include "Utility.hh"

#include <algorithm>
#include <array>
#include <iterator>
#include <ostream>
#include <random>
#include <stdexcept>
#include <utility>

namespace Uno {
namespace Engine {

namespace {

using Kind = EngineFailure::Kind;

const auto TURN_ACTION_NAMES = std::array {
    std::pair {TurnAction::PLAY_CARD, std::string_view {"play-card"}},
    std::pair {TurnAction::DRAW_CARD, std::string_view {"draw-card"}},
};

void requireStarted(const GameState& state)
{
    switch (state.status) {
    case GameStatus::WAITING:
        throw EngineFailure {Kind::NOT_STARTED, "The game has not started"};
    case GameStatus::FINISHED:
        throw EngineFailure {
            Kind::INVALID_GAME_STATE, "The game has already finished"};
    case GameStatus::STARTED:
        break;
    }
}

template<typename State>
auto& requireSeat(State& state, const PlayerId& player)
{
    const auto seat = findSeat(state, player);
    if (!seat) {
        throw EngineFailure {
            Kind::NOT_FOUND, "Player " + player + " is not in the game"};
    }
    return *seat;
}

void requireTurn(const PlayerSeat& seat)
{
    if (!seat.isCurrentTurn) {
        throw EngineFailure {Kind::NOT_YOUR_TURN, "It is not your turn"};
    }
}

TopCard requireTopCard(const GameState& state)
{
    return {dereference(getTopCard(state)), dereference(state.currentColor)};
}

Color randomColor(Rng& rng)
{
    auto dist = std::uniform_int_distribution<std::size_t> {
        0, COLORS.size() - 1};
    return COLORS[dist(rng)];
}

void renumberSeats(GameState& state)
{
    for (const auto n : to(state.seats.size())) {
        state.seats[n].turnOrder = static_cast<int>(n);
    }
}

void finishWithWinner(GameState& state, const PlayerId& winner)
{
    state.status = GameStatus::FINISHED;
    state.winner = winner;
    clearTurns(state);
}

}

std::optional<TurnAction> turnActionFromString(const std::string_view name)
{
    const auto iter = std::find_if(
        TURN_ACTION_NAMES.begin(), TURN_ACTION_NAMES.end(),
        [name](const auto& entry) { return entry.second == name; });
    if (iter == TURN_ACTION_NAMES.end()) {
        return std::nullopt;
    }
    return iter->first;
}

UnoEngine::UnoEngine(std::shared_ptr<GameStore> store) :
    store {std::move(store)}
{
    if (!this->store) {
        throw std::invalid_argument {"Game store must not be null"};
    }
}

GameId UnoEngine::createGame(
    const int maxPlayers, const std::optional<RngSeed> seed)
{
    if (maxPlayers < MIN_PLAYERS || maxPlayers > MAX_PLAYERS) {
        throw std::invalid_argument {"Invalid number of seats"};
    }
    auto state = GameState {};
    state.maxPlayers = maxPlayers;
    state.rng = seed ? makeRng(*seed) : makeRng();
    const auto gameId = store->create(std::move(state));
    log(LogLevel::INFO, "Game %s: created with %d seats", gameId, maxPlayers);
    return gameId;
}

void UnoEngine::joinGame(const GameId& gameId, const PlayerId& player)
{
    transact(
        gameId,
        [&player](GameState& state)
        {
            if (state.status != GameStatus::WAITING) {
                throw EngineFailure {
                    Kind::INVALID_GAME_STATE,
                    "Players can only join a game that has not started"};
            }
            if (static_cast<int>(state.seats.size()) >= state.maxPlayers) {
                throw EngineFailure {Kind::GAME_FULL, "The game is full"};
            }
            if (findSeat(state, player)) {
                throw EngineFailure {
                    Kind::ALREADY_SEATED,
                    "Player " + player + " is already in the game"};
            }
            state.seats.emplace_back(
                player, static_cast<int>(state.seats.size()));
            log(LogLevel::INFO, "Game %s: %s joined", state.id, player);
        });
}

void UnoEngine::leaveGame(const GameId& gameId, const PlayerId& player)
{
    transact(
        gameId,
        [&player](GameState& state)
        {
            if (state.status == GameStatus::FINISHED) {
                throw EngineFailure {
                    Kind::INVALID_GAME_STATE, "The game has already finished"};
            }
            const auto& seat = requireSeat(state, player);
            const auto index = seat.turnOrder;
            const auto n_seats = static_cast<int>(state.seats.size());
            const auto started = (state.status == GameStatus::STARTED);
            if (started) {
                state.deck.insert(
                    state.deck.begin(), seat.hand.begin(), seat.hand.end());
            }
            const auto following = seat.isCurrentTurn ?
                nextIndex(index, state.direction, n_seats) :
                state.currentPlayerIndex;
            state.seats.erase(std::next(state.seats.begin(), index));
            renumberSeats(state);
            log(LogLevel::INFO, "Game %s: %s left", state.id, player);
            if (!started) {
                return;
            }
            if (state.seats.size() == 1) {
                const auto& winner = state.seats.front().playerId;
                finishWithWinner(state, winner);
                log(LogLevel::INFO, "Game %s: %s wins as the last player",
                    state.id, winner);
                return;
            }
            giveTurnTo(state, following > index ? following - 1 : following);
        });
}

bool UnoEngine::toggleReady(const GameId& gameId, const PlayerId& player)
{
    auto ret = false;
    transact(
        gameId,
        [&](GameState& state)
        {
            if (state.status != GameStatus::WAITING) {
                throw EngineFailure {
                    Kind::INVALID_GAME_STATE,
                    "Readiness can only change before the game starts"};
            }
            auto& seat = requireSeat(state, player);
            seat.isReady = !seat.isReady;
            ret = seat.isReady;
            log(LogLevel::INFO, "Game %s: %s is %s", state.id, player,
                ret ? "ready" : "not ready");
        });
    return ret;
}

void UnoEngine::endGame(const GameId& gameId)
{
    transact(
        gameId,
        [](GameState& state)
        {
            if (state.status == GameStatus::FINISHED) {
                throw EngineFailure {
                    Kind::INVALID_GAME_STATE, "The game has already finished"};
            }
            state.status = GameStatus::FINISHED;
            state.winner = std::nullopt;
            clearTurns(state);
            log(LogLevel::INFO, "Game %s: ended", state.id);
        });
}

void UnoEngine::dealInitialHands(const GameId& gameId, const int cardsPerPlayer)
{
    if (cardsPerPlayer < 0) {
        throw std::invalid_argument {"Number of cards must not be negative"};
    }
    transact(
        gameId,
        [cardsPerPlayer](GameState& state)
        {
            if (state.status != GameStatus::WAITING) {
                throw EngineFailure {
                    Kind::INVALID_GAME_STATE,
                    "Cards can only be dealt before the game starts"};
            }
            if (static_cast<int>(state.seats.size()) < MIN_PLAYERS) {
                throw EngineFailure {
                    Kind::TOO_FEW_PLAYERS, "Not enough players to deal"};
            }
            const auto all_ready = std::all_of(
                state.seats.begin(), state.seats.end(),
                [](const auto& seat) { return seat.isReady; });
            if (!all_ready) {
                throw EngineFailure {
                    Kind::NOT_READY, "Not all players are ready"};
            }
            renumberSeats(state);
            auto players = std::vector<PlayerId> {};
            for (const auto& seat : state.seats) {
                players.emplace_back(seat.playerId);
            }
            auto dealt = deal(
                players, cardsPerPlayer,
                shuffle(buildStandardDeck(), state.rng));
            if (dealt.remainingDeck.empty()) {
                throw EngineFailure {
                    Kind::DECK_EXHAUSTED,
                    "No card is left to start the discard pile"};
            }
            for (auto& seat : state.seats) {
                seat.hand = std::move(dealt.hands[seat.playerId]);
                seat.saidUno = false;
            }
            auto initial = selectInitialDiscard(
                std::move(dealt.remainingDeck));
            state.deck = std::move(initial.remainingDeck);
            state.discardPile.assign(1, initial.card);
            state.currentColor = initial.card.color ?
                *initial.card.color : randomColor(state.rng);
            state.direction = Direction::CLOCKWISE;
            state.winner = std::nullopt;
            state.status = GameStatus::STARTED;
            giveTurnTo(state, 0);
            log(LogLevel::INFO,
                "Game %s: dealt %d cards to %d players, starting with %s",
                state.id, cardsPerPlayer, state.seats.size(), initial.card);
        });
}

PlayResult UnoEngine::playCard(
    const GameId& gameId, const PlayerId& player, const CardType& card,
    const std::optional<std::string>& chosenColor)
{
    auto ret = PlayResult {};
    transact(
        gameId,
        [&](GameState& state)
        {
            requireStarted(state);
            auto& seat = requireSeat(state, player);
            requireTurn(seat);
            const auto iter = std::find(
                seat.hand.begin(), seat.hand.end(), card);
            if (iter == seat.hand.end()) {
                throw EngineFailure {
                    Kind::CARD_NOT_IN_HAND, "The card is not in your hand"};
            }
            const auto top = requireTopCard(state);
            if (!isLegal(card, top.card, top.currentColor)) {
                throw EngineFailure {
                    Kind::ILLEGAL_CARD, "The card does not match the pile"};
            }
            const auto has_choice = chosenColor && !chosenColor->empty();
            const auto chosen = has_choice ?
                colorFromString(*chosenColor) : std::nullopt;
            if (isWild(card) && !has_choice) {
                throw EngineFailure {
                    Kind::MISSING_COLOR_CHOICE,
                    "A color must be chosen for a wild card"};
            }
            if (has_choice && !chosen) {
                throw EngineFailure {
                    Kind::INVALID_COLOR_CHOICE,
                    "Invalid color " + *chosenColor};
            }

            seat.hand.erase(iter);
            state.discardPile.emplace_back(card);
            state.currentColor = isWild(card) ? *chosen : *card.color;
            clearStaleDeclaration(seat);
            seat.isCurrentTurn = false;

            ret.player = player;
            ret.card = card;
            ret.currentColor = *state.currentColor;
            ret.remainingCards = static_cast<int>(seat.hand.size());
            ret.unoWarning = (ret.remainingCards == 1);
            log(LogLevel::INFO, "Game %s: %s played %s", state.id, player,
                card);

            if (seat.hand.empty()) {
                seat.score += winnerPoints(state, player);
                finishWithWinner(state, player);
                ret.winner = player;
                ret.direction = state.direction;
                log(LogLevel::INFO, "Game %s: %s wins with %d points",
                    state.id, player, seat.score);
                return;
            }

            auto resolution = resolveEffect(state, card);
            ret.direction = state.direction;
            ret.nextPlayer = state.seats.at(resolution.nextIndex).playerId;
            if (resolution.skippedIndex) {
                ret.skippedPlayer =
                    state.seats.at(*resolution.skippedIndex).playerId;
            }
            ret.penaltyCards = std::move(resolution.penaltyCards);
            if (ret.unoWarning) {
                log(LogLevel::DEBUG, "Game %s: %s has one card left",
                    state.id, player);
            }
        });
    return ret;
}

DrawResult UnoEngine::drawCard(const GameId& gameId, const PlayerId& player)
{
    auto ret = DrawResult {};
    transact(
        gameId,
        [&](GameState& state)
        {
            requireStarted(state);
            auto& seat = requireSeat(state, player);
            requireTurn(seat);
            const auto card = Engine::drawCard(state);
            seat.hand.emplace_back(card);
            seat.saidUno = false;
            const auto next = nextIndex(
                seat.turnOrder, state.direction,
                static_cast<int>(state.seats.size()));
            giveTurnTo(state, next);
            ret = DrawResult {
                player, card, state.seats.at(next).playerId,
                static_cast<int>(seat.hand.size())};
            log(LogLevel::INFO, "Game %s: %s drew a card", state.id, player);
        });
    return ret;
}

TurnResult UnoEngine::executeTurn(
    const GameId& gameId, const PlayerId& player, const TurnAction action,
    const std::optional<CardType>& card,
    const std::optional<std::string>& chosenColor)
{
    switch (action) {
    case TurnAction::PLAY_CARD:
        if (!card) {
            log(LogLevel::DEBUG, "Game %s: %s tried to play without a card",
                gameId, player);
            throw EngineFailure {
                Kind::INVALID_ACTION, "The card to play must be given"};
        }
        return playCard(gameId, player, *card, chosenColor);
    case TurnAction::DRAW_CARD:
        return drawCard(gameId, player);
    }
    throw EngineFailure {Kind::INVALID_ACTION, "Invalid turn action"};
}

Cards UnoEngine::getLegalCards(
    const GameId& gameId, const PlayerId& player) const
{
    const auto state = findGame(gameId);
    requireStarted(state);
    const auto& seat = requireSeat(state, player);
    const auto top = requireTopCard(state);
    auto ret = Cards {};
    std::ranges::copy(
        legalCards(seat.hand, top.card, top.currentColor),
        std::back_inserter(ret));
    return ret;
}

void UnoEngine::sayUno(const GameId& gameId, const PlayerId& player)
{
    transact(
        gameId,
        [&player](GameState& state)
        {
            requireStarted(state);
            declareUno(requireSeat(state, player));
            log(LogLevel::INFO, "Game %s: %s said UNO", state.id, player);
        });
}

ChallengeResult UnoEngine::challengeUno(
    const GameId& gameId, const PlayerId& challenger,
    const PlayerId& challenged)
{
    auto ret = ChallengeResult {};
    transact(
        gameId,
        [&](GameState& state)
        {
            requireStarted(state);
            requireSeat(state, challenger);
            auto& challenged_seat = requireSeat(state, challenged);
            if (challenger == challenged) {
                throw EngineFailure {
                    Kind::INVALID_CHALLENGE,
                    "Players cannot challenge themselves"};
            }
            ret = resolveChallenge(state, challenger, challenged_seat);
        });
    return ret;
}

GameState UnoEngine::getGameState(const GameId& gameId) const
{
    return findGame(gameId);
}

PlayerId UnoEngine::getCurrentPlayer(const GameId& gameId) const
{
    const auto state = findGame(gameId);
    requireStarted(state);
    return state.seats.at(state.currentPlayerIndex).playerId;
}

TopCard UnoEngine::getTopCard(const GameId& gameId) const
{
    const auto state = findGame(gameId);
    requireStarted(state);
    return requireTopCard(state);
}

std::vector<PlayerScore> UnoEngine::getScores(const GameId& gameId) const
{
    const auto state = findGame(gameId);
    auto ret = std::vector<PlayerScore> {};
    for (const auto& seat : state.seats) {
        ret.emplace_back(seat.playerId, seat.score);
    }
    return ret;
}

void UnoEngine::transact(
    const GameId& gameId, const GameStore::Transaction& transaction)
{
    try {
        if (!store->modify(gameId, transaction)) {
            throw EngineFailure {Kind::NOT_FOUND, "Game not found"};
        }
    } catch (const EngineFailure& e) {
        log(LogLevel::DEBUG, "Game %s: rejected (%s): %s",
            gameId, e.getKind(), e.what());
        throw;
    }
}

GameState UnoEngine::findGame(const GameId& gameId) const
{
    auto state = store->find(gameId);
    if (!state) {
        log(LogLevel::DEBUG, "Game %s: not found", gameId);
        throw EngineFailure {Kind::NOT_FOUND, "Game not found"};
    }
    return std::move(*state);
}

std::ostream& operator<<(std::ostream& os, const TurnAction action)
{
    const auto iter = std::find_if(
        TURN_ACTION_NAMES.begin(), TURN_ACTION_NAMES.end(),
        [action](const auto& entry) { return entry.first == action; });
    if (iter != TURN_ACTION_NAMES.end()) {
        os << iter->second;
    }
    return os;
}

std::ostream& operator<<(std::ostream& os, const PlayResult& result)
{
    os << result.player << " played " << result.card;
    if (isWild(result.card)) {
        os << " and chose " << result.currentColor;
    }
    os << '.';
    if (result.winner) {
        return os << ' ' << *result.winner << " wins!";
    }
    if (result.skippedPlayer) {
        os << ' ' << *result.skippedPlayer;
        if (!result.penaltyCards.empty()) {
            os << " draws " << result.penaltyCards.size() << " cards and";
        }
        os << " is skipped.";
    }
    if (result.unoWarning) {
        os << ' ' << result.player << " has one card left!";
    }
    if (result.nextPlayer) {
        os << " Next: " << *result.nextPlayer << '.';
    }
    return os;
}

std::ostream& operator<<(std::ostream& os, const DrawResult& result)
{
    return os << result.player << " drew a card. Next: " << result.nextPlayer
              << '.';
}

std::ostream& operator<<(std::ostream& os, const ChallengeResult& result)
{
    if (result.successful) {
        return os << result.challenger << " caught " << result.challenged
                  << " not saying UNO. " << result.challenged << " draws "
                  << result.penaltyCards.size() << " cards.";
    }
    return os << result.challenged << " said UNO on time.";
}

}
}
