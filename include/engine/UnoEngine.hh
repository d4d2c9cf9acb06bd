/** \file
 *
 * \brief Definition of Uno::Engine::UnoEngine class
 */

#ifndef ENGINE_UNOENGINE_HH_
#define ENGINE_UNOENGINE_HH_

#include "engine/GameStore.hh"
#include "engine/UnoDeclaration.hh"
#include "uno/CardType.hh"
#include "uno/Deck.hh"
#include "uno/GameState.hh"
#include "uno/PlayerId.hh"
#include "uno/Random.hh"
#include "uno/UnoConstants.hh"
#include "uno/Uuid.hh"

#include <boost/core/noncopyable.hpp>

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace Uno {
namespace Engine {

/** \brief Action taken by a player in turn
 */
enum class TurnAction {
    PLAY_CARD,  ///< Play a card from hand
    DRAW_CARD,  ///< Draw a card from the deck
};

/** \brief Parse turn action from its name
 *
 * \param name either “play-card” or “draw-card”
 *
 * \return the action, or none if \p name is not recognized
 */
std::optional<TurnAction> turnActionFromString(std::string_view name);

/** \brief Outcome of playing a card
 */
struct PlayResult {
    PlayerId player;                       ///< \brief The player who played
    CardType card;                         ///< \brief The card played
    Color currentColor;                    ///< \brief Color to match next
    Direction direction;                   ///< \brief Direction after play
    std::optional<PlayerId> nextPlayer;    ///< \brief Player in turn, if any
    std::optional<PlayerId> skippedPlayer; ///< \brief Player who was skipped
    Cards penaltyCards;                    ///< \brief Cards the skipped drew
    std::optional<PlayerId> winner;        ///< \brief Set if the play won
    int remainingCards;                    ///< \brief Cards left in hand
    bool unoWarning;                       ///< \brief One card is left
};

/** \brief Outcome of drawing a card
 */
struct DrawResult {
    PlayerId player;      ///< \brief The player who drew
    CardType card;        ///< \brief The card drawn
    PlayerId nextPlayer;  ///< \brief The player in turn
    int handSize;         ///< \brief Cards in hand after drawing
};

/** \brief Outcome of a turn action
 *
 * \sa UnoEngine::executeTurn()
 */
using TurnResult = std::variant<PlayResult, DrawResult>;

/** \brief The card that must be matched
 */
struct TopCard {
    CardType card;       ///< \brief The top card of the discard pile
    Color currentColor;  ///< \brief The color to match
};

/** \brief Score of a player
 */
using PlayerScore = std::pair<PlayerId, int>;

/** \brief The UNO game engine
 *
 * UnoEngine enforces the rules of UNO on the games kept in a GameStore. Every
 * operation is a single transaction of the store: it reads the state of the
 * game, checks the preconditions, transforms the state and writes it back.
 * If an operation fails, EngineFailure is thrown and the stored state is left
 * unchanged. Exceptions thrown by the store itself are propagated as is.
 *
 * The engine holds no state of its own besides the store. Concurrent calls
 * are safe as far as the store serializes the transactions of each game.
 */
class UnoEngine : private boost::noncopyable {
public:

    /** \brief Create new engine
     *
     * \param store the store of the games
     *
     * \throw std::invalid_argument if \p store is null
     */
    explicit UnoEngine(std::shared_ptr<GameStore> store);

    /** \brief Create a new game waiting for players
     *
     * \param maxPlayers the number of seats
     * \param seed the seed of the random number generator of the game. If
     * none, the generator is seeded from the OS.
     *
     * \return the identifier of the game
     *
     * \throw std::invalid_argument if \p maxPlayers is not between
     * MIN_PLAYERS and MAX_PLAYERS
     */
    GameId createGame(
        int maxPlayers = DEFAULT_MAX_PLAYERS,
        std::optional<RngSeed> seed = std::nullopt);

    /** \brief Seat a player
     *
     * The player takes the next free seat in turn order.
     *
     * \throw EngineFailure with kind NOT_FOUND, INVALID_GAME_STATE (game not
     * waiting), GAME_FULL or ALREADY_SEATED
     */
    void joinGame(const GameId& gameId, const PlayerId& player);

    /** \brief Remove a player from a game
     *
     * In a waiting game the seat is simply removed. In a started game the
     * hand of the player is put under the deck and the seats are renumbered.
     * If the player had the turn, it passes to the player who would have
     * followed. If only one player remains, that player wins.
     *
     * \throw EngineFailure with kind NOT_FOUND or INVALID_GAME_STATE (game
     * finished)
     */
    void leaveGame(const GameId& gameId, const PlayerId& player);

    /** \brief Toggle whether a seated player is ready to be dealt
     *
     * Players join not ready. Cards can only be dealt when every seated
     * player is ready.
     *
     * \return whether the player is ready after the call
     *
     * \throw EngineFailure with kind NOT_FOUND or INVALID_GAME_STATE (game
     * not waiting)
     */
    bool toggleReady(const GameId& gameId, const PlayerId& player);

    /** \brief Finish a game without a winner
     *
     * \throw EngineFailure with kind NOT_FOUND or INVALID_GAME_STATE (game
     * already finished)
     */
    void endGame(const GameId& gameId);

    /** \brief Deal the initial hands and start the game
     *
     * Turn order follows the order in which the players joined. The deck is
     * shuffled with the generator of the game, cards are dealt round-robin,
     * and the first card of the discard pile is selected. The first seat has
     * the turn and play proceeds clockwise.
     *
     * \param gameId the identifier of the game
     * \param cardsPerPlayer the number of cards dealt to each player
     *
     * \throw EngineFailure with kind NOT_FOUND, INVALID_GAME_STATE (game not
     * waiting), TOO_FEW_PLAYERS, NOT_READY (some player is not ready) or
     * DECK_EXHAUSTED (no card left for the discard pile)
     * \throw std::invalid_argument if \p cardsPerPlayer is negative
     */
    void dealInitialHands(
        const GameId& gameId,
        int cardsPerPlayer = DEFAULT_CARDS_PER_PLAYER);

    /** \brief Play a card
     *
     * The preconditions are checked in the following order: the game exists
     * and is started, the player is seated, the player has the turn, the card
     * is in the hand, the card is legal, and a wild card comes with a valid
     * color choice. A color choice given with a card that is not wild is
     * ignored if it is a valid color.
     *
     * \param gameId the identifier of the game
     * \param player the player
     * \param card the card to play
     * \param chosenColor the name of the color chosen for a wild card
     *
     * \return the outcome of the play
     *
     * \throw EngineFailure with kind NOT_FOUND, NOT_STARTED,
     * INVALID_GAME_STATE (game finished), NOT_YOUR_TURN, CARD_NOT_IN_HAND,
     * ILLEGAL_CARD, MISSING_COLOR_CHOICE or INVALID_COLOR_CHOICE
     */
    PlayResult playCard(
        const GameId& gameId, const PlayerId& player, const CardType& card,
        const std::optional<std::string>& chosenColor = std::nullopt);

    /** \brief Draw a card and end the turn
     *
     * \throw EngineFailure with kind NOT_FOUND, NOT_STARTED,
     * INVALID_GAME_STATE (game finished), NOT_YOUR_TURN or DECK_EXHAUSTED
     */
    DrawResult drawCard(const GameId& gameId, const PlayerId& player);

    /** \brief Take a turn action
     *
     * Dispatches to playCard() or drawCard().
     *
     * \throw EngineFailure with kind INVALID_ACTION if \p action is
     * TurnAction::PLAY_CARD but \p card is none, and anything playCard() or
     * drawCard() throws
     */
    TurnResult executeTurn(
        const GameId& gameId, const PlayerId& player, TurnAction action,
        const std::optional<CardType>& card = std::nullopt,
        const std::optional<std::string>& chosenColor = std::nullopt);

    /** \brief Get the cards a player may play
     *
     * \return the legal cards in hand order
     *
     * \throw EngineFailure with kind NOT_FOUND, NOT_STARTED or
     * INVALID_GAME_STATE (game finished)
     */
    Cards getLegalCards(const GameId& gameId, const PlayerId& player) const;

    /** \brief Say UNO
     *
     * \throw EngineFailure with kind NOT_FOUND, NOT_STARTED,
     * INVALID_GAME_STATE (game finished) or INVALID_UNO_DECLARATION
     */
    void sayUno(const GameId& gameId, const PlayerId& player);

    /** \brief Challenge a player for not saying UNO
     *
     * \param gameId the identifier of the game
     * \param challenger the player making the challenge
     * \param challenged the player being challenged
     *
     * \return the outcome of the challenge
     *
     * \throw EngineFailure with kind NOT_FOUND, NOT_STARTED,
     * INVALID_GAME_STATE (game finished) or INVALID_CHALLENGE
     */
    ChallengeResult challengeUno(
        const GameId& gameId, const PlayerId& challenger,
        const PlayerId& challenged);

    /** \brief Get a snapshot of the state of a game
     *
     * \throw EngineFailure with kind NOT_FOUND
     */
    GameState getGameState(const GameId& gameId) const;

    /** \brief Get the player in turn
     *
     * \throw EngineFailure with kind NOT_FOUND, NOT_STARTED or
     * INVALID_GAME_STATE (game finished)
     */
    PlayerId getCurrentPlayer(const GameId& gameId) const;

    /** \brief Get the card that must be matched
     *
     * \throw EngineFailure with kind NOT_FOUND, NOT_STARTED or
     * INVALID_GAME_STATE (game finished)
     */
    TopCard getTopCard(const GameId& gameId) const;

    /** \brief Get the scores of the players in turn order
     *
     * \throw EngineFailure with kind NOT_FOUND
     */
    std::vector<PlayerScore> getScores(const GameId& gameId) const;

private:

    void transact(
        const GameId& gameId, const GameStore::Transaction& transaction);

    GameState findGame(const GameId& gameId) const;

    std::shared_ptr<GameStore> store;
};

/** \brief Output a TurnAction to stream
 *
 * \param os the output stream
 * \param action the action to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, TurnAction action);

/** \brief Output a summary of a play to stream
 *
 * \param os the output stream
 * \param result the outcome of the play
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const PlayResult& result);

/** \brief Output a summary of a draw to stream
 *
 * \param os the output stream
 * \param result the outcome of the draw
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const DrawResult& result);

/** \brief Output a summary of a challenge to stream
 *
 * \param os the output stream
 * \param result the outcome of the challenge
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const ChallengeResult& result);

}
}

#endif // ENGINE_UNOENGINE_HH_
