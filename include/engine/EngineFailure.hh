/** \file
 *
 * \brief Definition of Uno::Engine::EngineFailure class
 */

#ifndef ENGINE_ENGINEFAILURE_HH_
#define ENGINE_ENGINEFAILURE_HH_

#include <iosfwd>
#include <stdexcept>
#include <string>

namespace Uno {
namespace Engine {

/** \brief Exception to indicate that the engine rejected an operation
 *
 * This non-fatal exception is thrown when an operation is not allowed in the
 * current state of the game. The reason is given by getKind(), and the
 * message returned by what() is meant for logs and for the player. When
 * EngineFailure is thrown, the stored game state is unchanged.
 */
class EngineFailure : public std::runtime_error {
public:

    /** \brief The reason of the failure
     */
    enum class Kind {
        NOT_FOUND,                ///< Game or seat does not exist
        NOT_STARTED,              ///< Operation requires a started game
        INVALID_GAME_STATE,       ///< Lifecycle operation not allowed now
        NOT_YOUR_TURN,            ///< Acting seat does not have the turn
        CARD_NOT_IN_HAND,         ///< The card is not in the hand
        ILLEGAL_CARD,             ///< The card does not match the pile
        MISSING_COLOR_CHOICE,     ///< Wild card played without color
        INVALID_COLOR_CHOICE,     ///< The chosen color is not a color
        DECK_EXHAUSTED,           ///< No card is left to draw
        INVALID_UNO_DECLARATION,  ///< UNO declared with hand size not 1
        INVALID_CHALLENGE,        ///< Challenged hand size is not 1
        INVALID_ACTION,           ///< Turn action is malformed
        TOO_FEW_PLAYERS,          ///< Not enough players to deal
        GAME_FULL,                ///< All seats are taken
        ALREADY_SEATED,           ///< The player already has a seat
        NOT_READY,                ///< Some seated player is not ready
    };

    /** \brief Create new engine failure
     *
     * \param kind see getKind()
     * \param what the explanatory message
     */
    EngineFailure(Kind kind, const std::string& what);

    /** \brief Get the reason of the failure
     */
    Kind getKind() const noexcept;

private:

    Kind kind;
};

/** \brief Output the kind of an engine failure to stream
 *
 * \param os the output stream
 * \param kind the failure kind to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, EngineFailure::Kind kind);

}
}

#endif // ENGINE_ENGINEFAILURE_HH_
