/** \file
 *
 * \brief Definition of fundamental UNO constants needed by several classes
 */

#ifndef UNOCONSTANTS_HH_
#define UNOCONSTANTS_HH_

/** \brief Top level namespace of the UNO engine
 *
 * The Uno namespace directly contains the card model and the rule primitives
 * of the game. It also contains subnamespaces for the engine that
 * orchestrates games and for the command line front end.
 */
namespace Uno {

/** \brief Number of cards in a standard UNO deck
 */
constexpr auto N_CARDS = 108;

/** \brief Number of colored cards in a standard UNO deck
 *
 * Each of the four colors has one zero, and two of each 1–9, Skip, Reverse
 * and Draw Two.
 */
constexpr auto N_CARDS_PER_COLOR = 25;

/** \brief Number of Wild and Wild Draw Four cards combined
 */
constexpr auto N_WILD_CARDS = N_CARDS - 4 * N_CARDS_PER_COLOR; // 8

/** \brief Number of cards dealt to each player unless otherwise requested
 */
constexpr auto DEFAULT_CARDS_PER_PLAYER = 7;

/** \brief Minimum number of seated players required to deal
 */
constexpr auto MIN_PLAYERS = 2;

/** \brief Maximum number of seats a game may be created with
 */
constexpr auto MAX_PLAYERS = 10;

/** \brief Number of seats a game is created with unless otherwise requested
 */
constexpr auto DEFAULT_MAX_PLAYERS = 4;

}

#endif // UNOCONSTANTS_HH_
