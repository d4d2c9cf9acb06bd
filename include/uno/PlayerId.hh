/** \file
 *
 * \brief Definition of Uno::PlayerId
 */

#ifndef PLAYERID_HH_
#define PLAYERID_HH_

#include <string>

namespace Uno {

/** \brief Identifier of a player
 *
 * The engine does not interpret player identifiers. The collaborator that
 * authenticates players decides what they contain (typically a user name).
 */
using PlayerId = std::string;

}

#endif // PLAYERID_HH_
