/** \file
 *
 * \brief Definition of Uno::Uuid
 */

#ifndef UUID_HH_
#define UUID_HH_

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace Uno {

/** \brief The preferred UUID implementation in the UNO engine
 */
using Uuid = boost::uuids::uuid;

/** \brief Identifier of a game
 */
using GameId = Uuid;

}

#endif // UUID_HH_
