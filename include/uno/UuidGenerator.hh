/** \file
 *
 * \brief Definition of UUID generator utilities
 */

#ifndef UUIDGENERATOR_HH_
#define UUIDGENERATOR_HH_

#include "uno/Random.hh"
#include "uno/Uuid.hh"

#include <boost/uuid/random_generator.hpp>

namespace Uno {

/** \brief The preferred UUID generator for the UNO engine
 *
 * The generator borrows the random number generator passed to its
 * constructor. It is not thread safe.
 */
using UuidGenerator = boost::uuids::basic_random_generator<Rng>;

}

#endif // UUIDGENERATOR_HH_
