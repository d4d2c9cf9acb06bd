/** \file
 *
 * \brief Random number generation for the UNO engine
 */

#ifndef RANDOM_HH_
#define RANDOM_HH_

#include <random>

namespace Uno {

/** \brief The preferred random number generator for the UNO engine
 *
 * Each game owns an instance of the generator, so that all shuffles of a
 * game can be reproduced from its seed and games never share random state.
 */
using Rng = std::mt19937;

/** \brief Type of the seed accepted by makeRng()
 */
using RngSeed = Rng::result_type;

/** \brief Create a generator seeded from the OS random number source
 *
 * \return a new random number generator
 */
Rng makeRng();

/** \brief Create a generator with a known seed
 *
 * \param seed the seed
 *
 * \return a new random number generator
 */
Rng makeRng(RngSeed seed);

}

#endif // RANDOM_HH_
