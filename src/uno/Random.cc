#include "uno/Random.hh"

namespace Uno {

Rng makeRng()
{
    // Initialize with seed from OS random number source
    return makeRng(std::random_device {}());
}

Rng makeRng(const RngSeed seed)
{
    return Rng {seed};
}

}
