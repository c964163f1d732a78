#include "wizard/Random.hh"

namespace Wizard {

Rng& getRng()
{
    static Rng randomEngine {makeRng()};
    return randomEngine;
}

void seedRng(const Rng::result_type seed)
{
    getRng().seed(seed);
}

Rng makeRng(const std::optional<Rng::result_type> seed)
{
    if (seed) {
        return Rng {*seed};
    }
    return Rng {std::random_device {}()};
}

}
