/** \file
 *
 * \brief Definition of the random number generator used by the server
 */

#ifndef RANDOM_HH_
#define RANDOM_HH_

#include <optional>
#include <random>

namespace Wizard {

/** \brief The preferred random number generator
 */
using Rng = std::mt19937;

/** \brief Get reference to the global random number generator
 *
 * The generator is seeded from the random device of the operating system
 * when first used, unless seedRng() was called before that.
 */
Rng& getRng();

/** \brief Reseed the global random number generator
 *
 * Makes shuffles and bot decisions reproducible. Intended for testing and
 * for reproducing a reported match.
 *
 * \param seed the seed
 */
void seedRng(Rng::result_type seed);

/** \brief Create a new random number generator
 *
 * \param seed the seed, or none to seed from the random device
 */
Rng makeRng(std::optional<Rng::result_type> seed = std::nullopt);

}

#endif // RANDOM_HH_
