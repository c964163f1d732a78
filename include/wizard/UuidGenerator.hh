/** \file
 *
 * \brief Definition of UUID generation utilities
 */

#ifndef UUIDGENERATOR_HH_
#define UUIDGENERATOR_HH_

#include "wizard/PlayerId.hh"
#include "wizard/Random.hh"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>

namespace Wizard {

/** \brief The preferred UUID implementation
 */
using Uuid = boost::uuids::uuid;

/** \brief The preferred UUID generator
 */
using UuidGenerator = boost::uuids::basic_random_generator<Rng>;

/** \brief Get reference to the global UUID generator
 *
 * The generator draws from getRng().
 */
UuidGenerator& getUuidGenerator();

/** \brief Generate new UUID using the global generator
 */
Uuid generateUuid();

/** \brief Generate a new player identifier
 *
 * \return the string representation of a new UUID
 */
PlayerId generatePlayerId();

}

#endif // UUIDGENERATOR_HH_
