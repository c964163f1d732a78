/** \file
 *
 * \brief Definition of Wizard::PlayerId
 */

#ifndef PLAYERID_HH_
#define PLAYERID_HH_

#include <string>

namespace Wizard {

/** \brief Identifier of a participant of a match
 *
 * Human participants get the identifier of their connection, and bots get a
 * freshly generated one. Both are textual UUIDs.
 */
using PlayerId = std::string;

}

#endif // PLAYERID_HH_
