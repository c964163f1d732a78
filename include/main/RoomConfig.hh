/** \file
 *
 * \brief Definition of Wizard::Main::RoomConfig struct
 */

#ifndef MAIN_ROOMCONFIG_HH_
#define MAIN_ROOMCONFIG_HH_

#include "wizard/WizardConstants.hh"

#include <chrono>

namespace Wizard {
namespace Main {

/** \brief Tunable parameters of a SessionRoom
 */
struct RoomConfig {
    /// \brief Number of players needed to start the match
    int minPlayers {MIN_PLAYERS};
    /// \brief Delay before a bot bids or plays
    std::chrono::milliseconds botDelay {500};
    /// \brief Delay between a full trick and its evaluation
    std::chrono::milliseconds trickDelay {1500};
    /// \brief Delay between the last trick of a round and scoring
    std::chrono::milliseconds roundDelay {2000};
    /// \brief The room is released after this long without messages
    std::chrono::milliseconds inactivityTimeout {std::chrono::minutes {30}};
    /// \brief Interval of the inactivity check
    std::chrono::milliseconds inactivityCheckInterval {std::chrono::minutes {1}};
};

}
}

#endif // MAIN_ROOMCONFIG_HH_
