/** \file
 *
 * \brief Definition of the messages the server sends to clients
 *
 * Each function returns the serialized payload of one message.
 *
 * \sa \ref wizardprotocolserver
 */

#ifndef MAIN_SERVERMESSAGES_HH_
#define MAIN_SERVERMESSAGES_HH_

#include "engine/MatchState.hh"
#include "engine/WizardEngine.hh"
#include "wizard/CardType.hh"
#include "wizard/PlayerId.hh"

#include <string>
#include <string_view>

namespace Wizard {
namespace Main {

/** \brief Create game_state message
 *
 * \param projection the state of the match as seen by the recipient
 */
std::string makeGameStateMessage(const Engine::MatchState& projection);

/** \brief Create error message
 */
std::string makeErrorMessage(std::string_view message);

/** \brief Create join_success message
 */
std::string makeJoinSuccessMessage(const PlayerId& playerId);

/** \brief Create player_joined message
 */
std::string makePlayerJoinedMessage(
    const PlayerId& id, std::string_view name, bool isSpectator);

/** \brief Create player_left message
 */
std::string makePlayerLeftMessage(const PlayerId& id, std::string_view name);

/** \brief Create game_started message
 */
std::string makeGameStartedMessage();

/** \brief Create bid_placed message
 */
std::string makeBidPlacedMessage(const PlayerId& playerId, int bid);

/** \brief Create card_played message
 */
std::string makeCardPlayedMessage(const PlayerId& playerId, const Card& card);

/** \brief Create trick_won message
 */
std::string makeTrickWonMessage(const PlayerId& playerId);

/** \brief Create round_ended message
 *
 * \param scores the total scores of the players after the round
 */
std::string makeRoundEndedMessage(
    const Engine::WizardEngine::RoundEnded::ScoreVector& scores);

}
}

#endif // MAIN_SERVERMESSAGES_HH_
