/** \file
 *
 * \brief Definition of JSON serializer for Wizard::Engine::MatchState
 *
 * \page jsonmatchstate Match state JSON representation
 *
 * The state sent to a viewer in the \c game_state message is a JSON object
 * consisting of the following:
 *
 * \code{.json}
 * {
 *     "players": { <id>: <player>, ... },
 *     "playerOrder": [ <id>, ... ],
 *     "spectators": { <id>: <spectator>, ... },
 *     "currentRound": <round>,
 *     "maxRounds": <maxRounds>,
 *     "trumpCard": <card>,
 *     "currentTrick": [ <card>, ... ],
 *     "leadingPlayerId": <id>,
 *     "activePlayerId": <id>,
 *     "phase": <phase>,
 *     "leadSuit": <suit>
 * }
 * \endcode
 *
 * - &lt;player&gt; is an object with keys "id", "name", "isHuman",
 *   "connected", "hand" (array of cards), "tricks", "bid" (integer or null)
 *   and "score".
 * - &lt;spectator&gt; is an object with keys "id", "name" and "connected".
 * - &lt;card&gt; is a card as described in \ref jsoncard. "trumpCard" is null
 *   if there is no trump card.
 * - "leadingPlayerId", "activePlayerId" and "leadSuit" are null when not
 *   set.
 * - &lt;phase&gt; is one of "waiting", "bidding", "playing", "scoring",
 *   "finished".
 */

#ifndef MESSAGING_MATCHSTATEJSONSERIALIZER_HH_
#define MESSAGING_MATCHSTATEJSONSERIALIZER_HH_

#include "engine/MatchState.hh"

#include <nlohmann/json.hpp>

#include <string>

namespace Wizard {
namespace Engine {

/// \cond internal
extern const std::string PLAYER_ID_KEY;
extern const std::string PLAYER_NAME_KEY;
extern const std::string PLAYER_IS_HUMAN_KEY;
extern const std::string PLAYER_CONNECTED_KEY;
extern const std::string PLAYER_HAND_KEY;
extern const std::string PLAYER_TRICKS_KEY;
extern const std::string PLAYER_BID_KEY;
extern const std::string PLAYER_SCORE_KEY;
extern const std::string MATCH_STATE_PLAYERS_KEY;
extern const std::string MATCH_STATE_PLAYER_ORDER_KEY;
extern const std::string MATCH_STATE_SPECTATORS_KEY;
extern const std::string MATCH_STATE_CURRENT_ROUND_KEY;
extern const std::string MATCH_STATE_MAX_ROUNDS_KEY;
extern const std::string MATCH_STATE_TRUMP_CARD_KEY;
extern const std::string MATCH_STATE_CURRENT_TRICK_KEY;
extern const std::string MATCH_STATE_LEADING_PLAYER_ID_KEY;
extern const std::string MATCH_STATE_ACTIVE_PLAYER_ID_KEY;
extern const std::string MATCH_STATE_PHASE_KEY;
extern const std::string MATCH_STATE_LEAD_SUIT_KEY;
/// \endcond

/** \brief Convert Phase to JSON
 */
void to_json(nlohmann::json&, Phase);

/** \brief Convert JSON to Phase
 */
void from_json(const nlohmann::json&, Phase&);

/** \brief Convert Player to JSON
 */
void to_json(nlohmann::json&, const Player&);

/** \brief Convert Spectator to JSON
 */
void to_json(nlohmann::json&, const Spectator&);

/** \brief Convert MatchState to JSON
 *
 * \sa \ref jsonmatchstate
 */
void to_json(nlohmann::json&, const MatchState&);

}
}

#endif // MESSAGING_MATCHSTATEJSONSERIALIZER_HH_
