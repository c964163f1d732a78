#include "messaging/MatchStateJsonSerializer.hh"

#include "messaging/CardJsonSerializer.hh"
#include "messaging/JsonSerializerUtility.hh"
#include "messaging/SerializationFailureException.hh"

using nlohmann::json;

namespace Wizard {
namespace Engine {

const std::string PLAYER_ID_KEY {"id"};
const std::string PLAYER_NAME_KEY {"name"};
const std::string PLAYER_IS_HUMAN_KEY {"isHuman"};
const std::string PLAYER_CONNECTED_KEY {"connected"};
const std::string PLAYER_HAND_KEY {"hand"};
const std::string PLAYER_TRICKS_KEY {"tricks"};
const std::string PLAYER_BID_KEY {"bid"};
const std::string PLAYER_SCORE_KEY {"score"};
const std::string MATCH_STATE_PLAYERS_KEY {"players"};
const std::string MATCH_STATE_PLAYER_ORDER_KEY {"playerOrder"};
const std::string MATCH_STATE_SPECTATORS_KEY {"spectators"};
const std::string MATCH_STATE_CURRENT_ROUND_KEY {"currentRound"};
const std::string MATCH_STATE_MAX_ROUNDS_KEY {"maxRounds"};
const std::string MATCH_STATE_TRUMP_CARD_KEY {"trumpCard"};
const std::string MATCH_STATE_CURRENT_TRICK_KEY {"currentTrick"};
const std::string MATCH_STATE_LEADING_PLAYER_ID_KEY {"leadingPlayerId"};
const std::string MATCH_STATE_ACTIVE_PLAYER_ID_KEY {"activePlayerId"};
const std::string MATCH_STATE_PHASE_KEY {"phase"};
const std::string MATCH_STATE_LEAD_SUIT_KEY {"leadSuit"};

void to_json(json& j, const Phase phase)
{
    j = std::string {phaseToString(phase)};
}

void from_json(const json& j, Phase& phase)
{
    const auto parsed = phaseFromString(j.get<std::string>());
    if (!parsed) {
        throw Messaging::SerializationFailureException {"Invalid phase"};
    }
    phase = *parsed;
}

void to_json(json& j, const Player& player)
{
    j = json {
        {PLAYER_ID_KEY, player.id},
        {PLAYER_NAME_KEY, player.name},
        {PLAYER_IS_HUMAN_KEY, player.isHuman},
        {PLAYER_CONNECTED_KEY, player.connected},
        {PLAYER_HAND_KEY, player.hand},
        {PLAYER_TRICKS_KEY, player.tricks},
        {PLAYER_BID_KEY, player.bid},
        {PLAYER_SCORE_KEY, player.score},
    };
}

void to_json(json& j, const Spectator& spectator)
{
    j = json {
        {PLAYER_ID_KEY, spectator.id},
        {PLAYER_NAME_KEY, spectator.name},
        {PLAYER_CONNECTED_KEY, spectator.connected},
    };
}

void to_json(json& j, const MatchState& state)
{
    auto players = json::object();
    auto player_order = json::array();
    for (const auto& player : state.players) {
        players.emplace(player.id, player);
        player_order.push_back(player.id);
    }
    auto spectators = json::object();
    for (const auto& spectator : state.spectators) {
        spectators.emplace(spectator.id, spectator);
    }
    j = json {
        {MATCH_STATE_PLAYERS_KEY, std::move(players)},
        {MATCH_STATE_PLAYER_ORDER_KEY, std::move(player_order)},
        {MATCH_STATE_SPECTATORS_KEY, std::move(spectators)},
        {MATCH_STATE_CURRENT_ROUND_KEY, state.currentRound},
        {MATCH_STATE_MAX_ROUNDS_KEY, state.getMaxRounds()},
        {MATCH_STATE_TRUMP_CARD_KEY, state.trumpCard},
        {MATCH_STATE_CURRENT_TRICK_KEY, state.currentTrick},
        {MATCH_STATE_LEADING_PLAYER_ID_KEY, state.leadingPlayerId},
        {MATCH_STATE_ACTIVE_PLAYER_ID_KEY, state.activePlayerId},
        {MATCH_STATE_PHASE_KEY, state.phase},
        {MATCH_STATE_LEAD_SUIT_KEY, state.leadSuit},
    };
}

}
}
