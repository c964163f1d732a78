#include "main/ServerMessages.hh"

#include "main/Commands.hh"
#include "messaging/CardJsonSerializer.hh"
#include "messaging/JsonSerializer.hh"
#include "messaging/MatchStateJsonSerializer.hh"

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace Wizard {
namespace Main {

namespace {

std::string serialize(const json& j)
{
    return Messaging::JsonSerializer::serialize(j);
}

}

std::string makeGameStateMessage(const Engine::MatchState& projection)
{
    return serialize({
        {TYPE_KEY, GAME_STATE_MESSAGE},
        {STATE_KEY, projection},
    });
}

std::string makeErrorMessage(const std::string_view message)
{
    return serialize({
        {TYPE_KEY, ERROR_MESSAGE},
        {MESSAGE_KEY, std::string {message}},
    });
}

std::string makeJoinSuccessMessage(const PlayerId& playerId)
{
    return serialize({
        {TYPE_KEY, JOIN_SUCCESS_MESSAGE},
        {PLAYER_ID_KEY, playerId},
    });
}

std::string makePlayerJoinedMessage(
    const PlayerId& id, const std::string_view name, const bool isSpectator)
{
    return serialize({
        {TYPE_KEY, PLAYER_JOINED_MESSAGE},
        {ID_KEY, id},
        {NAME_KEY, std::string {name}},
        {IS_SPECTATOR_KEY, isSpectator},
    });
}

std::string makePlayerLeftMessage(
    const PlayerId& id, const std::string_view name)
{
    return serialize({
        {TYPE_KEY, PLAYER_LEFT_MESSAGE},
        {ID_KEY, id},
        {NAME_KEY, std::string {name}},
    });
}

std::string makeGameStartedMessage()
{
    return serialize({{TYPE_KEY, GAME_STARTED_MESSAGE}});
}

std::string makeBidPlacedMessage(const PlayerId& playerId, const int bid)
{
    return serialize({
        {TYPE_KEY, BID_PLACED_MESSAGE},
        {PLAYER_ID_KEY, playerId},
        {BID_KEY, bid},
    });
}

std::string makeCardPlayedMessage(const PlayerId& playerId, const Card& card)
{
    return serialize({
        {TYPE_KEY, CARD_PLAYED_MESSAGE},
        {PLAYER_ID_KEY, playerId},
        {CARD_KEY, card},
    });
}

std::string makeTrickWonMessage(const PlayerId& playerId)
{
    return serialize({
        {TYPE_KEY, TRICK_WON_MESSAGE},
        {PLAYER_ID_KEY, playerId},
    });
}

std::string makeRoundEndedMessage(
    const Engine::WizardEngine::RoundEnded::ScoreVector& scores)
{
    auto j_scores = json::object();
    for (const auto& [id, score] : scores) {
        j_scores[id] = score;
    }
    return serialize({
        {TYPE_KEY, ROUND_ENDED_MESSAGE},
        {SCORES_KEY, std::move(j_scores)},
    });
}

}
}
