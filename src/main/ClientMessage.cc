#include "main/ClientMessage.hh"

#include "main/Commands.hh"
#include "messaging/JsonSerializer.hh"
#include "messaging/JsonSerializerUtility.hh"
#include "messaging/SerializationFailureException.hh"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>

using nlohmann::json;

namespace Wizard {
namespace Main {

namespace {

using Messaging::SerializationFailureException;
using Messaging::checkedGet;

// JSON number conversion would silently truncate 1.5 to 1, and wrap values
// outside the range of int
bool isIntegerInRange(const json& value)
{
    using Limits = std::numeric_limits<int>;
    if (value.is_number_unsigned()) {
        return value.get<std::uint64_t>() <=
            static_cast<std::uint64_t>(Limits::max());
    }
    if (value.is_number_integer()) {
        const auto n = value.get<std::int64_t>();
        return Limits::min() <= n && n <= Limits::max();
    }
    return false;
}

int getInteger(const json& j, const std::string& key)
{
    const auto value = Messaging::validate(
        checkedGet<json>(j, key), isIntegerInRange);
    return static_cast<int>(value.get<std::int64_t>());
}

}

ClientMessage parseClientMessage(const std::string_view payload)
{
    const auto j = Messaging::JsonSerializer::deserialize<json>(payload);
    const auto type = checkedGet<std::string>(j, TYPE_KEY);
    if (type == JOIN_COMMAND) {
        return JoinRequest {checkedGet<std::string>(j, NAME_KEY)};
    } else if (type == SPECTATE_COMMAND) {
        return SpectateRequest {checkedGet<std::string>(j, NAME_KEY)};
    } else if (type == START_GAME_COMMAND) {
        return StartGameRequest {};
    } else if (type == PLACE_BID_COMMAND) {
        return PlaceBidRequest {getInteger(j, BID_KEY)};
    } else if (type == PLAY_CARD_COMMAND) {
        return PlayCardRequest {getInteger(j, CARD_INDEX_KEY)};
    } else if (type == ADD_BOT_COMMAND) {
        return AddBotRequest {};
    }
    throw SerializationFailureException {"Unknown message type"};
}

}
}
