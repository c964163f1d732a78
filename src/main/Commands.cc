#include "main/Commands.hh"

namespace Wizard {
namespace Main {

const std::string TYPE_KEY {"type"};

const std::string JOIN_COMMAND {"join"};
const std::string SPECTATE_COMMAND {"spectate"};
const std::string START_GAME_COMMAND {"start_game"};
const std::string PLACE_BID_COMMAND {"place_bid"};
const std::string PLAY_CARD_COMMAND {"play_card"};
const std::string ADD_BOT_COMMAND {"add_bot"};

const std::string GAME_STATE_MESSAGE {"game_state"};
const std::string ERROR_MESSAGE {"error"};
const std::string JOIN_SUCCESS_MESSAGE {"join_success"};
const std::string PLAYER_JOINED_MESSAGE {"player_joined"};
const std::string PLAYER_LEFT_MESSAGE {"player_left"};
const std::string GAME_STARTED_MESSAGE {"game_started"};
const std::string BID_PLACED_MESSAGE {"bid_placed"};
const std::string CARD_PLAYED_MESSAGE {"card_played"};
const std::string TRICK_WON_MESSAGE {"trick_won"};
const std::string ROUND_ENDED_MESSAGE {"round_ended"};

const std::string NAME_KEY {"name"};
const std::string BID_KEY {"bid"};
const std::string CARD_INDEX_KEY {"cardIndex"};
const std::string STATE_KEY {"state"};
const std::string MESSAGE_KEY {"message"};
const std::string PLAYER_ID_KEY {"playerId"};
const std::string ID_KEY {"id"};
const std::string IS_SPECTATOR_KEY {"isSpectator"};
const std::string CARD_KEY {"card"};
const std::string SCORES_KEY {"scores"};

}
}
