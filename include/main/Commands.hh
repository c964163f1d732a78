/** \file
 *
 * \brief Definition of \ref wizardprotocol message types and keys
 *
 * \page wizardprotocol Wizard protocol
 *
 * This document describes the protocol spoken between the Wizard server and
 * its clients.
 *
 * The key words “MUST”, “MUST NOT”, “REQUIRED”, “SHALL”, “SHALL NOT”, “SHOULD”,
 * “SHOULD NOT”, “RECOMMENDED”, “MAY”, and “OPTIONAL” in this document are to be
 * interpreted as described in RFC 2119 (http://tools.ietf.org/html/rfc2119).
 *
 * \section wizardprotocoltransport Transport
 *
 * The protocol uses ZMTP 3.0 over TCP (https://rfc.zeromq.org/spec:23/ZMTP).
 * The server opens a ROUTER socket, and each client connects to it with a
 * DEALER socket. A client connection is identified by the routing identity of
 * its socket, and the server assigns it a UUID on the first message.
 *
 * Every message consists of an empty delimiter frame and a payload frame. An
 * empty payload frame MUST be interpreted as closing the connection, whether
 * it is sent by the client or the server.
 *
 * \section wizardprotocolmessages Messages
 *
 * The payload is a UTF‐8 encoded JSON object. The \e type member identifies
 * the message. Unrecognized members SHOULD be ignored.
 *
 * \subsection wizardprotocolclient Client messages
 *
 * | Type         | Members                | Notes                        |
 * |--------------|------------------------|------------------------------|
 * | join         | name (string)          | Join the match as a player   |
 * | spectate     | name (string)          | Watch the match              |
 * | start_game   |                        | Start the match              |
 * | place_bid    | bid (integer)          | Bid during the bidding phase |
 * | play_card    | cardIndex (integer)    | Index to the hand            |
 * | add_bot      |                        | Add a bot before the start   |
 *
 * \subsection wizardprotocolserver Server messages
 *
 * | Type          | Members                          |
 * |---------------|----------------------------------|
 * | game_state    | state, see \ref jsonmatchstate   |
 * | error         | message (string)                 |
 * | join_success  | playerId                         |
 * | player_joined | id, name, isSpectator            |
 * | player_left   | id, name                         |
 * | game_started  |                                  |
 * | bid_placed    | playerId, bid                    |
 * | card_played   | playerId, card (\ref jsoncard)   |
 * | trick_won     | playerId                         |
 * | round_ended   | scores (object from id to score) |
 *
 * The server MUST send game_state to every viewer after each change of the
 * match state. The state MUST only contain the hand of the viewer it is sent
 * to.
 *
 * A message the server rejects is answered with an error message to the
 * sender only. Rejection never changes the state of the match.
 */

#ifndef MAIN_COMMANDS_HH_
#define MAIN_COMMANDS_HH_

#include <string>

namespace Wizard {
namespace Main {

/** \brief Key for the message type
 *
 * \sa \ref wizardprotocolmessages
 */
extern const std::string TYPE_KEY;

/// \cond internal
extern const std::string JOIN_COMMAND;
extern const std::string SPECTATE_COMMAND;
extern const std::string START_GAME_COMMAND;
extern const std::string PLACE_BID_COMMAND;
extern const std::string PLAY_CARD_COMMAND;
extern const std::string ADD_BOT_COMMAND;

extern const std::string GAME_STATE_MESSAGE;
extern const std::string ERROR_MESSAGE;
extern const std::string JOIN_SUCCESS_MESSAGE;
extern const std::string PLAYER_JOINED_MESSAGE;
extern const std::string PLAYER_LEFT_MESSAGE;
extern const std::string GAME_STARTED_MESSAGE;
extern const std::string BID_PLACED_MESSAGE;
extern const std::string CARD_PLAYED_MESSAGE;
extern const std::string TRICK_WON_MESSAGE;
extern const std::string ROUND_ENDED_MESSAGE;

extern const std::string NAME_KEY;
extern const std::string BID_KEY;
extern const std::string CARD_INDEX_KEY;
extern const std::string STATE_KEY;
extern const std::string MESSAGE_KEY;
extern const std::string PLAYER_ID_KEY;
extern const std::string ID_KEY;
extern const std::string IS_SPECTATOR_KEY;
extern const std::string CARD_KEY;
extern const std::string SCORES_KEY;
/// \endcond

}
}

#endif // MAIN_COMMANDS_HH_
