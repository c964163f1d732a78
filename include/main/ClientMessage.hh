/** \file
 *
 * \brief Definition of the messages clients send to the server
 *
 * \sa \ref wizardprotocolclient
 */

#ifndef MAIN_CLIENTMESSAGE_HH_
#define MAIN_CLIENTMESSAGE_HH_

#include <string>
#include <string_view>
#include <variant>

namespace Wizard {
namespace Main {

/** \brief Request to join the match as a player
 */
struct JoinRequest {
    std::string name;
};

/** \brief Request to watch the match
 */
struct SpectateRequest {
    std::string name;
};

/** \brief Request to start the match
 */
struct StartGameRequest {};

/** \brief Request to place a bid
 */
struct PlaceBidRequest {
    int bid;
};

/** \brief Request to play a card
 */
struct PlayCardRequest {
    int cardIndex;  ///< \brief Index of the card in the hand of the sender
};

/** \brief Request to add a bot to the match
 */
struct AddBotRequest {};

/** \brief A message from a client
 */
using ClientMessage = std::variant<
    JoinRequest, SpectateRequest, StartGameRequest, PlaceBidRequest,
    PlayCardRequest, AddBotRequest>;

/** \brief Parse a message received from a client
 *
 * \param payload the JSON payload of the message
 *
 * \return the parsed message
 *
 * \throw Messaging::SerializationFailureException if \p payload is not valid
 * JSON, its type is unknown, or a member required by the type is missing or
 * has a wrong type
 */
ClientMessage parseClientMessage(std::string_view payload);

}
}

#endif // MAIN_CLIENTMESSAGE_HH_
