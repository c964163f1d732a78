/** \file
 *
 * \brief Definition of JSON serializer for Wizard::Card
 *
 * \page jsoncard Card JSON representation
 *
 * A Wizard::Card is represented by a JSON object consisting of the
 * following:
 *
 * \code{.json}
 * {
 *     "suit": <suit>,
 *     "value": <value>,
 *     "playedBy": <playerId>
 * }
 * \endcode
 *
 * - &lt;suit&gt; is a string representing the suit of the card. It must be
 *   one of the following: "hearts", "diamonds", "clubs", "spades",
 *   "special".
 * - &lt;value&gt; is an integer between 1 and 13 for an ordinary card, or
 *   the string "wizard" or "jester" for a special card.
 * - &lt;playerId&gt; is the player who played the card. Only present for
 *   cards in a trick.
 */

#ifndef MESSAGING_CARDJSONSERIALIZER_HH_
#define MESSAGING_CARDJSONSERIALIZER_HH_

#include "wizard/CardType.hh"

#include <nlohmann/json.hpp>

#include <string>

namespace Wizard {

/** \brief Key for Card::suit
 *
 * \sa \ref jsoncard
 */
extern const std::string CARD_SUIT_KEY;

/** \brief Key for Card::value
 *
 * \sa \ref jsoncard
 */
extern const std::string CARD_VALUE_KEY;

/** \brief Key for Card::playedBy
 *
 * \sa \ref jsoncard
 */
extern const std::string CARD_PLAYED_BY_KEY;

/** \brief Convert Suit to JSON
 */
void to_json(nlohmann::json&, Suit);

/** \brief Convert JSON to Suit
 */
void from_json(const nlohmann::json&, Suit&);

/** \brief Convert Card to JSON
 */
void to_json(nlohmann::json&, const Card&);

/** \brief Convert JSON to Card
 */
void from_json(const nlohmann::json&, Card&);

}

#endif // MESSAGING_CARDJSONSERIALIZER_HH_
