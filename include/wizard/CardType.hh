/** \file
 *
 * \brief Definition of Wizard::Card and related concepts
 */

#ifndef CARDTYPE_HH_
#define CARDTYPE_HH_

#include "wizard/PlayerId.hh"

#include <boost/operators.hpp>

#include <array>
#include <iosfwd>
#include <optional>
#include <string_view>
#include <variant>

namespace Wizard {

/** \brief Suit of a card
 *
 * Wizards and jesters belong to the special suit. The special suit never
 * becomes the lead suit or the trump suit.
 */
enum class Suit {
    HEARTS,
    DIAMONDS,
    CLUBS,
    SPADES,
    SPECIAL,
};

/** \brief The ordinary suits in the order they appear in a new deck
 */
constexpr auto ORDINARY_SUITS = std::array {
    Suit::HEARTS, Suit::DIAMONDS, Suit::CLUBS, Suit::SPADES,
};

/** \brief Special card values
 */
enum class Special {
    WIZARD,  ///< Always wins, the last wizard of a trick wins it
    JESTER,  ///< Always loses, unless every card of the trick is a jester
};

/** \brief Value of a card
 *
 * Either the rank (1–13) of an ordinary card or the kind of a special card.
 */
using CardValue = std::variant<int, Special>;

/** \brief Lowest rank of an ordinary card
 */
constexpr auto MIN_RANK = 1;

/** \brief Highest rank of an ordinary card
 */
constexpr auto MAX_RANK = 13;

/** \brief A playing card
 *
 * A card is a plain value. The \ref playedBy member is set when the card is
 * played to a trick, so that the winner of the trick can be traced back to a
 * player.
 */
struct Card : private boost::equality_comparable<Card> {

    /** \brief Create a jester
     *
     * This constructor exists so that cards can be held in containers and
     * deserialized.
     */
    Card();

    /** \brief Create an ordinary card
     *
     * \param suit the suit, which must not be Suit::SPECIAL
     * \param rank the rank, 1–13
     *
     * \throw std::invalid_argument if \p suit or \p rank is invalid
     */
    Card(Suit suit, int rank);

    /** \brief Create a special card
     *
     * \param special the kind of the card
     */
    Card(Special special);

    bool isWizard() const;
    bool isJester() const;

    /** \brief Determine if the card is a wizard or a jester
     */
    bool isSpecial() const;

    /** \brief Get the rank of an ordinary card
     *
     * \return the rank, or none for a special card
     */
    std::optional<int> getRank() const;

    Suit suit;               ///< \brief The suit of the card
    CardValue value;         ///< \brief The rank or the special kind
    std::optional<PlayerId> playedBy;  ///< \brief The player who played it
};

/** \brief Equality operator for cards
 *
 * Two cards are equal if their suit, value and \ref Card::playedBy tag
 * match.
 */
bool operator==(const Card& lhs, const Card& rhs);

/** \brief Determine if two cards have the same suit and value
 *
 * Unlike \c operator==, ignores the \ref Card::playedBy tag.
 */
bool isSameCard(const Card& lhs, const Card& rhs);

/** \brief Get the name of a suit, e.g. “hearts”
 */
std::string_view suitToString(Suit suit);

/** \brief Parse a suit from its name
 *
 * \return the suit, or none if \p name is not a suit
 */
std::optional<Suit> suitFromString(std::string_view name);

/** \brief Get the name of a special value, “wizard” or “jester”
 */
std::string_view specialToString(Special special);

/** \brief Parse a special value from its name
 */
std::optional<Special> specialFromString(std::string_view name);

/** \brief Output a suit to a stream
 */
std::ostream& operator<<(std::ostream& os, Suit suit);

/** \brief Output a special value to a stream
 */
std::ostream& operator<<(std::ostream& os, Special special);

/** \brief Output a card to a stream, e.g. “7 of hearts”
 */
std::ostream& operator<<(std::ostream& os, const Card& card);

}

#endif // CARDTYPE_HH_
