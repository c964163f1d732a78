#include "wizard/CardType.hh"

#include <algorithm>
#include <ostream>
#include <stdexcept>
#include <utility>

namespace Wizard {

using namespace std::string_view_literals;

namespace {

constexpr auto SUIT_NAMES = std::array {
    std::pair {Suit::HEARTS,   "hearts"sv},
    std::pair {Suit::DIAMONDS, "diamonds"sv},
    std::pair {Suit::CLUBS,    "clubs"sv},
    std::pair {Suit::SPADES,   "spades"sv},
    std::pair {Suit::SPECIAL,  "special"sv},
};

constexpr auto SPECIAL_NAMES = std::array {
    std::pair {Special::WIZARD, "wizard"sv},
    std::pair {Special::JESTER, "jester"sv},
};

template<typename Names, typename Enum>
std::string_view nameOf(const Names& names, const Enum e)
{
    const auto iter = std::ranges::find(names, e, &Names::value_type::first);
    if (iter == names.end()) {
        throw std::invalid_argument {"Invalid enumeration value"};
    }
    return iter->second;
}

template<typename Names>
auto valueOf(const Names& names, const std::string_view name)
    -> std::optional<typename Names::value_type::first_type>
{
    const auto iter = std::ranges::find(names, name, &Names::value_type::second);
    if (iter == names.end()) {
        return std::nullopt;
    }
    return iter->first;
}

Suit checkOrdinarySuit(const Suit suit)
{
    if (suit == Suit::SPECIAL) {
        throw std::invalid_argument {"Ordinary card cannot be special"};
    }
    return suit;
}

int checkRank(const int rank)
{
    if (rank < MIN_RANK || rank > MAX_RANK) {
        throw std::invalid_argument {"Rank out of range"};
    }
    return rank;
}

}

Card::Card() :
    Card {Special::JESTER}
{
}

Card::Card(const Suit suit, const int rank) :
    suit {checkOrdinarySuit(suit)},
    value {checkRank(rank)}
{
}

Card::Card(const Special special) :
    suit {Suit::SPECIAL},
    value {special}
{
}

bool Card::isWizard() const
{
    const auto* special = std::get_if<Special>(&value);
    return special && *special == Special::WIZARD;
}

bool Card::isJester() const
{
    const auto* special = std::get_if<Special>(&value);
    return special && *special == Special::JESTER;
}

bool Card::isSpecial() const
{
    return suit == Suit::SPECIAL;
}

std::optional<int> Card::getRank() const
{
    if (const auto* rank = std::get_if<int>(&value)) {
        return *rank;
    }
    return std::nullopt;
}

bool operator==(const Card& lhs, const Card& rhs)
{
    return isSameCard(lhs, rhs) && lhs.playedBy == rhs.playedBy;
}

bool isSameCard(const Card& lhs, const Card& rhs)
{
    return lhs.suit == rhs.suit && lhs.value == rhs.value;
}

std::string_view suitToString(const Suit suit)
{
    return nameOf(SUIT_NAMES, suit);
}

std::optional<Suit> suitFromString(const std::string_view name)
{
    return valueOf(SUIT_NAMES, name);
}

std::string_view specialToString(const Special special)
{
    return nameOf(SPECIAL_NAMES, special);
}

std::optional<Special> specialFromString(const std::string_view name)
{
    return valueOf(SPECIAL_NAMES, name);
}

std::ostream& operator<<(std::ostream& os, const Suit suit)
{
    return os << suitToString(suit);
}

std::ostream& operator<<(std::ostream& os, const Special special)
{
    return os << specialToString(special);
}

std::ostream& operator<<(std::ostream& os, const Card& card)
{
    if (const auto rank = card.getRank()) {
        return os << *rank << " of " << card.suit;
    }
    return os << std::get<Special>(card.value);
}

}
