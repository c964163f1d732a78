#include "messaging/CardJsonSerializer.hh"

#include "messaging/JsonSerializerUtility.hh"
#include "messaging/SerializationFailureException.hh"

#include <stdexcept>
#include <string>
#include <variant>

using nlohmann::json;

namespace Wizard {

const std::string CARD_SUIT_KEY {"suit"};
const std::string CARD_VALUE_KEY {"value"};
const std::string CARD_PLAYED_BY_KEY {"playedBy"};

void to_json(json& j, const Suit suit)
{
    j = std::string {suitToString(suit)};
}

void from_json(const json& j, Suit& suit)
{
    const auto name = j.get<std::string>();
    const auto parsed = suitFromString(name);
    if (!parsed) {
        throw Messaging::SerializationFailureException {"Invalid suit"};
    }
    suit = *parsed;
}

void to_json(json& j, const Card& card)
{
    j.emplace(CARD_SUIT_KEY, card.suit);
    if (const auto rank = card.getRank()) {
        j.emplace(CARD_VALUE_KEY, *rank);
    } else {
        j.emplace(
            CARD_VALUE_KEY,
            std::string {specialToString(std::get<Special>(card.value))});
    }
    if (card.playedBy) {
        j.emplace(CARD_PLAYED_BY_KEY, *card.playedBy);
    }
}

void from_json(const json& j, Card& card)
{
    const auto suit = Messaging::checkedGet<Suit>(j, CARD_SUIT_KEY);
    const auto& value = j.at(CARD_VALUE_KEY);
    if (suit == Suit::SPECIAL) {
        const auto special = specialFromString(value.get<std::string>());
        if (!special) {
            throw Messaging::SerializationFailureException {
                "Invalid special card"};
        }
        card = Card {*special};
    } else {
        try {
            card = Card {suit, value.get<int>()};
        } catch (const std::invalid_argument& e) {
            throw Messaging::SerializationFailureException {e.what()};
        }
    }
    if (const auto iter = j.find(CARD_PLAYED_BY_KEY); iter != j.end()) {
        card.playedBy = iter->get<PlayerId>();
    }
}

}
