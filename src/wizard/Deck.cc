#include "wizard/Deck.hh"

#include "wizard/WizardConstants.hh"
#include "Utility.hh"

#include <algorithm>

namespace Wizard {

Cards buildDeck()
{
    auto cards = Cards {};
    cards.reserve(N_CARDS);
    for (const auto suit : ORDINARY_SUITS) {
        for (const auto rank : from_to(MIN_RANK, MAX_RANK + 1)) {
            cards.emplace_back(suit, rank);
        }
    }
    for ([[maybe_unused]] const auto n : to(N_WIZARDS)) {
        cards.emplace_back(Special::WIZARD);
        cards.emplace_back(Special::JESTER);
    }
    return cards;
}

void shuffleCards(Cards& cards, Rng& rng)
{
    std::shuffle(cards.begin(), cards.end(), rng);
}

Dealer::Dealer(Rng& rng) :
    rng {rng}
{
}

DealtCards Dealer::deal(const int nPlayers, const int nCards)
{
    auto deck = buildDeck();
    shuffleCards(deck, rng);
    auto ret = DealtCards {std::vector<Cards>(std::max(nPlayers, 0)), {}, {}};
    for ([[maybe_unused]] const auto pass : to(std::max(nCards, 0))) {
        for (auto& hand : ret.hands) {
            if (deck.empty()) {
                break;
            }
            hand.push_back(std::move(deck.back()));
            deck.pop_back();
        }
    }
    if (!deck.empty()) {
        ret.trumpCard = std::move(deck.back());
        deck.pop_back();
    }
    ret.remaining = std::move(deck);
    return ret;
}

std::optional<Suit> getTrumpSuit(const std::optional<Card>& trumpCard)
{
    if (trumpCard && !trumpCard->isSpecial()) {
        return trumpCard->suit;
    }
    return std::nullopt;
}

}
