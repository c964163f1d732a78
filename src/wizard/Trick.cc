#include "wizard/Trick.hh"

#include "Utility.hh"

#include <algorithm>
#include <functional>
#include <iterator>

namespace Wizard {

namespace {

bool beats(
    const Card& candidate, const Card& best, const std::optional<Suit> trumpSuit)
{
    if (candidate.isJester()) {
        return false;
    }
    if (best.isJester()) {
        return true;
    }
    if (trumpSuit && candidate.suit == *trumpSuit && best.suit != *trumpSuit) {
        return true;
    }
    return candidate.suit == best.suit &&
        candidate.getRank() > best.getRank();
}

}

std::optional<Suit> getLeadSuit(const Cards& trick)
{
    const auto iter = std::ranges::find_if_not(trick, &Card::isSpecial);
    if (iter == trick.end()) {
        return std::nullopt;
    }
    return iter->suit;
}

bool canPlayCard(
    const Cards& hand, const std::ptrdiff_t n, const std::optional<Suit> leadSuit)
{
    if (n < 0 || n >= std::ssize(hand)) {
        return false;
    }
    const auto& card = hand[n];
    if (!leadSuit || card.isSpecial() || card.suit == *leadSuit) {
        return true;
    }
    return std::ranges::none_of(
        hand,
        [suit = *leadSuit](const auto& c)
        {
            return !c.isSpecial() && c.suit == suit;
        });
}

std::optional<std::size_t> getWinningCardIndex(
    const Cards& trick, const std::optional<Suit> trumpSuit)
{
    const auto last_wizard = std::find_if(
        trick.rbegin(), trick.rend(), std::mem_fn(&Card::isWizard));
    if (last_wizard != trick.rend()) {
        return std::distance(trick.begin(), last_wizard.base()) - 1;
    }
    if (std::ranges::all_of(trick, &Card::isJester)) {
        return std::nullopt;
    }
    auto best = std::size_t {};
    for (const auto n : from_to(std::size_t {1}, trick.size())) {
        if (beats(trick[n], trick[best], trumpSuit)) {
            best = n;
        }
    }
    return best;
}

std::optional<PlayerId> getTrickWinner(
    const Cards& trick, const std::optional<Suit> trumpSuit,
    const PlayerId& leader)
{
    if (const auto n = getWinningCardIndex(trick, trumpSuit)) {
        return trick[*n].playedBy;
    }
    return leader;
}

}
