#include "engine/BotPolicy.hh"

#include "wizard/Deck.hh"
#include "wizard/WizardConstants.hh"
#include "Utility.hh"

#include <algorithm>
#include <array>
#include <numeric>
#include <random>
#include <vector>

namespace Wizard {
namespace Engine {

namespace {

constexpr auto TRUMP_BONUS = 2 * N_RANKS;
constexpr auto LEAD_BONUS = N_RANKS;
// Above any numbered card, even a trump that is also of the lead suit
constexpr auto WIZARD_STRENGTH = N_RANKS + TRUMP_BONUS + LEAD_BONUS + 1;

struct RankedCard {
    int index;
    int strength;
    bool canWin;
};

}

BotPolicy::BotPolicy(Rng& rng) :
    rng {rng}
{
}

std::optional<int> BotPolicy::chooseBid(
    const MatchState& state, const PlayerId& playerId,
    const LegalityCheck& canBid) const
{
    if (!state.getPlayer(playerId) || state.getNumberOfPlayers() == 0) {
        return std::nullopt;
    }
    const auto base = state.currentRound / state.getNumberOfPlayers();
    for (const auto bid : std::array {base, base + 1, base - 1}) {
        if (canBid(bid)) {
            return bid;
        }
    }
    return std::nullopt;
}

std::optional<int> BotPolicy::chooseCard(
    const MatchState& state, const PlayerId& playerId,
    const LegalityCheck& canPlayCard)
{
    const auto* player = state.getPlayer(playerId);
    if (!player) {
        return std::nullopt;
    }

    auto ranked = std::vector<RankedCard> {};
    for (const auto n : to(std::ssize(player->hand))) {
        const auto index = static_cast<int>(n);
        if (canPlayCard(index)) {
            const auto& card = player->hand[n];
            ranked.push_back(
                RankedCard {
                    index, getCardStrength(card, state),
                    canWinTrick(card, state)});
        }
    }
    if (ranked.empty()) {
        return std::nullopt;
    }

    const auto by_strength = [](const auto& lhs, const auto& rhs)
    {
        return lhs.strength < rhs.strength;
    };
    const auto weakest = [&by_strength](const auto& cards)
    {
        return std::ranges::min_element(cards, by_strength)->index;
    };
    const auto strongest = [&by_strength](const auto& cards)
    {
        return std::ranges::max_element(cards, by_strength)->index;
    };

    const auto leading = state.currentTrick.empty();
    if (shouldTryToWin(state, *player)) {
        if (leading) {
            return strongest(ranked);
        }
        auto winning = ranked;
        std::erase_if(winning, [](const auto& c) { return !c.canWin; });
        return winning.empty() ? weakest(ranked) : strongest(winning);
    }
    if (leading) {
        return weakest(ranked);
    }
    auto losing = ranked;
    std::erase_if(losing, [](const auto& c) { return c.canWin; });
    return losing.empty() ? weakest(ranked) : strongest(losing);
}

int BotPolicy::getCardStrength(const Card& card, const MatchState& state)
{
    if (card.isWizard()) {
        return WIZARD_STRENGTH;
    }
    if (card.isJester()) {
        return 0;
    }
    auto strength = card.getRank().value_or(0);
    if (card.suit == getTrumpSuit(state.trumpCard)) {
        strength += TRUMP_BONUS;
    }
    if (card.suit == state.leadSuit) {
        strength += LEAD_BONUS;
    }
    return strength;
}

bool BotPolicy::canWinTrick(const Card& card, const MatchState& state)
{
    if (card.isWizard()) {
        return true;
    }
    if (card.isJester()) {
        return false;
    }
    const auto& trick = state.currentTrick;
    if (std::ranges::any_of(trick, &Card::isWizard)) {
        return false;
    }
    const auto strength = getCardStrength(card, state);
    return std::ranges::all_of(
        trick,
        [&state, strength](const auto& c)
        {
            return strength > getCardStrength(c, state);
        });
}

bool BotPolicy::shouldTryToWin(const MatchState& state, const Player& player)
{
    if (!player.bid) {
        return false;
    }
    const auto needed = *player.bid - player.tricks;
    if (needed <= 0) {
        return false;
    }
    const auto taken = std::accumulate(
        state.players.begin(), state.players.end(), 0,
        [](const auto sum, const auto& p) { return sum + p.tricks; });
    const auto remaining = state.currentRound - taken;
    if (needed >= remaining) {
        return true;
    }
    auto dist = std::uniform_real_distribution<double> {};
    return dist(rng) < static_cast<double>(needed) / remaining;
}

}
}
