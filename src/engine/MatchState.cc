#include "engine/MatchState.hh"

#include "wizard/WizardConstants.hh"
#include "Utility.hh"

#include <algorithm>
#include <array>
#include <ostream>
#include <stdexcept>
#include <utility>

namespace Wizard {
namespace Engine {

using namespace std::string_view_literals;

namespace {

constexpr auto PHASE_NAMES = std::array {
    std::pair {Phase::WAITING,  "waiting"sv},
    std::pair {Phase::BIDDING,  "bidding"sv},
    std::pair {Phase::PLAYING,  "playing"sv},
    std::pair {Phase::SCORING,  "scoring"sv},
    std::pair {Phase::FINISHED, "finished"sv},
};

}

std::string_view phaseToString(const Phase phase)
{
    const auto iter = std::ranges::find(
        PHASE_NAMES, phase, &decltype(PHASE_NAMES)::value_type::first);
    if (iter == PHASE_NAMES.end()) {
        throw std::invalid_argument {"Invalid phase"};
    }
    return iter->second;
}

std::optional<Phase> phaseFromString(const std::string_view name)
{
    const auto iter = std::ranges::find(
        PHASE_NAMES, name, &decltype(PHASE_NAMES)::value_type::second);
    if (iter == PHASE_NAMES.end()) {
        return std::nullopt;
    }
    return iter->first;
}

std::ostream& operator<<(std::ostream& os, const Phase phase)
{
    return os << phaseToString(phase);
}

const Player* MatchState::getPlayer(const PlayerId& id) const
{
    const auto iter = std::ranges::find(players, id, &Player::id);
    return iter != players.end() ? &*iter : nullptr;
}

Player* MatchState::getPlayer(const PlayerId& id)
{
    return const_cast<Player*>(std::as_const(*this).getPlayer(id));
}

std::optional<int> MatchState::getPlayerIndex(const PlayerId& id) const
{
    const auto n = findIndexIf(
        players, [&id](const auto& player) { return player.id == id; });
    if (n) {
        return static_cast<int>(*n);
    }
    return std::nullopt;
}

const Spectator* MatchState::getSpectator(const PlayerId& id) const
{
    const auto iter = std::ranges::find(spectators, id, &Spectator::id);
    return iter != spectators.end() ? &*iter : nullptr;
}

const Player* MatchState::getActivePlayer() const
{
    return activePlayerId ? getPlayer(*activePlayerId) : nullptr;
}

int MatchState::getNumberOfPlayers() const
{
    return static_cast<int>(players.size());
}

int MatchState::getMaxRounds() const
{
    return Wizard::getMaxRounds(getNumberOfPlayers());
}

MatchState makeProjection(const MatchState& state, const PlayerId& viewerId)
{
    auto ret = state;
    for (auto& player : ret.players) {
        if (player.id != viewerId) {
            player.hand.clear();
        }
    }
    return ret;
}

}
}
