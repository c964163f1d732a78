/** \file
 *
 * \brief Definition of Wizard::Engine::BotPolicy class
 */

#ifndef ENGINE_BOTPOLICY_HH_
#define ENGINE_BOTPOLICY_HH_

#include "engine/MatchState.hh"
#include "wizard/CardType.hh"
#include "wizard/PlayerId.hh"
#include "wizard/Random.hh"

#include <functional>
#include <optional>

namespace Wizard {
namespace Engine {

/** \brief Decision procedure for players controlled by the server
 *
 * BotPolicy chooses bids and cards for bots, and for human players whose
 * connection was lost after the match started. It only reads the state of
 * the match. The legality of a decision is checked through an oracle given
 * by the caller (usually WizardEngine::canBid() or
 * WizardEngine::canPlayCard()).
 */
class BotPolicy {
public:

    /** \brief Oracle determining if a bid or a card index is legal
     */
    using LegalityCheck = std::function<bool(int)>;

    /** \brief Create new bot policy
     *
     * \param rng the random number generator used when deciding whether to
     * try to win a trick. It must outlive the policy.
     */
    explicit BotPolicy(Rng& rng);

    /** \brief Choose a bid
     *
     * The preferred bid is the number of the round divided evenly among the
     * players. If it is not allowed, one higher and one lower are tried.
     *
     * \param state the state of the match
     * \param playerId the bidding player
     * \param canBid legality oracle for bids
     *
     * \return the chosen bid, or none if none of the candidates is legal
     */
    std::optional<int> chooseBid(
        const MatchState& state, const PlayerId& playerId,
        const LegalityCheck& canBid) const;

    /** \brief Choose a card to play
     *
     * \param state the state of the match
     * \param playerId the playing player
     * \param canPlayCard legality oracle for indices to the hand of \p
     * playerId
     *
     * \return index of the chosen card in the hand, or none if the player
     * has no legal card
     */
    std::optional<int> chooseCard(
        const MatchState& state, const PlayerId& playerId,
        const LegalityCheck& canPlayCard);

    /** \brief Determine the strength of a card in the current trick
     *
     * Jester is weakest and wizard strongest. A card of the trump suit is
     * stronger than a card of the lead suit, which is stronger than any
     * other card of the same rank.
     */
    static int getCardStrength(const Card& card, const MatchState& state);

    /** \brief Determine if a card would currently win the trick
     */
    static bool canWinTrick(const Card& card, const MatchState& state);

private:

    bool shouldTryToWin(const MatchState& state, const Player& player);

    Rng& rng;
};

}
}

#endif // ENGINE_BOTPOLICY_HH_
