/** \file
 *
 * \brief Definition of the state of a match
 */

#ifndef ENGINE_MATCHSTATE_HH_
#define ENGINE_MATCHSTATE_HH_

#include "wizard/Deck.hh"
#include "wizard/PlayerId.hh"

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Wizard {
namespace Engine {

/** \brief Phase of a match
 */
enum class Phase {
    WAITING,   ///< Players are joining
    BIDDING,   ///< Players bid in turn
    PLAYING,   ///< Players play cards in turn
    SCORING,   ///< The current trick is full and waits to be evaluated
    FINISHED,  ///< Every round has been played
};

/** \brief Get the name of a phase, e.g. “bidding”
 */
std::string_view phaseToString(Phase phase);

/** \brief Parse a phase from its name
 */
std::optional<Phase> phaseFromString(std::string_view name);

/** \brief Output a phase to a stream
 */
std::ostream& operator<<(std::ostream& os, Phase phase);

/** \brief A player taking part in a match
 */
struct Player {
    PlayerId id;
    std::string name;
    bool isHuman {true};
    bool connected {true};
    Cards hand;
    int tricks {};           ///< \brief Tricks taken in the current round
    std::optional<int> bid;  ///< \brief Bid for the current round, if made
    int score {};
};

/** \brief A read-only viewer of a match
 */
struct Spectator {
    PlayerId id;
    std::string name;
    bool connected {true};
};

/** \brief State of a match
 *
 * The order of \ref players is the turn order (the order the players
 * joined).
 */
struct MatchState {

    /** \brief Find player
     *
     * \return pointer to the player, or nullptr if there is no such player
     */
    const Player* getPlayer(const PlayerId& id) const;

    /** \copydoc getPlayer(const PlayerId&) const
     */
    Player* getPlayer(const PlayerId& id);

    /** \brief Find the index of a player in the turn order
     */
    std::optional<int> getPlayerIndex(const PlayerId& id) const;

    /** \brief Find spectator
     */
    const Spectator* getSpectator(const PlayerId& id) const;

    /** \brief Get the player whose turn it is
     *
     * \return pointer to the active player, or nullptr if there is none
     */
    const Player* getActivePlayer() const;

    /** \brief Number of players
     */
    int getNumberOfPlayers() const;

    /** \brief Number of rounds in the match
     */
    int getMaxRounds() const;

    std::vector<Player> players;
    std::vector<Spectator> spectators;
    int currentRound {};
    std::optional<Card> trumpCard;
    Cards currentTrick;
    std::optional<PlayerId> leadingPlayerId;
    std::optional<PlayerId> activePlayerId;
    Phase phase {Phase::WAITING};
    std::optional<Suit> leadSuit;
};

/** \brief Create the view of a match a viewer is entitled to
 *
 * The projection is a copy of \p state where every hand except the one of
 * \p viewerId is emptied.
 *
 * \param state the full state of the match
 * \param viewerId the player or spectator the projection is for
 *
 * \return the redacted copy of \p state
 */
MatchState makeProjection(const MatchState& state, const PlayerId& viewerId);

}
}

#endif // ENGINE_MATCHSTATE_HH_
