/** \file
 *
 * \brief Definition of Wizard::Engine::WizardEngine class
 */

#ifndef ENGINE_WIZARDENGINE_HH_
#define ENGINE_WIZARDENGINE_HH_

#include "engine/MatchState.hh"
#include "wizard/CardType.hh"
#include "wizard/PlayerId.hh"
#include "wizard/Random.hh"
#include "wizard/WizardConstants.hh"
#include "Observer.hh"

#include <boost/core/noncopyable.hpp>
#include <boost/operators.hpp>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace Wizard {

/** \brief The Wizard engine
 *
 * Namespace Engine contains WizardEngine, the state it operates on and the
 * policy used to play on behalf of bots.
 */
namespace Engine {

/** \brief Exception thrown when the engine detects an internal inconsistency
 */
class EngineFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** \brief The state machine for a single match of Wizard
 *
 * WizardEngine enforces the rules of the game: joining, bidding in turn
 * with the restriction on the last bid, following suit, resolving tricks and
 * scoring rounds.
 *
 * Every mutating method returns a failure signal (false or none) instead of
 * changing anything if the action is not allowed in the current state.
 *
 * The engine publishes notifications of what happened through the
 * subscribeTo methods. Notifications are delivered after the state has been
 * updated, so that observers see the state following the event.
 */
class WizardEngine : private boost::noncopyable {
public:

    /** \brief Event for announcing that the match has started
     */
    struct GameStarted : private boost::equality_comparable<GameStarted> {
        /** \brief Create new game started event
         *
         * \param players see \ref players
         */
        explicit GameStarted(int players);

        int players;  ///< \brief Number of players in the match
    };

    /** \brief Event for announcing that a bid was placed
     */
    struct BidPlaced : private boost::equality_comparable<BidPlaced> {
        /** \brief Create new bid placed event
         *
         * \param playerId see \ref playerId
         * \param bid see \ref bid
         */
        BidPlaced(PlayerId playerId, int bid);

        PlayerId playerId;  ///< \brief The player who bid
        int bid;            ///< \brief The bid
    };

    /** \brief Event for announcing that a card was played
     */
    struct CardPlayed : private boost::equality_comparable<CardPlayed> {
        /** \brief Create new card played event
         *
         * \param playerId see \ref playerId
         * \param card see \ref card
         * \param trickComplete see \ref trickComplete
         */
        CardPlayed(PlayerId playerId, Card card, bool trickComplete);

        PlayerId playerId;   ///< \brief The player who played the card
        Card card;           ///< \brief The card played
        bool trickComplete;  ///< \brief Whether the card completed the trick
    };

    /** \brief Event for announcing that a trick was evaluated
     *
     * This is also the result of evaluateTrick().
     */
    struct TrickCompleted : private boost::equality_comparable<TrickCompleted> {
        /** \brief Create new trick completed event
         *
         * \param winner see \ref winner
         * \param roundComplete see \ref roundComplete
         */
        TrickCompleted(PlayerId winner, bool roundComplete);

        PlayerId winner;     ///< \brief The player who took the trick
        bool roundComplete;  ///< \brief Whether every hand is now empty
    };

    /** \brief Event for announcing that a round was scored
     */
    struct RoundEnded : private boost::equality_comparable<RoundEnded> {

        /** \brief Scores of the players in turn order
         */
        using ScoreVector = std::vector<std::pair<PlayerId, int>>;

        /** \brief Create new round ended event
         *
         * \param round see \ref round
         * \param scores see \ref scores
         * \param finished see \ref finished
         */
        RoundEnded(int round, ScoreVector scores, bool finished);

        int round;           ///< \brief The round that was scored
        ScoreVector scores;  ///< \brief Total scores after the round
        bool finished;       ///< \brief Whether the match is over
    };

    /** \brief Create new engine
     *
     * \param rng the random number generator used for dealing. It must
     * outlive the engine.
     * \param minPlayers the number of players needed to start the match
     */
    explicit WizardEngine(Rng& rng, int minPlayers = MIN_PLAYERS);

    ~WizardEngine();

    /** \brief Subscribe to notifications about the match starting
     */
    void subscribeToGameStarted(std::weak_ptr<Observer<GameStarted>> observer);

    /** \brief Subscribe to notifications about bids
     */
    void subscribeToBidPlaced(std::weak_ptr<Observer<BidPlaced>> observer);

    /** \brief Subscribe to notifications about played cards
     */
    void subscribeToCardPlayed(std::weak_ptr<Observer<CardPlayed>> observer);

    /** \brief Subscribe to notifications about evaluated tricks
     */
    void subscribeToTrickCompleted(
        std::weak_ptr<Observer<TrickCompleted>> observer);

    /** \brief Subscribe to notifications about scored rounds
     */
    void subscribeToRoundEnded(std::weak_ptr<Observer<RoundEnded>> observer);

    /** \brief Add a player
     *
     * The player is appended to the turn order with an empty hand and zero
     * score.
     *
     * \param id the identifier of the player
     * \param name the name of the player
     * \param isHuman false if the player is a bot
     *
     * \return true if the player was added, false if the match has started,
     * the match is full, or \p id or \p name is already taken
     */
    bool addPlayer(const PlayerId& id, std::string name, bool isHuman = true);

    /** \brief Add a spectator
     *
     * Spectators can be added at any time.
     *
     * \return true if the spectator was added, false if \p id is already
     * taken
     */
    bool addSpectator(const PlayerId& id, std::string name);

    /** \brief Remove a player or a spectator
     *
     * Spectators can be removed at any time. Players can only be removed
     * before the match starts. Once the match has started, players stay in
     * the turn order until the end (see setConnected()).
     *
     * \return true if someone was removed, false otherwise
     */
    bool removePlayer(const PlayerId& id);

    /** \brief Set the connection status of a player or a spectator
     *
     * \return true if \p id was found, false otherwise
     */
    bool setConnected(const PlayerId& id, bool connected);

    /** \brief Start the match
     *
     * Deals the first round. The first player to join leads and bids first.
     *
     * \return true if the match started, false if it had already started or
     * there are not enough players
     */
    bool startGame();

    /** \brief Place a bid
     *
     * \param playerId the player bidding
     * \param bid the number of tricks the player expects to take
     *
     * \return true if the bid was accepted, false otherwise
     *
     * \sa canBid()
     */
    bool placeBid(const PlayerId& playerId, int bid);

    /** \brief Play a card
     *
     * When the card completes the trick, the phase becomes Phase::SCORING
     * and the trick must be resolved with evaluateTrick().
     *
     * \param playerId the player playing
     * \param cardIndex the index of the card in the hand of the player
     *
     * \return true if the card was played, false otherwise
     *
     * \sa canPlayCard()
     */
    bool playCard(const PlayerId& playerId, int cardIndex);

    /** \brief Resolve a complete trick
     *
     * The winner takes the trick, and leads the next one. If every hand is
     * empty afterwards, endRound() must be called next.
     *
     * \return the winner and whether the round is complete, or none if there
     * is no complete trick
     */
    std::optional<TrickCompleted> evaluateTrick();

    /** \brief Score the round and start the next one
     *
     * If the last round was scored, the match finishes. Otherwise the next
     * round is dealt and the turn to lead and bid first rotates by one
     * seat.
     *
     * \return true if the round was scored, false if the round is not
     * complete
     */
    bool endRound();

    /** \brief Determine if a bid is allowed
     *
     * A bid is allowed if it is the turn of \p playerId to bid and \p bid is
     * between zero and the number of the round. For the last bidder, a bid
     * that would make the sum of the bids equal to the number of the round
     * is not allowed.
     */
    bool canBid(const PlayerId& playerId, int bid) const;

    /** \brief Determine if a card can be played
     *
     * A card can be played if it is the turn of \p playerId to play and the
     * card follows suit when required.
     */
    bool canPlayCard(const PlayerId& playerId, int cardIndex) const;

    /** \brief Get the current phase
     */
    Phase getPhase() const;

    /** \brief Determine if the match is over
     */
    bool hasEnded() const;

    /** \brief Get the full state of the match
     *
     * The returned reference is valid as long as the engine, and reflects
     * later changes.
     */
    const MatchState& getState() const;

    /** \brief Get the state visible to a viewer
     *
     * \param viewerId the player or spectator
     *
     * \return a copy of the state with every hand but the one of \p viewerId
     * hidden
     */
    MatchState getProjection(const PlayerId& viewerId) const;

    /** \brief Get the number of players needed to start the match
     */
    int getMinPlayers() const;

    /** \brief Get the number of rounds in the match
     *
     * The number depends on the number of players, and is zero if there are
     * no players.
     */
    int getMaxRounds() const;

    class Impl;

private:

    const std::shared_ptr<Impl> impl;
};

bool operator==(
    const WizardEngine::GameStarted&, const WizardEngine::GameStarted&);

bool operator==(
    const WizardEngine::BidPlaced&, const WizardEngine::BidPlaced&);

bool operator==(
    const WizardEngine::CardPlayed&, const WizardEngine::CardPlayed&);

bool operator==(
    const WizardEngine::TrickCompleted&, const WizardEngine::TrickCompleted&);

bool operator==(
    const WizardEngine::RoundEnded&, const WizardEngine::RoundEnded&);

}
}

#endif // ENGINE_WIZARDENGINE_HH_
