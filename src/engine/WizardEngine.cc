#include "engine/WizardEngine.hh"

#include "wizard/Deck.hh"
#include "wizard/Scoring.hh"
#include "wizard/Trick.hh"
#include "FunctionQueue.hh"
#include "Logging.hh"
#include "Utility.hh"

#include <boost/mpl/list.hpp>
#include <boost/statechart/custom_reaction.hpp>
#include <boost/statechart/event.hpp>
#include <boost/statechart/simple_state.hpp>
#include <boost/statechart/state_machine.hpp>

#include <algorithm>
#include <cassert>
#include <numeric>

namespace sc = boost::statechart;

namespace Wizard {
namespace Engine {

////////////////////////////////////////////////////////////////////////////////
// Events
////////////////////////////////////////////////////////////////////////////////

class AddPlayerEvent : public sc::event<AddPlayerEvent> {
public:
    AddPlayerEvent(
        const PlayerId& playerId, std::string name, bool isHuman, bool& ret) :
        playerId {playerId},
        name {std::move(name)},
        isHuman {isHuman},
        ret {ret}
    {
    }

    const PlayerId& playerId;
    std::string name;
    bool isHuman;
    bool& ret;
};
class RemovePlayerEvent : public sc::event<RemovePlayerEvent> {
public:
    RemovePlayerEvent(const PlayerId& playerId, bool& ret) :
        playerId {playerId},
        ret {ret}
    {
    }

    const PlayerId& playerId;
    bool& ret;
};
class StartGameEvent : public sc::event<StartGameEvent> {
public:
    StartGameEvent(bool& ret) :
        ret {ret}
    {
    }

    bool& ret;
};
class BidEvent : public sc::event<BidEvent> {
public:
    BidEvent(const PlayerId& playerId, int bid, bool& ret) :
        playerId {playerId},
        bid {bid},
        ret {ret}
    {
    }

    const PlayerId& playerId;
    int bid;
    bool& ret;
};
class PlayCardEvent : public sc::event<PlayCardEvent> {
public:
    PlayCardEvent(const PlayerId& playerId, int cardIndex, bool& ret) :
        playerId {playerId},
        cardIndex {cardIndex},
        ret {ret}
    {
    }

    const PlayerId& playerId;
    int cardIndex;
    bool& ret;
};
class EvaluateTrickEvent : public sc::event<EvaluateTrickEvent> {
public:
    EvaluateTrickEvent(std::optional<WizardEngine::TrickCompleted>& ret) :
        ret {ret}
    {
    }

    std::optional<WizardEngine::TrickCompleted>& ret;
};
class EndRoundEvent : public sc::event<EndRoundEvent> {
public:
    EndRoundEvent(bool& ret) :
        ret {ret}
    {
    }

    bool& ret;
};

////////////////////////////////////////////////////////////////////////////////
// WizardEngine::Impl
////////////////////////////////////////////////////////////////////////////////

class Waiting;

class WizardEngine::Impl :
    public sc::state_machine<WizardEngine::Impl, Waiting> {
public:
    Impl(Rng& rng, int minPlayers);

    MatchState& getMatchState() { return matchState; }
    const MatchState& getMatchState() const { return matchState; }
    int getMinPlayers() const { return minPlayers; }

    void setPhase(Phase phase);
    void startFirstRound();
    void advanceActivePlayer();
    bool isRoundComplete() const;
    WizardEngine::TrickCompleted resolveTrick();
    WizardEngine::RoundEnded::ScoreVector scoreRound();
    bool startNextRound();

    bool canBid(const PlayerId& playerId, int bid) const;
    bool canPlayCard(const PlayerId& playerId, int cardIndex) const;
    bool addSpectator(const PlayerId& id, std::string name);
    bool removeSpectator(const PlayerId& id);
    bool setConnected(const PlayerId& id, bool connected);
    bool isIdTaken(const PlayerId& id) const;

    Observable<GameStarted>& getGameStartedNotifier()
    {
        return gameStartedNotifier;
    }
    Observable<BidPlaced>& getBidPlacedNotifier()
    {
        return bidPlacedNotifier;
    }
    Observable<CardPlayed>& getCardPlayedNotifier()
    {
        return cardPlayedNotifier;
    }
    Observable<TrickCompleted>& getTrickCompletedNotifier()
    {
        return trickCompletedNotifier;
    }
    Observable<RoundEnded>& getRoundEndedNotifier()
    {
        return roundEndedNotifier;
    }

    FunctionQueue functionQueue;

private:

    void internalDeal();

    Dealer dealer;
    const int minPlayers;
    MatchState matchState;
    Observable<GameStarted> gameStartedNotifier;
    Observable<BidPlaced> bidPlacedNotifier;
    Observable<CardPlayed> cardPlayedNotifier;
    Observable<TrickCompleted> trickCompletedNotifier;
    Observable<RoundEnded> roundEndedNotifier;
};

WizardEngine::Impl::Impl(Rng& rng, const int minPlayers) :
    dealer {rng},
    minPlayers {std::clamp(minPlayers, 1, MAX_PLAYERS)}
{
}

void WizardEngine::Impl::setPhase(const Phase phase)
{
    matchState.phase = phase;
}

void WizardEngine::Impl::startFirstRound()
{
    matchState.currentRound = 1;
    internalDeal();
    const auto& leader = matchState.players.front().id;
    matchState.leadingPlayerId = leader;
    matchState.activePlayerId = leader;
    setPhase(Phase::BIDDING);
}

void WizardEngine::Impl::advanceActivePlayer()
{
    const auto n = dereference(
        matchState.getPlayerIndex(dereference(matchState.activePlayerId)));
    const auto next = nextCircular(n, matchState.getNumberOfPlayers());
    matchState.activePlayerId = matchState.players[next].id;
}

bool WizardEngine::Impl::isRoundComplete() const
{
    return matchState.phase == Phase::PLAYING &&
        matchState.currentRound > 0 && matchState.currentTrick.empty() &&
        std::ranges::all_of(
            matchState.players,
            [](const auto& player) { return player.hand.empty(); });
}

WizardEngine::TrickCompleted WizardEngine::Impl::resolveTrick()
{
    auto& trick = matchState.currentTrick;
    if (std::ssize(trick) != matchState.getNumberOfPlayers()) {
        throw EngineFailure {"Resolving incomplete trick"};
    }
    auto winner = dereference(
        getTrickWinner(
            trick, getTrumpSuit(matchState.trumpCard),
            dereference(matchState.leadingPlayerId)));
    auto& winning_player = dereference(matchState.getPlayer(winner));
    ++winning_player.tricks;
    matchState.leadingPlayerId = winner;
    matchState.activePlayerId = winner;
    trick.clear();
    matchState.leadSuit.reset();
    setPhase(Phase::PLAYING);
    log(LogLevel::DEBUG, "Trick won by %s", winning_player.name);
    return {std::move(winner), isRoundComplete()};
}

WizardEngine::RoundEnded::ScoreVector WizardEngine::Impl::scoreRound()
{
    auto scores = RoundEnded::ScoreVector {};
    for (auto& player : matchState.players) {
        player.score += calculateRoundScore(
            player.bid.value_or(0), player.tricks);
        scores.emplace_back(player.id, player.score);
    }
    return scores;
}

bool WizardEngine::Impl::startNextRound()
{
    ++matchState.currentRound;
    if (matchState.currentRound > matchState.getMaxRounds()) {
        matchState.leadingPlayerId.reset();
        matchState.activePlayerId.reset();
        setPhase(Phase::FINISHED);
        log(LogLevel::DEBUG, "Match finished after %d rounds",
            matchState.currentRound - 1);
        return true;
    }
    internalDeal();
    const auto n = (matchState.currentRound - 1) %
        matchState.getNumberOfPlayers();
    const auto& leader = matchState.players[n].id;
    matchState.leadingPlayerId = leader;
    matchState.activePlayerId = leader;
    setPhase(Phase::BIDDING);
    return false;
}

bool WizardEngine::Impl::canBid(const PlayerId& playerId, const int bid) const
{
    if (matchState.phase != Phase::BIDDING ||
        matchState.activePlayerId != playerId ||
        bid < 0 || bid > matchState.currentRound) {
        return false;
    }
    const auto* player = matchState.getPlayer(playerId);
    if (!player || player->bid) {
        return false;
    }
    const auto n_missing = std::ranges::count_if(
        matchState.players,
        [](const auto& p) { return !p.bid.has_value(); });
    if (n_missing == 1) {
        const auto sum_of_bids = std::accumulate(
            matchState.players.begin(), matchState.players.end(), 0,
            [](const auto sum, const auto& p) { return sum + p.bid.value_or(0); });
        if (sum_of_bids + bid == matchState.currentRound) {
            return false;
        }
    }
    return true;
}

bool WizardEngine::Impl::canPlayCard(
    const PlayerId& playerId, const int cardIndex) const
{
    if (matchState.phase != Phase::PLAYING ||
        matchState.activePlayerId != playerId) {
        return false;
    }
    const auto* player = matchState.getPlayer(playerId);
    return player &&
        Wizard::canPlayCard(player->hand, cardIndex, matchState.leadSuit);
}

bool WizardEngine::Impl::addSpectator(const PlayerId& id, std::string name)
{
    if (isIdTaken(id)) {
        return false;
    }
    matchState.spectators.push_back(Spectator {id, std::move(name), true});
    return true;
}

bool WizardEngine::Impl::removeSpectator(const PlayerId& id)
{
    return std::erase_if(
        matchState.spectators,
        [&id](const auto& spectator) { return spectator.id == id; }) > 0;
}

bool WizardEngine::Impl::setConnected(const PlayerId& id, const bool connected)
{
    if (auto* player = matchState.getPlayer(id)) {
        player->connected = connected;
        return true;
    }
    const auto iter = std::ranges::find(matchState.spectators, id, &Spectator::id);
    if (iter != matchState.spectators.end()) {
        iter->connected = connected;
        return true;
    }
    return false;
}

bool WizardEngine::Impl::isIdTaken(const PlayerId& id) const
{
    return matchState.getPlayer(id) || matchState.getSpectator(id);
}

void WizardEngine::Impl::internalDeal()
{
    auto dealt = dealer.deal(
        matchState.getNumberOfPlayers(), matchState.currentRound);
    for (const auto i : to(dealt.hands.size())) {
        auto& player = matchState.players[i];
        player.hand = std::move(dealt.hands[i]);
        player.tricks = 0;
        player.bid.reset();
    }
    matchState.trumpCard = std::move(dealt.trumpCard);
    matchState.currentTrick.clear();
    matchState.leadSuit.reset();
    log(LogLevel::DEBUG, "Round %d dealt. Trump card: %s",
        matchState.currentRound, matchState.trumpCard);
}

////////////////////////////////////////////////////////////////////////////////
// States
////////////////////////////////////////////////////////////////////////////////

class Bidding;
class Playing;
class Scoring;
class Finished;

class Waiting : public sc::simple_state<Waiting, WizardEngine::Impl> {
public:
    using reactions = boost::mpl::list<
        sc::custom_reaction<AddPlayerEvent>,
        sc::custom_reaction<RemovePlayerEvent>,
        sc::custom_reaction<StartGameEvent>>;
    sc::result react(const AddPlayerEvent&);
    sc::result react(const RemovePlayerEvent&);
    sc::result react(const StartGameEvent&);
};

class Bidding : public sc::simple_state<Bidding, WizardEngine::Impl> {
public:
    using reactions = sc::custom_reaction<BidEvent>;
    sc::result react(const BidEvent&);
};

class Playing : public sc::simple_state<Playing, WizardEngine::Impl> {
public:
    using reactions = boost::mpl::list<
        sc::custom_reaction<PlayCardEvent>,
        sc::custom_reaction<EndRoundEvent>>;
    sc::result react(const PlayCardEvent&);
    sc::result react(const EndRoundEvent&);
};

class Scoring : public sc::simple_state<Scoring, WizardEngine::Impl> {
public:
    using reactions = sc::custom_reaction<EvaluateTrickEvent>;
    sc::result react(const EvaluateTrickEvent&);
};

class Finished : public sc::simple_state<Finished, WizardEngine::Impl> {};

sc::result Waiting::react(const AddPlayerEvent& event)
{
    auto& context = outermost_context();
    auto& state = context.getMatchState();
    const auto name_taken = std::ranges::any_of(
        state.players,
        [&event](const auto& player) { return player.name == event.name; });
    if (state.getNumberOfPlayers() >= MAX_PLAYERS || name_taken ||
        context.isIdTaken(event.playerId)) {
        return discard_event();
    }
    state.players.push_back(
        Player {event.playerId, event.name, event.isHuman, true, {}, 0, {}, 0});
    event.ret = true;
    return discard_event();
}

sc::result Waiting::react(const RemovePlayerEvent& event)
{
    auto& state = outermost_context().getMatchState();
    event.ret = std::erase_if(
        state.players,
        [&event](const auto& player) { return player.id == event.playerId; }) > 0;
    return discard_event();
}

sc::result Waiting::react(const StartGameEvent& event)
{
    auto& context = outermost_context();
    const auto n_players = context.getMatchState().getNumberOfPlayers();
    if (n_players < context.getMinPlayers()) {
        return discard_event();
    }
    context.startFirstRound();
    event.ret = true;
    log(LogLevel::DEBUG, "Match started with %d players", n_players);
    context.getGameStartedNotifier().notifyAll(WizardEngine::GameStarted {n_players});
    return transit<Bidding>();
}

sc::result Bidding::react(const BidEvent& event)
{
    auto& context = outermost_context();
    if (!context.canBid(event.playerId, event.bid)) {
        return discard_event();
    }
    auto& state = context.getMatchState();
    dereference(state.getPlayer(event.playerId)).bid = event.bid;
    event.ret = true;
    context.advanceActivePlayer();
    const auto bidding_completed = std::ranges::all_of(
        state.players,
        [](const auto& player) { return player.bid.has_value(); });
    if (bidding_completed) {
        context.setPhase(Phase::PLAYING);
    }
    context.getBidPlacedNotifier().notifyAll(
        WizardEngine::BidPlaced {event.playerId, event.bid});
    if (bidding_completed) {
        return transit<Playing>();
    }
    return discard_event();
}

sc::result Playing::react(const PlayCardEvent& event)
{
    auto& context = outermost_context();
    if (!context.canPlayCard(event.playerId, event.cardIndex)) {
        return discard_event();
    }
    auto& state = context.getMatchState();
    auto& hand = dereference(state.getPlayer(event.playerId)).hand;
    const auto iter = hand.begin() + event.cardIndex;
    auto card = std::move(*iter);
    hand.erase(iter);
    card.playedBy = event.playerId;
    if (!state.leadSuit && !card.isSpecial()) {
        state.leadSuit = card.suit;
    }
    state.currentTrick.push_back(card);
    event.ret = true;
    const auto trick_completed =
        std::ssize(state.currentTrick) == state.getNumberOfPlayers();
    if (trick_completed) {
        context.setPhase(Phase::SCORING);
    } else {
        context.advanceActivePlayer();
    }
    context.getCardPlayedNotifier().notifyAll(
        WizardEngine::CardPlayed {event.playerId, std::move(card), trick_completed});
    if (trick_completed) {
        return transit<Scoring>();
    }
    return discard_event();
}

sc::result Playing::react(const EndRoundEvent& event)
{
    auto& context = outermost_context();
    if (!context.isRoundComplete()) {
        return discard_event();
    }
    const auto round = context.getMatchState().currentRound;
    auto scores = context.scoreRound();
    const auto finished = context.startNextRound();
    event.ret = true;
    context.getRoundEndedNotifier().notifyAll(
        WizardEngine::RoundEnded {round, std::move(scores), finished});
    if (finished) {
        return transit<Finished>();
    }
    return transit<Bidding>();
}

sc::result Scoring::react(const EvaluateTrickEvent& event)
{
    auto& context = outermost_context();
    event.ret = context.resolveTrick();
    context.getTrickCompletedNotifier().notifyAll(*event.ret);
    return transit<Playing>();
}

////////////////////////////////////////////////////////////////////////////////
// WizardEngine
////////////////////////////////////////////////////////////////////////////////

WizardEngine::WizardEngine(Rng& rng, const int minPlayers) :
    impl {std::make_shared<Impl>(rng, minPlayers)}
{
    impl->initiate();
}

WizardEngine::~WizardEngine() = default;

void WizardEngine::subscribeToGameStarted(
    std::weak_ptr<Observer<GameStarted>> observer)
{
    assert(impl);
    impl->getGameStartedNotifier().subscribe(std::move(observer));
}

void WizardEngine::subscribeToBidPlaced(
    std::weak_ptr<Observer<BidPlaced>> observer)
{
    assert(impl);
    impl->getBidPlacedNotifier().subscribe(std::move(observer));
}

void WizardEngine::subscribeToCardPlayed(
    std::weak_ptr<Observer<CardPlayed>> observer)
{
    assert(impl);
    impl->getCardPlayedNotifier().subscribe(std::move(observer));
}

void WizardEngine::subscribeToTrickCompleted(
    std::weak_ptr<Observer<TrickCompleted>> observer)
{
    assert(impl);
    impl->getTrickCompletedNotifier().subscribe(std::move(observer));
}

void WizardEngine::subscribeToRoundEnded(
    std::weak_ptr<Observer<RoundEnded>> observer)
{
    assert(impl);
    impl->getRoundEndedNotifier().subscribe(std::move(observer));
}

bool WizardEngine::addPlayer(
    const PlayerId& id, std::string name, const bool isHuman)
{
    assert(impl);
    auto ret = false;
    impl->functionQueue(
        [&impl = *impl, &id, &name, isHuman, &ret]()
        {
            impl.process_event(
                AddPlayerEvent {id, std::move(name), isHuman, ret});
        });
    return ret;
}

bool WizardEngine::addSpectator(const PlayerId& id, std::string name)
{
    assert(impl);
    return impl->addSpectator(id, std::move(name));
}

bool WizardEngine::removePlayer(const PlayerId& id)
{
    assert(impl);
    if (impl->removeSpectator(id)) {
        return true;
    }
    auto ret = false;
    impl->functionQueue(
        [&impl = *impl, &id, &ret]()
        {
            impl.process_event(RemovePlayerEvent {id, ret});
        });
    return ret;
}

bool WizardEngine::setConnected(const PlayerId& id, const bool connected)
{
    assert(impl);
    return impl->setConnected(id, connected);
}

bool WizardEngine::startGame()
{
    assert(impl);
    auto ret = false;
    impl->functionQueue(
        [&impl = *impl, &ret]()
        {
            impl.process_event(StartGameEvent {ret});
        });
    return ret;
}

bool WizardEngine::placeBid(const PlayerId& playerId, const int bid)
{
    assert(impl);
    auto ret = false;
    impl->functionQueue(
        [&impl = *impl, &playerId, bid, &ret]()
        {
            impl.process_event(BidEvent {playerId, bid, ret});
        });
    return ret;
}

bool WizardEngine::playCard(const PlayerId& playerId, const int cardIndex)
{
    assert(impl);
    auto ret = false;
    impl->functionQueue(
        [&impl = *impl, &playerId, cardIndex, &ret]()
        {
            impl.process_event(PlayCardEvent {playerId, cardIndex, ret});
        });
    return ret;
}

std::optional<WizardEngine::TrickCompleted> WizardEngine::evaluateTrick()
{
    assert(impl);
    auto ret = std::optional<TrickCompleted> {};
    impl->functionQueue(
        [&impl = *impl, &ret]()
        {
            impl.process_event(EvaluateTrickEvent {ret});
        });
    return ret;
}

bool WizardEngine::endRound()
{
    assert(impl);
    auto ret = false;
    impl->functionQueue(
        [&impl = *impl, &ret]()
        {
            impl.process_event(EndRoundEvent {ret});
        });
    return ret;
}

bool WizardEngine::canBid(const PlayerId& playerId, const int bid) const
{
    assert(impl);
    return impl->canBid(playerId, bid);
}

bool WizardEngine::canPlayCard(
    const PlayerId& playerId, const int cardIndex) const
{
    assert(impl);
    return impl->canPlayCard(playerId, cardIndex);
}

Phase WizardEngine::getPhase() const
{
    assert(impl);
    return impl->getMatchState().phase;
}

bool WizardEngine::hasEnded() const
{
    assert(impl);
    return impl->state_cast<const Finished*>() != nullptr;
}

const MatchState& WizardEngine::getState() const
{
    assert(impl);
    return impl->getMatchState();
}

MatchState WizardEngine::getProjection(const PlayerId& viewerId) const
{
    assert(impl);
    return makeProjection(impl->getMatchState(), viewerId);
}

int WizardEngine::getMinPlayers() const
{
    assert(impl);
    return impl->getMinPlayers();
}

int WizardEngine::getMaxRounds() const
{
    assert(impl);
    return impl->getMatchState().getMaxRounds();
}

WizardEngine::GameStarted::GameStarted(const int players) :
    players {players}
{
}

WizardEngine::BidPlaced::BidPlaced(PlayerId playerId, const int bid) :
    playerId {std::move(playerId)},
    bid {bid}
{
}

WizardEngine::CardPlayed::CardPlayed(
    PlayerId playerId, Card card, const bool trickComplete) :
    playerId {std::move(playerId)},
    card {std::move(card)},
    trickComplete {trickComplete}
{
}

WizardEngine::TrickCompleted::TrickCompleted(
    PlayerId winner, const bool roundComplete) :
    winner {std::move(winner)},
    roundComplete {roundComplete}
{
}

WizardEngine::RoundEnded::RoundEnded(
    const int round, ScoreVector scores, const bool finished) :
    round {round},
    scores {std::move(scores)},
    finished {finished}
{
}

bool operator==(
    const WizardEngine::GameStarted& lhs, const WizardEngine::GameStarted& rhs)
{
    return lhs.players == rhs.players;
}

bool operator==(
    const WizardEngine::BidPlaced& lhs, const WizardEngine::BidPlaced& rhs)
{
    return lhs.playerId == rhs.playerId && lhs.bid == rhs.bid;
}

bool operator==(
    const WizardEngine::CardPlayed& lhs, const WizardEngine::CardPlayed& rhs)
{
    return lhs.playerId == rhs.playerId && lhs.card == rhs.card &&
        lhs.trickComplete == rhs.trickComplete;
}

bool operator==(
    const WizardEngine::TrickCompleted& lhs,
    const WizardEngine::TrickCompleted& rhs)
{
    return lhs.winner == rhs.winner && lhs.roundComplete == rhs.roundComplete;
}

bool operator==(
    const WizardEngine::RoundEnded& lhs, const WizardEngine::RoundEnded& rhs)
{
    return lhs.round == rhs.round && lhs.scores == rhs.scores &&
        lhs.finished == rhs.finished;
}

}
}
