#include "main/SessionRoom.hh"

#include "engine/BotPolicy.hh"
#include "main/ClientMessage.hh"
#include "main/Connection.hh"
#include "main/ServerMessages.hh"
#include "messaging/CallbackScheduler.hh"
#include "messaging/SerializationFailureException.hh"
#include "wizard/UuidGenerator.hh"
#include "wizard/WizardConstants.hh"
#include "Logging.hh"
#include "Observer.hh"
#include "Utility.hh"

#include <algorithm>
#include <cassert>
#include <exception>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace Wizard {
namespace Main {

using Engine::BotPolicy;
using Engine::Phase;
using Engine::WizardEngine;

namespace {

const std::string GAME_ALREADY_IN_PROGRESS {"Game already in progress"};
const std::string GAME_IS_FULL {"Game is full (maximum 6 players)"};
const std::string DUPLICATE_NAME {"A player with that name already exists"};
const std::string ALREADY_JOINED {"Already joined"};
const std::string GAME_ALREADY_STARTED {"Game already started"};
const std::string NOT_ENOUGH_PLAYERS {"Not enough players to start"};
const std::string NOT_A_PLAYER {"Not a player"};
const std::string GAME_NOT_STARTED {"Game not started"};
const std::string INVALID_BID {"Invalid bid"};
const std::string INVALID_CARD_PLAY {"Invalid card play"};
const std::string INVALID_MESSAGE {"Invalid message"};
const std::string INTERNAL_ERROR {"Internal error"};

const std::string BOT_NAME_PREFIX {"Bot "};

enum class Role {
    PLAYER,
    SPECTATOR,
};

struct Session {
    std::shared_ptr<Connection> connection;
    std::optional<Role> role;
    std::string name;
};

}

class SessionRoom::Impl :
    public Observer<WizardEngine::GameStarted>,
    public Observer<WizardEngine::BidPlaced>,
    public Observer<WizardEngine::CardPlayed>,
    public Observer<WizardEngine::TrickCompleted>,
    public Observer<WizardEngine::RoundEnded>,
    public std::enable_shared_from_this<SessionRoom::Impl> {
public:

    Impl(
        Rng& rng,
        std::shared_ptr<Messaging::CallbackScheduler> callbackScheduler,
        RoomConfig config, ReleaseCallback onRelease);

    void scheduleInactivityCheck();

    void open(std::shared_ptr<Connection> connection);
    void message(const PlayerId& connectionId, std::string_view payload);
    void close(const PlayerId& connectionId);

    WizardEngine& getEngine() { return engine; }
    bool isReleased() const { return released; }

    void operator()(Session& session, const JoinRequest& request);
    void operator()(Session& session, const SpectateRequest& request);
    void operator()(Session& session, const StartGameRequest&);
    void operator()(Session& session, const PlaceBidRequest& request);
    void operator()(Session& session, const PlayCardRequest& request);
    void operator()(Session& session, const AddBotRequest&);

private:

    void handleNotify(const WizardEngine::GameStarted&) override;
    void handleNotify(const WizardEngine::BidPlaced&) override;
    void handleNotify(const WizardEngine::CardPlayed&) override;
    void handleNotify(const WizardEngine::TrickCompleted&) override;
    void handleNotify(const WizardEngine::RoundEnded&) override;

    template<typename Method>
    void scheduleLater(std::chrono::milliseconds delay, Method method);

    void sendError(Session& session, std::string_view message);
    void broadcast(const std::string& message);
    void broadcastState();

    bool isAutomatic(const Engine::Player& player) const;
    void afterCardPlayed();
    void scheduleAutomaticTurn();
    void playAutomaticTurn();
    void evaluateTrick();
    void endRound();
    void checkInactivity();
    void release();

    Rng& rng;
    const std::shared_ptr<Messaging::CallbackScheduler> callbackScheduler;
    const RoomConfig config;
    const ReleaseCallback onRelease;
    WizardEngine engine;
    BotPolicy botPolicy;
    std::map<PlayerId, Session> sessions;
    int botCounter {};
    bool automaticTurnPending {};
    bool activitySinceLastCheck {};
    std::chrono::milliseconds idleTime {};
    bool released {};
};

SessionRoom::Impl::Impl(
    Rng& rng,
    std::shared_ptr<Messaging::CallbackScheduler> callbackScheduler,
    RoomConfig config, ReleaseCallback onRelease) :
    rng {rng},
    callbackScheduler {std::move(callbackScheduler)},
    config {std::move(config)},
    onRelease {std::move(onRelease)},
    engine {rng, this->config.minPlayers},
    botPolicy {rng}
{
}

template<typename Method>
void SessionRoom::Impl::scheduleLater(
    const std::chrono::milliseconds delay, const Method method)
{
    dereference(callbackScheduler).callLater(
        delay,
        [weak_self = weak_from_this(), method]()
        {
            if (const auto self = weak_self.lock()) {
                if (!self->released) {
                    std::invoke(method, *self);
                }
            }
        });
}

void SessionRoom::Impl::scheduleInactivityCheck()
{
    scheduleLater(config.inactivityCheckInterval, &Impl::checkInactivity);
}

void SessionRoom::Impl::open(std::shared_ptr<Connection> connection)
{
    if (released) {
        dereference(connection).close();
        return;
    }
    const auto& id = dereference(connection).getId();
    log(LogLevel::DEBUG, "Connection opened: %s", id);
    const auto [iter, inserted] = sessions.try_emplace(
        id, Session {connection, std::nullopt, {}});
    if (!inserted) {
        log(LogLevel::WARNING, "Duplicate connection: %s", id);
    }
}

void SessionRoom::Impl::message(
    const PlayerId& connectionId, const std::string_view payload)
{
    if (released) {
        return;
    }
    activitySinceLastCheck = true;
    const auto iter = sessions.find(connectionId);
    if (iter == sessions.end()) {
        log(LogLevel::WARNING, "Message from unknown connection: %s",
            connectionId);
        return;
    }
    auto& session = iter->second;
    try {
        const auto client_message = parseClientMessage(payload);
        log(LogLevel::DEBUG, "Message from %s: %s", connectionId, payload);
        std::visit(
            [this, &session](const auto& request) { (*this)(session, request); },
            client_message);
    } catch (const Messaging::SerializationFailureException& e) {
        log(LogLevel::DEBUG, "Invalid message from %s: %s",
            connectionId, e.what());
        sendError(session, INVALID_MESSAGE);
    } catch (const std::exception& e) {
        log(LogLevel::ERROR, "Error while handling message from %s: %s",
            connectionId, e.what());
        sendError(session, INTERNAL_ERROR);
    }
}

void SessionRoom::Impl::close(const PlayerId& connectionId)
{
    const auto iter = sessions.find(connectionId);
    if (iter == sessions.end()) {
        return;
    }
    const auto session = std::move(iter->second);
    sessions.erase(iter);
    log(LogLevel::DEBUG, "Connection closed: %s", connectionId);
    if (released || !session.role) {
        return;
    }
    if (*session.role == Role::PLAYER &&
        engine.getPhase() != Phase::WAITING) {
        engine.setConnected(connectionId, false);
        broadcast(makePlayerLeftMessage(connectionId, session.name));
        broadcastState();
        scheduleAutomaticTurn();
    } else {
        engine.removePlayer(connectionId);
        broadcast(makePlayerLeftMessage(connectionId, session.name));
        broadcastState();
    }
}

void SessionRoom::Impl::operator()(
    Session& session, const JoinRequest& request)
{
    const auto& id = session.connection->getId();
    if (session.role) {
        sendError(session, ALREADY_JOINED);
        return;
    }
    if (engine.getPhase() != Phase::WAITING) {
        sendError(session, GAME_ALREADY_IN_PROGRESS);
        return;
    }
    if (!engine.addPlayer(id, request.name)) {
        const auto& state = engine.getState();
        sendError(
            session, state.getNumberOfPlayers() >= MAX_PLAYERS ?
                GAME_IS_FULL : DUPLICATE_NAME);
        return;
    }
    session.role = Role::PLAYER;
    session.name = request.name;
    log(LogLevel::INFO, "Player joined: %s (%s)", request.name, id);
    session.connection->send(makeJoinSuccessMessage(id));
    broadcast(makePlayerJoinedMessage(id, request.name, false));
    broadcastState();
}

void SessionRoom::Impl::operator()(
    Session& session, const SpectateRequest& request)
{
    const auto& id = session.connection->getId();
    if (session.role || !engine.addSpectator(id, request.name)) {
        sendError(session, ALREADY_JOINED);
        return;
    }
    session.role = Role::SPECTATOR;
    session.name = request.name;
    log(LogLevel::INFO, "Spectator joined: %s (%s)", request.name, id);
    session.connection->send(makeJoinSuccessMessage(id));
    broadcast(makePlayerJoinedMessage(id, request.name, true));
    broadcastState();
}

void SessionRoom::Impl::operator()(Session& session, const StartGameRequest&)
{
    if (session.role != Role::PLAYER) {
        sendError(session, NOT_A_PLAYER);
        return;
    }
    if (engine.getPhase() != Phase::WAITING) {
        sendError(session, GAME_ALREADY_STARTED);
        return;
    }
    if (!engine.startGame()) {
        sendError(session, NOT_ENOUGH_PLAYERS);
        return;
    }
    broadcastState();
    scheduleAutomaticTurn();
}

void SessionRoom::Impl::operator()(
    Session& session, const PlaceBidRequest& request)
{
    if (engine.getPhase() == Phase::WAITING) {
        sendError(session, GAME_NOT_STARTED);
        return;
    }
    if (session.role != Role::PLAYER) {
        sendError(session, NOT_A_PLAYER);
        return;
    }
    if (!engine.placeBid(session.connection->getId(), request.bid)) {
        sendError(session, INVALID_BID);
        return;
    }
    broadcastState();
    scheduleAutomaticTurn();
}

void SessionRoom::Impl::operator()(
    Session& session, const PlayCardRequest& request)
{
    if (engine.getPhase() == Phase::WAITING) {
        sendError(session, GAME_NOT_STARTED);
        return;
    }
    if (session.role != Role::PLAYER) {
        sendError(session, NOT_A_PLAYER);
        return;
    }
    if (!engine.playCard(session.connection->getId(), request.cardIndex)) {
        sendError(session, INVALID_CARD_PLAY);
        return;
    }
    broadcastState();
    afterCardPlayed();
}

void SessionRoom::Impl::operator()(Session& session, const AddBotRequest&)
{
    if (session.role != Role::PLAYER) {
        sendError(session, NOT_A_PLAYER);
        return;
    }
    if (engine.getPhase() != Phase::WAITING) {
        sendError(session, GAME_ALREADY_IN_PROGRESS);
        return;
    }
    if (engine.getState().getNumberOfPlayers() >= MAX_PLAYERS) {
        sendError(session, GAME_IS_FULL);
        return;
    }
    const auto id = generatePlayerId();
    auto name = std::string {};
    do {
        name = BOT_NAME_PREFIX + std::to_string(++botCounter);
    } while (!engine.addPlayer(id, name, false));
    log(LogLevel::INFO, "Bot added: %s (%s)", name, id);
    broadcast(makePlayerJoinedMessage(id, name, false));
    broadcastState();
}

void SessionRoom::Impl::handleNotify(const WizardEngine::GameStarted& event)
{
    log(LogLevel::INFO, "Match started with %d players", event.players);
    broadcast(makeGameStartedMessage());
}

void SessionRoom::Impl::handleNotify(const WizardEngine::BidPlaced& event)
{
    broadcast(makeBidPlacedMessage(event.playerId, event.bid));
}

void SessionRoom::Impl::handleNotify(const WizardEngine::CardPlayed& event)
{
    broadcast(makeCardPlayedMessage(event.playerId, event.card));
}

void SessionRoom::Impl::handleNotify(const WizardEngine::TrickCompleted& event)
{
    broadcast(makeTrickWonMessage(event.winner));
}

void SessionRoom::Impl::handleNotify(const WizardEngine::RoundEnded& event)
{
    log(LogLevel::INFO, "Round %d ended", event.round);
    broadcast(makeRoundEndedMessage(event.scores));
}

void SessionRoom::Impl::sendError(Session& session, std::string_view message)
{
    session.connection->send(makeErrorMessage(message));
}

void SessionRoom::Impl::broadcast(const std::string& message)
{
    for (auto& [id, session] : sessions) {
        if (session.role) {
            session.connection->send(message);
        }
    }
}

void SessionRoom::Impl::broadcastState()
{
    for (auto& [id, session] : sessions) {
        if (session.role) {
            session.connection->send(
                makeGameStateMessage(engine.getProjection(id)));
        }
    }
}

bool SessionRoom::Impl::isAutomatic(const Engine::Player& player) const
{
    return !player.isHuman || !player.connected;
}

void SessionRoom::Impl::afterCardPlayed()
{
    if (engine.getPhase() == Phase::SCORING) {
        scheduleLater(config.trickDelay, &Impl::evaluateTrick);
    } else {
        scheduleAutomaticTurn();
    }
}

void SessionRoom::Impl::scheduleAutomaticTurn()
{
    const auto phase = engine.getPhase();
    if (automaticTurnPending ||
        (phase != Phase::BIDDING && phase != Phase::PLAYING)) {
        return;
    }
    const auto* player = engine.getState().getActivePlayer();
    if (player && isAutomatic(*player)) {
        automaticTurnPending = true;
        scheduleLater(config.botDelay, &Impl::playAutomaticTurn);
    }
}

void SessionRoom::Impl::playAutomaticTurn()
{
    automaticTurnPending = false;
    const auto& state = engine.getState();
    const auto* player = state.getActivePlayer();
    if (!player || !isAutomatic(*player)) {
        return;
    }
    const auto id = player->id;
    if (state.phase == Phase::BIDDING) {
        auto bid = botPolicy.chooseBid(
            state, id, [this, &id](const int b) { return engine.canBid(id, b); });
        if (!bid) {
            const auto candidates = to(state.currentRound + 1);
            const auto iter = std::ranges::find_if(
                candidates, [this, &id](const int b) { return engine.canBid(id, b); });
            if (iter != candidates.end()) {
                bid = *iter;
            }
        }
        if (!bid || !engine.placeBid(id, *bid)) {
            log(LogLevel::ERROR, "Automatic bid failed for %s", id);
            return;
        }
        broadcastState();
        scheduleAutomaticTurn();
    } else if (state.phase == Phase::PLAYING) {
        const auto card = botPolicy.chooseCard(
            state, id,
            [this, &id](const int n) { return engine.canPlayCard(id, n); });
        if (!card || !engine.playCard(id, *card)) {
            log(LogLevel::ERROR, "Automatic card play failed for %s", id);
            return;
        }
        broadcastState();
        afterCardPlayed();
    }
}

void SessionRoom::Impl::evaluateTrick()
{
    const auto result = engine.evaluateTrick();
    if (!result) {
        return;
    }
    broadcastState();
    if (result->roundComplete) {
        scheduleLater(config.roundDelay, &Impl::endRound);
    } else {
        scheduleAutomaticTurn();
    }
}

void SessionRoom::Impl::endRound()
{
    if (!engine.endRound()) {
        return;
    }
    broadcastState();
    scheduleAutomaticTurn();
}

void SessionRoom::Impl::checkInactivity()
{
    if (activitySinceLastCheck) {
        activitySinceLastCheck = false;
        idleTime = {};
    } else {
        idleTime += config.inactivityCheckInterval;
    }
    if (idleTime >= config.inactivityTimeout) {
        release();
    } else {
        scheduleInactivityCheck();
    }
}

void SessionRoom::Impl::release()
{
    log(LogLevel::INFO, "Releasing inactive room with %d connections",
        sessions.size());
    released = true;
    auto sessions_to_close = std::move(sessions);
    sessions.clear();
    for (auto& [id, session] : sessions_to_close) {
        session.connection->close();
    }
    if (onRelease) {
        onRelease();
    }
}

SessionRoom::SessionRoom(
    Rng& rng,
    std::shared_ptr<Messaging::CallbackScheduler> callbackScheduler,
    RoomConfig config, ReleaseCallback onRelease) :
    impl {
        std::make_shared<Impl>(
            rng, std::move(callbackScheduler), std::move(config),
            std::move(onRelease))}
{
    auto& engine = impl->getEngine();
    engine.subscribeToGameStarted(impl);
    engine.subscribeToBidPlaced(impl);
    engine.subscribeToCardPlayed(impl);
    engine.subscribeToTrickCompleted(impl);
    engine.subscribeToRoundEnded(impl);
    impl->scheduleInactivityCheck();
}

SessionRoom::~SessionRoom() = default;

void SessionRoom::handleOpen(std::shared_ptr<Connection> connection)
{
    assert(impl);
    impl->open(std::move(connection));
}

void SessionRoom::handleMessage(
    const PlayerId& connectionId, const std::string_view payload)
{
    assert(impl);
    impl->message(connectionId, payload);
}

void SessionRoom::handleClose(const PlayerId& connectionId)
{
    assert(impl);
    impl->close(connectionId);
}

void SessionRoom::handleError(const PlayerId& connectionId)
{
    assert(impl);
    log(LogLevel::WARNING, "Transport error on connection %s", connectionId);
    impl->close(connectionId);
}

const Engine::WizardEngine& SessionRoom::getEngine() const
{
    assert(impl);
    return impl->getEngine();
}

bool SessionRoom::isReleased() const
{
    assert(impl);
    return impl->isReleased();
}

}
}
