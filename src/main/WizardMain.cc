#include "main/WizardMain.hh"

#include "main/Config.hh"
#include "main/Connection.hh"
#include "main/SessionRoom.hh"
#include "messaging/MessageLoop.hh"
#include "messaging/MessageUtility.hh"
#include "messaging/PollingCallbackScheduler.hh"
#include "wizard/Random.hh"
#include "wizard/UuidGenerator.hh"
#include "Logging.hh"
#include "Utility.hh"

#include <cassert>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace Wizard {
namespace Main {

namespace {

constexpr auto N_FRAMES = 3;

class RouterConnection : public Connection {
public:

    RouterConnection(
        Messaging::SharedSocket socket, std::string routingId, PlayerId id);

private:

    const PlayerId& handleGetId() const override;
    void handleSend(const std::string& message) override;
    void handleClose() override;

    void sendPayload(const std::string& payload);

    const Messaging::SharedSocket socket;
    const std::string routingId;
    const PlayerId id;
    bool closed {};
};

RouterConnection::RouterConnection(
    Messaging::SharedSocket socket, std::string routingId, PlayerId id) :
    socket {std::move(socket)},
    routingId {std::move(routingId)},
    id {std::move(id)}
{
}

const PlayerId& RouterConnection::handleGetId() const
{
    return id;
}

void RouterConnection::handleSend(const std::string& message)
{
    if (!closed) {
        sendPayload(message);
    }
}

void RouterConnection::handleClose()
{
    if (!closed) {
        sendPayload({});
        closed = true;
    }
}

void RouterConnection::sendPayload(const std::string& payload)
{
    auto& s = dereference(socket);
    Messaging::sendMessage(s, Messaging::messageBuffer(routingId), true);
    Messaging::sendEmptyMessage(s, true);
    Messaging::sendMessage(s, Messaging::messageBuffer(payload));
}

}

class WizardMain::Impl {
public:

    Impl(Messaging::MessageContext& context, Config config);

    void run();

private:

    void createRoom();
    void handleRoomReleased();
    void handleServerSocket(Messaging::Socket& socket);

    const Config config;
    Rng& rng;
    Messaging::SharedSocket serverSocket;
    Messaging::MessageLoop messageLoop;
    std::shared_ptr<Messaging::PollingCallbackScheduler> callbackScheduler;
    std::map<std::string, std::shared_ptr<Connection>> connections;
    std::unique_ptr<SessionRoom> room;
};

WizardMain::Impl::Impl(Messaging::MessageContext& context, Config config) :
    config {std::move(config)},
    rng {getRng()},
    serverSocket {
        Messaging::makeSharedSocket(context, Messaging::SocketType::router)},
    messageLoop {context},
    callbackScheduler {
        std::make_shared<Messaging::PollingCallbackScheduler>(
            context, messageLoop.createTerminationSubscriber())}
{
    if (const auto seed = this->config.getSeed()) {
        seedRng(*seed);
    }
    serverSocket->set(zmq::sockopt::router_handover, 1);
    const auto& endpoint = this->config.getBindEndpoint();
    Messaging::bindSocket(*serverSocket, endpoint);
    log(LogLevel::INFO, "Listening on %s", endpoint);
    messageLoop.addPollable(
        callbackScheduler->getSocket(),
        [callbackScheduler = this->callbackScheduler](auto& socket)
        {
            assert(callbackScheduler);
            (*callbackScheduler)(socket);
        });
    messageLoop.addPollable(
        serverSocket,
        [this](auto& socket) { handleServerSocket(socket); });
    createRoom();
}

void WizardMain::Impl::run()
{
    messageLoop.run();
}

void WizardMain::Impl::createRoom()
{
    log(LogLevel::INFO, "Creating session room");
    room = std::make_unique<SessionRoom>(
        rng, callbackScheduler, config.getRoomConfig(),
        [this]() { handleRoomReleased(); });
}

void WizardMain::Impl::handleRoomReleased()
{
    connections.clear();
    // The room is still executing the callback, so it is replaced later
    dereference(callbackScheduler).callSoon([this]() { createRoom(); });
}

void WizardMain::Impl::handleServerSocket(Messaging::Socket& socket)
{
    auto frames = std::vector<Messaging::Message> {};
    const auto n_frames = Messaging::recvMultipart(socket, frames, N_FRAMES);
    if (n_frames != N_FRAMES || frames[1].size() != 0) {
        log(LogLevel::WARNING, "Discarding malformed message with %d frames",
            n_frames);
        return;
    }
    assert(room);
    auto routing_id = Messaging::messageToString(frames[0]);
    const auto payload = Messaging::messageToString(frames[2]);
    const auto iter = connections.find(routing_id);
    if (payload.empty()) {
        if (iter != connections.end()) {
            const auto id = dereference(iter->second).getId();
            connections.erase(iter);
            room->handleClose(id);
        }
        return;
    }
    auto connection = std::shared_ptr<Connection> {};
    if (iter == connections.end()) {
        connection = std::make_shared<RouterConnection>(
            serverSocket, routing_id, generatePlayerId());
        connections.emplace(std::move(routing_id), connection);
        room->handleOpen(connection);
    } else {
        connection = iter->second;
    }
    room->handleMessage(connection->getId(), payload);
}

WizardMain::WizardMain(Messaging::MessageContext& context, Config config) :
    impl {std::make_unique<Impl>(context, std::move(config))}
{
}

WizardMain::~WizardMain() = default;

void WizardMain::run()
{
    assert(impl);
    impl->run();
}

}
}
