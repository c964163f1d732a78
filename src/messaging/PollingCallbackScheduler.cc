#include "messaging/PollingCallbackScheduler.hh"

#include "messaging/MessageUtility.hh"

#include <algorithm>
#include <array>
#include <functional>
#include <queue>
#include <sstream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>

using namespace std::chrono_literals;

namespace Wizard {
namespace Messaging {

namespace {

using Clock = std::chrono::steady_clock;
using Ms = std::chrono::milliseconds;
using CallbackId = std::uint64_t;

// Sent from the scheduler to the worker
struct CallbackInfo {
    Ms timeout;
    CallbackId id;
};

struct ScheduledCallback {
    Clock::time_point due;
    CallbackId id;
};

// Earliest first, ties broken by scheduling order
bool operator<(const ScheduledCallback& lhs, const ScheduledCallback& rhs)
{
    return std::tie(lhs.due, lhs.id) > std::tie(rhs.due, rhs.id);
}

using CallbackQueue = std::priority_queue<ScheduledCallback>;

// The worker receives CallbackInfo from the front socket, waits until a
// callback is due and sends its id back through the back socket, where the
// message loop picks it up and calls operator()().

Ms timeUntilNextCallback(const CallbackQueue& queue)
{
    if (queue.empty()) {
        return -1ms;
    }
    return std::max(
        0ms, std::chrono::duration_cast<Ms>(queue.top().due - Clock::now()));
}

void sendCallbackId(Socket& socket, CallbackId id)
{
    sendMessage(socket, messageBuffer(&id, sizeof(id)));
}

void callbackSchedulerWorker(
    MessageContext& context, const std::string& backEndpoint,
    const std::string& frontEndpoint, Socket terminationSubscriber)
{
    auto queue = CallbackQueue {};
    auto fs = Socket {context, SocketType::pair};
    auto bs = Socket {context, SocketType::pair};
    connectSocket(fs, frontEndpoint);
    connectSocket(bs, backEndpoint);
    // Synchronize
    discardMessage(fs);
    sendEmptyMessage(bs);
    auto pollitems = std::array {
        Pollitem { terminationSubscriber.handle(), 0, ZMQ_POLLIN, 0 },
        Pollitem { fs.handle(), 0, ZMQ_POLLIN, 0 },
    };
    while (true) {
        pollSockets(pollitems, timeUntilNextCallback(queue));
        if (pollitems[0].revents & ZMQ_POLLIN) {
            break;
        } else if (pollitems[1].revents & ZMQ_POLLIN) {
            const auto now = Clock::now();
            while (hasIncomingMessage(fs)) {
                auto info = CallbackInfo {};
                const auto result = recvMessage(
                    fs, messageBuffer(&info, sizeof(info)));
                if (result.truncated()) {
                    throw std::runtime_error {"Invalid callback info"};
                }
                if (info.timeout <= 0ms) {
                    sendCallbackId(bs, info.id);
                } else {
                    queue.emplace(ScheduledCallback {now + info.timeout, info.id});
                }
            }
        }
        // Timeout means that every callback due by now can be released
        while (!queue.empty() && queue.top().due <= Clock::now()) {
            sendCallbackId(bs, queue.top().id);
            queue.pop();
        }
    }
}

std::string generateEndpoint(const std::string& prefix, const void* addr)
{
    std::ostringstream os;
    os << "inproc://wizard." << prefix << "." << addr;
    return os.str();
}

}

PollingCallbackScheduler::PollingCallbackScheduler(
    MessageContext& context, Socket terminationSubscriber) :
    frontSocket {context, SocketType::pair},
    backSocket {makeSharedSocket(context, SocketType::pair)}
{
    auto back_endpoint = generateEndpoint("csbs", this);
    auto front_endpoint = generateEndpoint("csfs", this);
    bindSocket(*backSocket, back_endpoint);
    bindSocket(frontSocket, front_endpoint);
    worker = Thread {
        callbackSchedulerWorker, std::ref(context), std::move(back_endpoint),
        std::move(front_endpoint), std::move(terminationSubscriber)};
    // Synchronize
    sendEmptyMessage(frontSocket);
    discardMessage(*backSocket);
}

void PollingCallbackScheduler::handleCallLater(
    const Ms timeout, Callback callback)
{
    const auto id = nextCallbackId++;
    callbacks.emplace(id, std::move(callback));
    auto info = CallbackInfo {timeout, id};
    sendMessage(frontSocket, messageBuffer(&info, sizeof(info)));
}

SharedSocket PollingCallbackScheduler::getSocket()
{
    return backSocket;
}

void PollingCallbackScheduler::operator()(Socket& socket)
{
    if (&socket != backSocket.get()) {
        return;
    }
    while (hasIncomingMessage(socket)) {
        auto id = CallbackId {};
        const auto result = recvMessage(socket, messageBuffer(&id, sizeof(id)));
        if (result.truncated()) {
            throw std::runtime_error {"Invalid callback id"};
        }
        const auto iter = callbacks.find(id);
        if (iter != callbacks.end()) {
            const auto callback = std::move(iter->second);
            callbacks.erase(iter);
            callback();
        }
    }
}

}
}
