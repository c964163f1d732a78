#include "messaging/MessageLoop.hh"

#include "Logging.hh"
#include "Utility.hh"

#include <boost/noncopyable.hpp>

#include <algorithm>
#include <cassert>
#include <cerrno>
#include <cstring>
#include <exception>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <pthread.h>
#include <signal.h>
#include <sys/signalfd.h>
#include <unistd.h>

namespace Wizard {
namespace Messaging {

namespace {

sigset_t terminationSignals()
{
    auto mask = sigset_t {};
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    return mask;
}

std::string errorString(const std::string& what, const int err)
{
    return what + ": " + std::strerror(err);
}

class SignalFd : private boost::noncopyable {
public:
    SignalFd();
    ~SignalFd();

    int get() const { return fd; }
    int readSignal() const;

private:
    int fd;
};

SignalFd::SignalFd()
{
    const auto mask = terminationSignals();
    errno = 0;
    fd = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (fd == -1) {
        throw std::runtime_error {errorString("signalfd", errno)};
    }
}

SignalFd::~SignalFd()
{
    errno = 0;
    if (close(fd) != 0) {
        log(LogLevel::ERROR, "Failed to close signalfd: %s",
            std::strerror(errno));
    }
}

// Zero if nothing could be read
int SignalFd::readSignal() const
{
    auto info = signalfd_siginfo {};
    errno = 0;
    if (read(fd, &info, sizeof(info)) != sizeof(info)) {
        log(LogLevel::WARNING, "Failed to read signal: %s",
            std::strerror(errno));
        return 0;
    }
    return static_cast<int>(info.ssi_signo);
}

struct Pollable {
    SharedSocket socket;
    MessageLoop::SocketCallback callback;
};

}

class MessageLoop::Impl {
public:
    explicit Impl(MessageContext& context);
    ~Impl();

    void addPollable(SharedSocket socket, SocketCallback callback);
    void removePollable(Socket& socket);
    void run();
    Socket createTerminationSubscriber();

private:

    auto findPollable(const Socket& socket)
    {
        return std::ranges::find_if(
            pollables,
            [&socket](const auto& pollable)
            {
                return pollable.socket.get() == &socket;
            });
    }

    void dispatch(Pollable& pollable);
    void publishTermination(int signal);

    MessageContext& context;
    const std::string terminationEndpoint;
    Socket terminationPublisher;
    std::vector<Pollable> pollables;
    sigset_t oldMask;
};

MessageLoop::Impl::Impl(MessageContext& context) :
    context {context},
    terminationEndpoint {
        [this]()
        {
            auto os = std::ostringstream {};
            os << "inproc://wizard.messageloop." << this;
            return os.str();
        }()},
    terminationPublisher {context, SocketType::pub}
{
    const auto mask = terminationSignals();
    if (const auto err = pthread_sigmask(SIG_BLOCK, &mask, &oldMask)) {
        throw std::runtime_error {errorString("pthread_sigmask", err)};
    }
    bindSocket(terminationPublisher, terminationEndpoint);
}

MessageLoop::Impl::~Impl()
{
    if (const auto err = pthread_sigmask(SIG_SETMASK, &oldMask, nullptr)) {
        log(LogLevel::ERROR, "Failed to restore signal mask: %s",
            std::strerror(err));
    }
}

void MessageLoop::Impl::addPollable(
    SharedSocket socket, SocketCallback callback)
{
    if (!socket || !callback) {
        throw std::invalid_argument {"Empty socket or callback"};
    }
    if (findPollable(*socket) != pollables.end()) {
        throw std::invalid_argument {"Socket already registered"};
    }
    pollables.push_back(Pollable {std::move(socket), std::move(callback)});
}

void MessageLoop::Impl::removePollable(Socket& socket)
{
    const auto iter = findPollable(socket);
    if (iter != pollables.end()) {
        pollables.erase(iter);
    }
}

void MessageLoop::Impl::run()
{
    const SignalFd signal_fd;
    auto pollitems = std::vector<Pollitem> {};
    while (true) {
        pollitems.clear();
        pollitems.push_back({ nullptr, signal_fd.get(), ZMQ_POLLIN, 0 });
        for (const auto& pollable : pollables) {
            pollitems.push_back({ pollable.socket->handle(), 0, ZMQ_POLLIN, 0 });
        }
        try {
            pollSockets(pollitems);
        } catch (const SocketError& e) {
            if (e.num() == EINTR) {
                continue;
            }
            throw;
        }
        if (pollitems.front().revents & ZMQ_POLLIN) {
            if (const auto signal = signal_fd.readSignal()) {
                publishTermination(signal);
                return;
            }
        }
        // Callbacks may register and unregister sockets, so the first ready
        // socket is dispatched and the rest are polled again
        assert(pollitems.size() == pollables.size() + 1);
        for (const auto n : to(pollables.size())) {
            if (pollitems[n + 1].revents & ZMQ_POLLIN) {
                dispatch(pollables[n]);
                break;
            }
        }
    }
}

void MessageLoop::Impl::dispatch(Pollable& pollable)
{
    // The callback may remove its own pollable
    const auto socket = pollable.socket;
    const auto callback = pollable.callback;
    try {
        callback(*socket);
    } catch (const std::exception& e) {
        log(LogLevel::ERROR, "Error in message loop callback: %s", e.what());
    }
}

void MessageLoop::Impl::publishTermination(const int signal)
{
    log(LogLevel::INFO, "Terminating on signal: %s", strsignal(signal));
    sendMessage(terminationPublisher, messageBuffer(&signal, sizeof(signal)));
}

Socket MessageLoop::Impl::createTerminationSubscriber()
{
    auto subscriber = Socket {context, SocketType::sub};
    subscriber.set(zmq::sockopt::subscribe, "");
    connectSocket(subscriber, terminationEndpoint);
    return subscriber;
}

MessageLoop::MessageLoop(MessageContext& context) :
    impl {std::make_unique<Impl>(context)}
{
}

MessageLoop::~MessageLoop() = default;

void MessageLoop::addPollable(SharedSocket socket, SocketCallback callback)
{
    assert(impl);
    impl->addPollable(std::move(socket), std::move(callback));
}

void MessageLoop::removePollable(Socket& socket)
{
    assert(impl);
    impl->removePollable(socket);
}

void MessageLoop::run()
{
    assert(impl);
    impl->run();
}

Socket MessageLoop::createTerminationSubscriber()
{
    assert(impl);
    return impl->createTerminationSubscriber();
}

}
}
