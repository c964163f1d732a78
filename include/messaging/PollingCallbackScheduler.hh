/** \file
 *
 * \brief Definition of Wizard::Messaging::PollingCallbackScheduler
 */

#ifndef MESSAGING_POLLINGCALLBACKSCHEDULER_HH_
#define MESSAGING_POLLINGCALLBACKSCHEDULER_HH_

#include "messaging/CallbackScheduler.hh"
#include "messaging/Sockets.hh"
#include "Thread.hh"

#include <boost/noncopyable.hpp>

#include <chrono>
#include <cstdint>
#include <map>

namespace Wizard {
namespace Messaging {

/** \brief Execute callbacks in MessageLoop
 *
 * PollingCallbackScheduler is a CallbackScheduler implementation that
 * integrates to MessageLoop by registering a socket that is internally used
 * to notify the scheduler of callbacks that are due.
 *
 * PollingCallbackScheduler creates a worker thread keeping track of the
 * timeouts in the constructor and joins it in the destructor. In order to
 * properly terminate the thread, a termination notification must be
 * published before entering the destructor.
 */
class PollingCallbackScheduler :
    public CallbackScheduler, private boost::noncopyable {
public:

    /** \brief Create new callback scheduler
     *
     * \param context ZeroMQ context
     * \param terminationSubscriber Socket that will receive notification about
     * termination of the thread
     */
    PollingCallbackScheduler(
        MessageContext& context, Socket terminationSubscriber);

    /** \brief Get socket that can be registered to Messaging::MessageLoop
     *
     * The messages sent to the socket are in an internal format. The clients
     * of the class should not try to receive and interpret them.
     */
    SharedSocket getSocket();

    /** \brief Execute due callbacks
     *
     * Receive notifications about due callbacks from \p socket and execute
     * them. This method is intended to be called by a Messaging::MessageLoop
     * instance, using the return value from getSocket() as argument.
     *
     * A callback is removed before being executed, so it is executed only
     * once even if it throws. Exceptions are propagated to the caller.
     *
     * \param socket the socket received from getSocket() call
     */
    void operator()(Socket& socket);

private:

    using CallbackId = std::uint64_t;

    void handleCallLater(
        std::chrono::milliseconds timeout, Callback callback) override;

    Socket frontSocket;
    SharedSocket backSocket;
    std::map<CallbackId, Callback> callbacks;
    CallbackId nextCallbackId {};
    Thread worker;
};

}
}

#endif // MESSAGING_POLLINGCALLBACKSCHEDULER_HH_
