/** \file
 *
 * \brief Definition of Wizard::Messaging::MessageLoop class
 */

#ifndef MESSAGING_MESSAGELOOP_HH_
#define MESSAGING_MESSAGELOOP_HH_

#include "messaging/Sockets.hh"

#include <boost/noncopyable.hpp>

#include <functional>
#include <memory>

namespace Wizard {
namespace Messaging {

/** \brief Single threaded event loop over ZeroMQ sockets
 *
 * The server runs everything that touches the game state in one
 * MessageLoop. Each registered socket has a callback that is invoked when the
 * socket becomes readable. The callback is responsible for receiving the
 * message.
 *
 * The loop exits cleanly on SIGINT or SIGTERM. The signals are blocked for
 * the lifetime of the loop object and received synchronously through a
 * signalfd while run() is executing.
 */
class MessageLoop : private boost::noncopyable {
public:

    /** \brief Callback invoked when a registered socket is readable
     */
    using SocketCallback = std::function<void(Socket&)>;

    /** \brief Create new message loop
     *
     * Blocks SIGINT and SIGTERM in the calling thread. Threads started after
     * this inherit the mask, so the signals are only delivered to the loop.
     *
     * \param context the ZeroMQ context
     *
     * \throw std::runtime_error if the signal mask cannot be changed
     */
    explicit MessageLoop(MessageContext& context);

    /** \brief Restore the signal mask
     */
    ~MessageLoop();

    /** \brief Register \p socket and \p callback
     *
     * \throw std::invalid_argument if \p socket or \p callback is empty, or
     * \p socket is already registered
     */
    void addPollable(SharedSocket socket, SocketCallback callback);

    /** \brief Unregister \p socket
     *
     * Does nothing if \p socket was not registered.
     */
    void removePollable(Socket& socket);

    /** \brief Poll the registered sockets until SIGINT or SIGTERM
     *
     * An exception escaping a callback is logged and polling continues.
     */
    void run();

    /** \brief Create socket that receives a message when run() exits
     *
     * Worker threads poll this socket to know when to exit.
     */
    Socket createTerminationSubscriber();

private:

    class Impl;
    const std::unique_ptr<Impl> impl;
};

}
}

#endif // MESSAGING_MESSAGELOOP_HH_
