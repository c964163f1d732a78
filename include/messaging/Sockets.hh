/** \file
 *
 * \brief ZeroMQ types and thin wrappers used by the Wizard server
 *
 * The server talks to its clients through a ROUTER socket, and uses inproc
 * PAIR and PUB/SUB sockets between the message loop and the callback
 * scheduler thread. All of them go through cppzmq.
 */

#ifndef MESSAGING_SOCKETS_HH_
#define MESSAGING_SOCKETS_HH_

#include <chrono>
#include <memory>
#include <ranges>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <zmq.hpp>

namespace Wizard {
namespace Messaging {

using MessageContext = zmq::context_t;  ///< \brief ZeroMQ context
using Socket = zmq::socket_t;           ///< \brief ZeroMQ socket
using SocketType = zmq::socket_type;    ///< \brief ZeroMQ socket type
using SharedSocket = std::shared_ptr<Socket>;  ///< \brief Shared socket
using Message = zmq::message_t;         ///< \brief ZeroMQ message frame
using SocketError = zmq::error_t;       ///< \brief ZeroMQ error
using Pollitem = zmq::pollitem_t;       ///< \brief Item for pollSockets()

/** \brief Create a buffer view of \p args for sending or receiving
 */
template<typename... Args>
constexpr auto messageBuffer(Args&&... args)
{
    return zmq::buffer(std::forward<Args>(args)...);
}

/** \brief Create socket with shared ownership
 */
template<typename... Args>
SharedSocket makeSharedSocket(Args&&... args)
{
    return std::make_shared<Socket>(std::forward<Args>(args)...);
}

/** \brief Bind \p socket to \p endpoint
 *
 * \throw SocketError if binding fails
 */
inline void bindSocket(Socket& socket, const std::string_view endpoint)
{
    socket.bind(std::string {endpoint});
}

/** \brief Connect \p socket to \p endpoint
 *
 * \throw SocketError if connecting fails
 */
inline void connectSocket(Socket& socket, const std::string_view endpoint)
{
    socket.connect(std::string {endpoint});
}

/** \brief Determine if a message can be received from \p socket without
 * blocking
 */
inline bool hasIncomingMessage(const Socket& socket)
{
    return (socket.get(zmq::sockopt::events) & ZMQ_POLLIN) != 0;
}

/** \brief Poll \p pollitems
 *
 * \param pollitems contiguous range of Pollitem objects
 * \param timeout the maximum time to wait, or negative to wait indefinitely
 *
 * \return the number of items with events
 */
template<std::ranges::contiguous_range Pollitems>
int pollSockets(
    Pollitems& pollitems,
    const std::chrono::milliseconds timeout = std::chrono::milliseconds {-1})
{
    return zmq::poll(
        std::ranges::data(pollitems), std::ranges::size(pollitems), timeout);
}

/** \brief Send one frame with blocking I/O
 *
 * \param socket the socket
 * \param message Message or buffer
 * \param more whether more frames of the same message follow
 *
 * \throw std::runtime_error if the send would have blocked
 */
template<typename MessageLike>
void sendMessage(Socket& socket, MessageLike&& message, const bool more = false)
{
    const auto flags = more ? zmq::send_flags::sndmore : zmq::send_flags::none;
    if (!socket.send(std::forward<MessageLike>(message), flags)) {
        throw std::runtime_error {"Send on blocking socket returned EAGAIN"};
    }
}

/** \brief Receive one frame with blocking I/O
 *
 * \param socket the socket
 * \param message Message or buffer
 *
 * \return the result of the receive, the size for a Message and the buffer
 * size information for a buffer
 *
 * \throw std::runtime_error if the receive would have blocked
 */
template<typename MessageLike>
auto recvMessage(Socket& socket, MessageLike&& message)
{
    const auto result = socket.recv(
        std::forward<MessageLike>(message), zmq::recv_flags::none);
    if (!result) {
        throw std::runtime_error {"Receive on blocking socket returned EAGAIN"};
    }
    return *result;
}

}
}

#endif // MESSAGING_SOCKETS_HH_
