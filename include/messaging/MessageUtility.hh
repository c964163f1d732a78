/** \file
 *
 * \brief Helpers for framed ZeroMQ messages
 *
 * A client request arriving at the ROUTER socket of the server consists of
 * the routing identity, an empty delimiter frame and the payload. These
 * helpers receive and send such multipart messages frame by frame.
 */

#ifndef MESSAGING_MESSAGEUTILITY_HH_
#define MESSAGING_MESSAGEUTILITY_HH_

#include "messaging/Sockets.hh"

#include <string>
#include <vector>

namespace Wizard {
namespace Messaging {

/** \brief Send an empty frame
 *
 * \param socket the socket
 * \param more whether more frames of the same message follow
 */
inline void sendEmptyMessage(Socket& socket, const bool more = false)
{
    sendMessage(socket, Message {}, more);
}

/** \brief Receive and drop the remaining frames of the current message
 *
 * At least one frame is received.
 *
 * \return the number of frames dropped
 */
inline int discardMessage(Socket& socket)
{
    auto n_frames = 0;
    auto frame = Message {};
    do {
        recvMessage(socket, frame);
        ++n_frames;
    } while (frame.more());
    return n_frames;
}

/** \brief Receive a multipart message
 *
 * The frames of the next message are appended to \p frames. Frames after
 * \p maximumFrames are received and dropped, so that the next call starts
 * from a new message.
 *
 * \param socket the socket
 * \param frames the vector the frames are appended to
 * \param maximumFrames the maximum number of frames kept
 *
 * \return the number of frames in the message, including the dropped ones
 */
inline int recvMultipart(
    Socket& socket, std::vector<Message>& frames, const int maximumFrames)
{
    auto n_frames = 0;
    auto more = true;
    while (more && n_frames < maximumFrames) {
        auto& frame = frames.emplace_back();
        recvMessage(socket, frame);
        more = frame.more();
        ++n_frames;
    }
    if (more) {
        n_frames += discardMessage(socket);
    }
    return n_frames;
}

/** \brief Copy the contents of \p message into a string
 */
inline std::string messageToString(const Message& message)
{
    return message.to_string();
}

}
}

#endif // MESSAGING_MESSAGEUTILITY_HH_
