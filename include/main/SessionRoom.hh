/** \file
 *
 * \brief Definition of Wizard::Main::SessionRoom class
 */

#ifndef MAIN_SESSIONROOM_HH_
#define MAIN_SESSIONROOM_HH_

#include "engine/WizardEngine.hh"
#include "main/RoomConfig.hh"
#include "wizard/PlayerId.hh"
#include "wizard/Random.hh"

#include <boost/core/noncopyable.hpp>

#include <functional>
#include <memory>
#include <string_view>

namespace Wizard {

namespace Messaging {
class CallbackScheduler;
}

namespace Main {

class Connection;

/** \brief A single match and the clients taking part in it
 *
 * SessionRoom owns the WizardEngine of one match and the connections of the
 * clients viewing it. It translates the messages described in \ref
 * wizardprotocol to engine operations, plays the turns of bots and
 * disconnected players, and sends every viewer its own projection of the
 * state after each change.
 *
 * The room is driven from a single thread: the transport calls the handle
 * methods and the callback scheduler executes delayed callbacks, all from the
 * same message loop. Consequently no two operations on the match interleave.
 *
 * Delays between a full trick, its evaluation and the end of the round, and
 * before automatic moves, are implemented with the callback scheduler. A
 * periodic check releases the room if no message has been received for the
 * configured time.
 */
class SessionRoom : private boost::noncopyable {
public:

    /** \brief Callback invoked when the room releases itself
     */
    using ReleaseCallback = std::function<void()>;

    /** \brief Create new session room
     *
     * \param rng the random number generator used for dealing and for the
     * decisions of the bots. It must outlive the room.
     * \param callbackScheduler the callback scheduler used for the delays
     * \param config the tunable parameters of the room
     * \param onRelease the callback invoked after the room has closed the
     * connections because of inactivity
     */
    SessionRoom(
        Rng& rng,
        std::shared_ptr<Messaging::CallbackScheduler> callbackScheduler,
        RoomConfig config = {},
        ReleaseCallback onRelease = {});

    ~SessionRoom();

    /** \brief Handle a new connection
     *
     * The connection receives replies, but no broadcasts until the client
     * joins or spectates.
     */
    void handleOpen(std::shared_ptr<Connection> connection);

    /** \brief Handle a message from a client
     *
     * Errors never escape this method. A rejected or malformed message is
     * answered with an error message to the sender.
     *
     * \param connectionId the identifier of the sending connection
     * \param payload the JSON payload
     */
    void handleMessage(const PlayerId& connectionId, std::string_view payload);

    /** \brief Handle a connection closed by the client
     *
     * Before the match starts, a player leaving the room is removed. After
     * the start the seat stays in the match and is played automatically.
     */
    void handleClose(const PlayerId& connectionId);

    /** \brief Handle a transport error on a connection
     *
     * The connection is dropped as in handleClose().
     */
    void handleError(const PlayerId& connectionId);

    /** \brief Get the engine of the match
     */
    const Engine::WizardEngine& getEngine() const;

    /** \brief Determine if the room has been released
     *
     * A released room ignores all input.
     */
    bool isReleased() const;

    class Impl;

private:

    const std::shared_ptr<Impl> impl;
};

}
}

#endif // MAIN_SESSIONROOM_HH_
