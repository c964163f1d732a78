/** \file
 *
 * \brief Definition of Wizard::Main::WizardMain class
 */

#ifndef MAIN_WIZARDMAIN_HH_
#define MAIN_WIZARDMAIN_HH_

#include "messaging/Sockets.hh"

#include <memory>

namespace Wizard {

/** \brief The glue code and high level logic for the Wizard server
 *
 * The main class WizardMain is responsible for setting up the server
 * application.
 */
namespace Main {

class Config;

/** \brief Set up and run the Wizard server
 *
 * When constructed, WizardMain binds a ZeroMQ router socket to the endpoint
 * from the configuration and creates a session room. Each message from the
 * clients consists of the routing identity, an empty delimiter frame and the
 * payload. The first message from an unknown routing identity opens a
 * connection, and an empty payload closes it. The server closes a connection
 * by sending an empty payload.
 *
 * When the room releases itself because of inactivity, a fresh room is
 * created in its place.
 *
 * The server starts processing messages when run() is called. The destructor
 * closes sockets and cleans up the application.
 *
 * \sa \ref wizardprotocol
 */
class WizardMain {
public:

    /** \brief Create Wizard server
     *
     * \param context the ZeroMQ context
     * \param config the application configurations
     */
    WizardMain(Messaging::MessageContext& context, Config config);

    ~WizardMain();

    /** \brief Start receiving and handling messages
     *
     * This method blocks until SIGINT or SIGTERM is received.
     */
    void run();

private:

    class Impl;
    const std::unique_ptr<Impl> impl;
};

}
}

#endif // MAIN_WIZARDMAIN_HH_
