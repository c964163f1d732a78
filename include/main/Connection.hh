/** \file
 *
 * \brief Definition of Wizard::Main::Connection interface
 */

#ifndef MAIN_CONNECTION_HH_
#define MAIN_CONNECTION_HH_

#include "wizard/PlayerId.hh"

#include <string>

namespace Wizard {
namespace Main {

/** \brief A bidirectional message channel to a single client
 *
 * The transport creates one connection for each client and hands it to the
 * SessionRoom. The identifier of the connection doubles as the identifier of
 * the player or spectator the client becomes.
 */
class Connection {
public:

    virtual ~Connection();

    /** \brief Get the unique identifier of the connection
     */
    const PlayerId& getId() const;

    /** \brief Send a message to the client
     *
     * \param message the serialized message
     */
    void send(const std::string& message);

    /** \brief Close the connection from the server side
     */
    void close();

private:

    /** \brief Handle for getId()
     */
    virtual const PlayerId& handleGetId() const = 0;

    /** \brief Handle for send()
     */
    virtual void handleSend(const std::string& message) = 0;

    /** \brief Handle for close()
     */
    virtual void handleClose() = 0;
};

}
}

#endif // MAIN_CONNECTION_HH_
