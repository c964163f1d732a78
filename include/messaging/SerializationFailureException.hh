/** \file
 *
 * \brief Definition of Wizard::Messaging::SerializationFailureException class
 */

#ifndef MESSAGING_SERIALIZATIONFAILUREEXCEPTION_HH_
#define MESSAGING_SERIALIZATIONFAILUREEXCEPTION_HH_

#include <stdexcept>

namespace Wizard {
namespace Messaging {

/** \brief Exception to indicate error in serialization or deserialization
 *
 * This non-fatal exception signals that a message could not be converted to
 * or from its JSON representation. The session room answers it with an error
 * message to the client.
 */
class SerializationFailureException : public std::runtime_error {
public:

    /** \brief Create new serialization failure exception
     *
     * \param what description of the failure
     */
    explicit SerializationFailureException(
        const char* what = "Serialization failure") :
        std::runtime_error {what}
    {
    }
};

}
}

#endif // MESSAGING_SERIALIZATIONFAILUREEXCEPTION_HH_
