#include "wizard/UuidGenerator.hh"

#include <boost/uuid/uuid_io.hpp>

namespace Wizard {

UuidGenerator& getUuidGenerator()
{
    static UuidGenerator uuidGenerator {&getRng()};
    return uuidGenerator;
}

Uuid generateUuid()
{
    return getUuidGenerator()();
}

PlayerId generatePlayerId()
{
    return boost::uuids::to_string(generateUuid());
}

}
