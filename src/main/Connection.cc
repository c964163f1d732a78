#include "main/Connection.hh"

namespace Wizard {
namespace Main {

Connection::~Connection() = default;

const PlayerId& Connection::getId() const
{
    return handleGetId();
}

void Connection::send(const std::string& message)
{
    handleSend(message);
}

void Connection::close()
{
    handleClose();
}

}
}
