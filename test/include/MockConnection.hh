#ifndef MOCKCONNECTION_HH_
#define MOCKCONNECTION_HH_

#include "main/Connection.hh"

#include <gmock/gmock.h>

#include <string>
#include <utility>

namespace Wizard {
namespace Main {

class MockConnection : public Connection
{
public:
    explicit MockConnection(PlayerId id) : id {std::move(id)} {}
    MOCK_METHOD1(handleSend, void(const std::string&));
    MOCK_METHOD0(handleClose, void());

private:
    const PlayerId& handleGetId() const override { return id; }

    const PlayerId id;
};

}
}

#endif // MOCKCONNECTION_HH_
