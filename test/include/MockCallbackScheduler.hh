#ifndef MOCKCALLBACKSCHEDULER_HH_
#define MOCKCALLBACKSCHEDULER_HH_

#include "messaging/CallbackScheduler.hh"

#include <gmock/gmock.h>

namespace Wizard {
namespace Messaging {

class MockCallbackScheduler : public CallbackScheduler
{
public:
    MOCK_METHOD2(handleCallLater, void(std::chrono::milliseconds, Callback));
};

}
}

#endif // MOCKCALLBACKSCHEDULER_HH_
