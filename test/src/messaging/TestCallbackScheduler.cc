#include "MockCallbackScheduler.hh"

#include <gtest/gtest.h>

#include <functional>
#include <string>

using Wizard::Messaging::MockCallbackScheduler;

using namespace std::chrono_literals;
using namespace testing;

namespace {

class MockCallback
{
public:
    MOCK_METHOD2(call, void(int, const std::string&));
};

}

class CallbackSchedulerTest : public testing::Test
{
protected:
    StrictMock<MockCallbackScheduler> callbackScheduler;
    StrictMock<MockCallback> callback;
};

TEST_F(CallbackSchedulerTest, testCallSoonBindsArguments)
{
    auto scheduled_callback = MockCallbackScheduler::Callback {};
    EXPECT_CALL(callbackScheduler, handleCallLater(0ms, _))
        .WillOnce(SaveArg<1>(&scheduled_callback));
    callbackScheduler.callSoon(
        &MockCallback::call, std::ref(callback), 1, std::string {"soon"});
    EXPECT_CALL(callback, call(1, "soon"));
    scheduled_callback();
}

TEST_F(CallbackSchedulerTest, testCallLaterForwardsTimeout)
{
    auto scheduled_callback = MockCallbackScheduler::Callback {};
    EXPECT_CALL(callbackScheduler, handleCallLater(250ms, _))
        .WillOnce(SaveArg<1>(&scheduled_callback));
    callbackScheduler.callLater(
        250ms, &MockCallback::call, std::ref(callback), 2,
        std::string {"later"});
    EXPECT_CALL(callback, call(2, "later"));
    scheduled_callback();
}

TEST_F(CallbackSchedulerTest, testCallbackIsNotInvokedWhenScheduled)
{
    EXPECT_CALL(callbackScheduler, handleCallLater(_, _));
    callbackScheduler.callSoon(
        &MockCallback::call, std::ref(callback), 3, std::string {"never"});
}
