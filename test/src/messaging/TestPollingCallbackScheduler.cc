#include "messaging/MessageUtility.hh"
#include "messaging/PollingCallbackScheduler.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>

using namespace std::chrono_literals;
using namespace Wizard::Messaging;

namespace {

const auto TERMINATION_ENDPOINT = std::string {"inproc://wizard.test.term"};

class MockCallback {
public:
    MOCK_METHOD1(call, void(int));
};

Socket createTerminationSubscriber(MessageContext& context)
{
    auto socket = Socket {context, SocketType::sub};
    socket.set(zmq::sockopt::subscribe, "");
    connectSocket(socket, TERMINATION_ENDPOINT);
    return socket;
}

// Stops the worker of the scheduler before the scheduler is destroyed
class TerminationPublisher {
public:
    explicit TerminationPublisher(MessageContext& context) :
        socket {context, SocketType::pub}
    {
        bindSocket(socket, TERMINATION_ENDPOINT);
    }

    ~TerminationPublisher()
    {
        sendEmptyMessage(socket);
    }

private:
    Socket socket;
};

}

class PollingCallbackSchedulerTest : public testing::Test {
protected:
    void pollAndExecuteCallbacks()
    {
        auto socket = scheduler.getSocket();
        auto pollitems = std::array {
            Pollitem { socket->handle(), 0, ZMQ_POLLIN, 0 }
        };
        pollSockets(pollitems, 200ms);
        ASSERT_TRUE(pollitems[0].revents & ZMQ_POLLIN);
        scheduler(*socket);
    }

    MessageContext context;
    testing::StrictMock<MockCallback> callback;
    PollingCallbackScheduler scheduler {
        context, createTerminationSubscriber(context)};
    TerminationPublisher terminationPublisher {context};
};

TEST_F(PollingCallbackSchedulerTest, testCallSoonPassesArguments)
{
    EXPECT_CALL(callback, call(7));
    scheduler.callSoon(&MockCallback::call, std::ref(callback), 7);
    pollAndExecuteCallbacks();
}

TEST_F(PollingCallbackSchedulerTest, testCallSoonPreservesOrder)
{
    {
        testing::InSequence sequence;
        EXPECT_CALL(callback, call(1));
        EXPECT_CALL(callback, call(2));
    }
    scheduler.callSoon(&MockCallback::call, std::ref(callback), 1);
    scheduler.callSoon(&MockCallback::call, std::ref(callback), 2);
    pollAndExecuteCallbacks();
    pollAndExecuteCallbacks();
}

TEST_F(PollingCallbackSchedulerTest, testExceptionPropagatesFromCallback)
{
    EXPECT_CALL(callback, call(3))
        .WillOnce(testing::Throw(std::runtime_error {"error"}));
    scheduler.callSoon(&MockCallback::call, std::ref(callback), 3);
    EXPECT_THROW(pollAndExecuteCallbacks(), std::runtime_error);
}

TEST_F(PollingCallbackSchedulerTest, testCallLaterWaitsForTimeout)
{
    EXPECT_CALL(callback, call(4));
    const auto start = std::chrono::steady_clock::now();
    scheduler.callLater(40ms, &MockCallback::call, std::ref(callback), 4);
    pollAndExecuteCallbacks();
    EXPECT_GE(std::chrono::steady_clock::now() - start, 35ms);
}

TEST_F(PollingCallbackSchedulerTest, testCallLaterOrdersByDeadline)
{
    {
        testing::InSequence sequence;
        EXPECT_CALL(callback, call(1));
        EXPECT_CALL(callback, call(2));
    }
    scheduler.callLater(40ms, &MockCallback::call, std::ref(callback), 2);
    scheduler.callLater(10ms, &MockCallback::call, std::ref(callback), 1);
    pollAndExecuteCallbacks();
    pollAndExecuteCallbacks();
}
