#include "messaging/MessageLoop.hh"
#include "messaging/MessageUtility.hh"
#include "messaging/Sockets.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <csignal>
#include <stdexcept>
#include <string>

using namespace Wizard::Messaging;
using namespace std::chrono_literals;

using testing::_;
using testing::Ref;
using testing::Invoke;

namespace {
const auto PING = std::string {"ping"};
const auto PONG = std::string {"pong"};
const auto FIRST_ENDPOINT = std::string {"inproc://wizard.test.loop1"};
const auto SECOND_ENDPOINT = std::string {"inproc://wizard.test.loop2"};

std::string recvString(Socket& socket)
{
    auto msg = Message {};
    recvMessage(socket, msg);
    EXPECT_FALSE(msg.more());
    return messageToString(msg);
}

}

class MessageLoopTest : public testing::Test {
protected:
    void SetUp() override
    {
        bindSocket(*firstBack, FIRST_ENDPOINT);
        connectSocket(firstFront, FIRST_ENDPOINT);
        bindSocket(*secondBack, SECOND_ENDPOINT);
        connectSocket(secondFront, SECOND_ENDPOINT);
        loop.addPollable(
            firstBack, [this](auto& socket) { firstCallback.Call(socket); });
        loop.addPollable(
            secondBack, [this](auto& socket) { secondCallback.Call(socket); });
    }

    void terminateAfterReceiving(Socket& socket, const std::string& expected)
    {
        EXPECT_EQ(expected, recvString(socket));
        std::raise(SIGTERM);
    }

    MessageContext context;
    Socket firstFront {context, SocketType::pair};
    Socket secondFront {context, SocketType::pair};
    SharedSocket firstBack {makeSharedSocket(context, SocketType::pair)};
    SharedSocket secondBack {makeSharedSocket(context, SocketType::pair)};
    testing::StrictMock<testing::MockFunction<void(Socket&)>> firstCallback;
    testing::StrictMock<testing::MockFunction<void(Socket&)>> secondCallback;
    MessageLoop loop {context};
};

TEST_F(MessageLoopTest, testCallbackIsInvokedForIncomingMessage)
{
    EXPECT_CALL(firstCallback, Call(Ref(*firstBack)))
        .WillOnce(
            Invoke(
                [this](auto& socket) { terminateAfterReceiving(socket, PING); }));
    sendMessage(firstFront, messageBuffer(PING));
    loop.run();
}

TEST_F(MessageLoopTest, testCallbacksForDifferentSockets)
{
    EXPECT_CALL(firstCallback, Call(Ref(*firstBack)))
        .WillOnce(
            Invoke(
                [this](auto& socket)
                {
                    EXPECT_EQ(PING, recvString(socket));
                    sendMessage(secondFront, messageBuffer(PONG));
                }));
    EXPECT_CALL(secondCallback, Call(Ref(*secondBack)))
        .WillOnce(
            Invoke(
                [this](auto& socket) { terminateAfterReceiving(socket, PONG); }));
    sendMessage(firstFront, messageBuffer(PING));
    loop.run();
}

TEST_F(MessageLoopTest, testTerminationIsPublished)
{
    EXPECT_CALL(firstCallback, Call(Ref(*firstBack)))
        .WillOnce(
            Invoke(
                [this](auto& socket) { terminateAfterReceiving(socket, PING); }));
    auto subscriber = loop.createTerminationSubscriber();
    sendMessage(firstFront, messageBuffer(PING));
    loop.run();
    auto pollitems = std::array {
        Pollitem { subscriber.handle(), 0, ZMQ_POLLIN, 0 }
    };
    pollSockets(pollitems, 100ms);
    EXPECT_TRUE(pollitems[0].revents & ZMQ_POLLIN);
}

TEST_F(MessageLoopTest, testRemovedSocketIsNotPolled)
{
    loop.removePollable(*firstBack);
    EXPECT_CALL(firstCallback, Call(_)).Times(0);
    EXPECT_CALL(secondCallback, Call(Ref(*secondBack)))
        .WillOnce(
            Invoke(
                [this](auto& socket) { terminateAfterReceiving(socket, PONG); }));
    sendMessage(firstFront, messageBuffer(PING));
    sendMessage(secondFront, messageBuffer(PONG));
    loop.run();
}

TEST_F(MessageLoopTest, testAddingSocketTwiceFails)
{
    EXPECT_THROW(
        loop.addPollable(firstBack, [](auto&) {}), std::invalid_argument);
}

TEST_F(MessageLoopTest, testAddingEmptySocketFails)
{
    EXPECT_THROW(
        loop.addPollable(nullptr, [](auto&) {}), std::invalid_argument);
}

TEST_F(MessageLoopTest, testExceptionFromCallbackDoesNotStopLoop)
{
    EXPECT_CALL(firstCallback, Call(Ref(*firstBack)))
        .WillOnce(
            Invoke(
                [this](auto& socket)
                {
                    EXPECT_EQ(PING, recvString(socket));
                    sendMessage(secondFront, messageBuffer(PONG));
                    throw std::runtime_error {"callback failed"};
                }));
    EXPECT_CALL(secondCallback, Call(Ref(*secondBack)))
        .WillOnce(
            Invoke(
                [this](auto& socket) { terminateAfterReceiving(socket, PONG); }));
    sendMessage(firstFront, messageBuffer(PING));
    loop.run();
}
