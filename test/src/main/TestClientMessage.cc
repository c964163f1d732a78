#include "main/ClientMessage.hh"
#include "messaging/SerializationFailureException.hh"

#include <gtest/gtest.h>

#include <variant>

using namespace Wizard::Main;
using Wizard::Messaging::SerializationFailureException;

TEST(ClientMessageTest, testJoin)
{
    const auto message = parseClientMessage(
        R"({"type":"join","name":"Alice"})");
    const auto* join = std::get_if<JoinRequest>(&message);
    ASSERT_TRUE(join);
    EXPECT_EQ("Alice", join->name);
}

TEST(ClientMessageTest, testSpectate)
{
    const auto message = parseClientMessage(
        R"({"type":"spectate","name":"Sam"})");
    const auto* spectate = std::get_if<SpectateRequest>(&message);
    ASSERT_TRUE(spectate);
    EXPECT_EQ("Sam", spectate->name);
}

TEST(ClientMessageTest, testCommandsWithoutArguments)
{
    EXPECT_TRUE(
        std::holds_alternative<StartGameRequest>(
            parseClientMessage(R"({"type":"start_game"})")));
    EXPECT_TRUE(
        std::holds_alternative<AddBotRequest>(
            parseClientMessage(R"({"type":"add_bot"})")));
}

TEST(ClientMessageTest, testPlaceBid)
{
    const auto message = parseClientMessage(
        R"({"type":"place_bid","bid":2})");
    const auto* bid = std::get_if<PlaceBidRequest>(&message);
    ASSERT_TRUE(bid);
    EXPECT_EQ(2, bid->bid);
}

TEST(ClientMessageTest, testPlayCard)
{
    const auto message = parseClientMessage(
        R"({"type":"play_card","cardIndex":0})");
    const auto* play = std::get_if<PlayCardRequest>(&message);
    ASSERT_TRUE(play);
    EXPECT_EQ(0, play->cardIndex);
}

TEST(ClientMessageTest, testExtraFieldsAreIgnored)
{
    EXPECT_TRUE(
        std::holds_alternative<StartGameRequest>(
            parseClientMessage(R"({"type":"start_game","force":true})")));
}

TEST(ClientMessageTest, testMalformedJson)
{
    EXPECT_THROW(
        parseClientMessage("{not json"), SerializationFailureException);
}

TEST(ClientMessageTest, testNotAnObject)
{
    EXPECT_THROW(
        parseClientMessage(R"(["join"])"), SerializationFailureException);
}

TEST(ClientMessageTest, testUnknownType)
{
    EXPECT_THROW(
        parseClientMessage(R"({"type":"resign"})"),
        SerializationFailureException);
}

TEST(ClientMessageTest, testMissingType)
{
    EXPECT_THROW(
        parseClientMessage(R"({"name":"Alice"})"),
        SerializationFailureException);
}

TEST(ClientMessageTest, testMissingArgument)
{
    EXPECT_THROW(
        parseClientMessage(R"({"type":"join"})"),
        SerializationFailureException);
    EXPECT_THROW(
        parseClientMessage(R"({"type":"place_bid"})"),
        SerializationFailureException);
}

TEST(ClientMessageTest, testWrongArgumentType)
{
    EXPECT_THROW(
        parseClientMessage(R"({"type":"join","name":5})"),
        SerializationFailureException);
    EXPECT_THROW(
        parseClientMessage(R"({"type":"place_bid","bid":"two"})"),
        SerializationFailureException);
    EXPECT_THROW(
        parseClientMessage(R"({"type":"play_card","cardIndex":1.5})"),
        SerializationFailureException);
    EXPECT_THROW(
        parseClientMessage(R"({"type":"place_bid","bid":4294967296})"),
        SerializationFailureException);
    EXPECT_THROW(
        parseClientMessage(R"({"type":"place_bid","bid":-2147483649})"),
        SerializationFailureException);
    EXPECT_THROW(
        parseClientMessage(R"({"type":"play_card","cardIndex":2147483648})"),
        SerializationFailureException);
}
