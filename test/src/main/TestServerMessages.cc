#include "main/ServerMessages.hh"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using nlohmann::json;
using namespace Wizard;
using namespace Wizard::Main;

TEST(ServerMessagesTest, testErrorMessage)
{
    EXPECT_EQ(
        (json {{"type", "error"}, {"message", "Invalid bid"}}),
        json::parse(makeErrorMessage("Invalid bid")));
}

TEST(ServerMessagesTest, testPlayerJoinedMessage)
{
    EXPECT_EQ(
        (json {
            {"type", "player_joined"}, {"id", "p1"}, {"name", "Alice"},
            {"isSpectator", true}}),
        json::parse(makePlayerJoinedMessage("p1", "Alice", true)));
}

TEST(ServerMessagesTest, testCardPlayedMessage)
{
    auto card = Card {Suit::SPADES, 13};
    card.playedBy = "p2";
    const auto j = json::parse(makeCardPlayedMessage("p2", card));
    EXPECT_EQ("card_played", j.at("type"));
    EXPECT_EQ("p2", j.at("playerId"));
    EXPECT_EQ("spades", j.at("card").at("suit"));
    EXPECT_EQ(13, j.at("card").at("value"));
}

TEST(ServerMessagesTest, testRoundEndedMessage)
{
    const auto j = json::parse(
        makeRoundEndedMessage({{"p1", 30}, {"p2", -10}}));
    EXPECT_EQ("round_ended", j.at("type"));
    EXPECT_EQ((json {{"p1", 30}, {"p2", -10}}), j.at("scores"));
}

TEST(ServerMessagesTest, testGameStateMessage)
{
    auto state = Engine::MatchState {};
    state.phase = Engine::Phase::FINISHED;
    const auto j = json::parse(makeGameStateMessage(state));
    EXPECT_EQ("game_state", j.at("type"));
    EXPECT_EQ("finished", j.at("state").at("phase"));
}
