#include "main/Config.hh"

#include <gtest/gtest.h>

#include <chrono>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace std::chrono_literals;
using namespace std::string_literals;

using Wizard::Main::Config;
using Wizard::Main::configFromPath;

class ConfigTest : public testing::Test {
protected:
    std::istringstream in;

    void assertThrows()
    {
        auto f = [this]() { static_cast<void>(Config {in}); };
        EXPECT_THROW(f(), std::runtime_error);
    }
};

TEST_F(ConfigTest, testBadStream)
{
    in.setstate(std::ios::failbit);
    assertThrows();
}

TEST_F(ConfigTest, testBadSyntax)
{
    in.str("this is invalid"s);
    assertThrows();
}

TEST_F(ConfigTest, testRuntimeError)
{
    in.str("error(\"config failed\")"s);
    assertThrows();
}

TEST_F(ConfigTest, testDefaults)
{
    const auto config = Config {in};
    EXPECT_EQ("tcp://*:5555"s, config.getBindEndpoint());
    const auto& room_config = config.getRoomConfig();
    EXPECT_EQ(3, room_config.minPlayers);
    EXPECT_EQ(500ms, room_config.botDelay);
    EXPECT_EQ(1500ms, room_config.trickDelay);
    EXPECT_EQ(2000ms, room_config.roundDelay);
    EXPECT_EQ(30min, room_config.inactivityTimeout);
    EXPECT_EQ(1min, room_config.inactivityCheckInterval);
    EXPECT_FALSE(config.getSeed());
}

TEST_F(ConfigTest, testDefaultConstructedConfig)
{
    const auto config = configFromPath("");
    EXPECT_EQ("tcp://*:5555"s, config.getBindEndpoint());
    EXPECT_EQ(3, config.getRoomConfig().minPlayers);
}

TEST_F(ConfigTest, testParseAllValues)
{
    in.str(R"EOF(
bind_endpoint = "tcp://127.0.0.1:6000"
min_players = 4
bot_delay_ms = 10
trick_delay_ms = 20
round_delay_ms = 30
inactivity_timeout_s = 120
inactivity_check_interval_s = 15
seed = 42
)EOF"s);
    const auto config = Config {in};
    EXPECT_EQ("tcp://127.0.0.1:6000"s, config.getBindEndpoint());
    const auto& room_config = config.getRoomConfig();
    EXPECT_EQ(4, room_config.minPlayers);
    EXPECT_EQ(10ms, room_config.botDelay);
    EXPECT_EQ(20ms, room_config.trickDelay);
    EXPECT_EQ(30ms, room_config.roundDelay);
    EXPECT_EQ(120s, room_config.inactivityTimeout);
    EXPECT_EQ(15s, room_config.inactivityCheckInterval);
    EXPECT_EQ(42u, config.getSeed());
}

TEST_F(ConfigTest, testValuesComputedByScript)
{
    in.str(R"EOF(
local base = 100
bot_delay_ms = base * 2
bind_endpoint = "tcp://*:" .. (5000 + 1)
)EOF"s);
    const auto config = Config {in};
    EXPECT_EQ(200ms, config.getRoomConfig().botDelay);
    EXPECT_EQ("tcp://*:5001"s, config.getBindEndpoint());
}

TEST_F(ConfigTest, testMinPlayersIsClamped)
{
    in.str("min_players = 1"s);
    EXPECT_EQ(2, Config {in}.getRoomConfig().minPlayers);
    in.clear();
    in.str("min_players = 10"s);
    EXPECT_EQ(6, Config {in}.getRoomConfig().minPlayers);
}

TEST_F(ConfigTest, testNegativeDelayIsIgnored)
{
    in.str("bot_delay_ms = -5"s);
    EXPECT_EQ(500ms, Config {in}.getRoomConfig().botDelay);
}

TEST_F(ConfigTest, testZeroCheckIntervalIsIgnored)
{
    in.str("inactivity_check_interval_s = 0\nbot_delay_ms = 0"s);
    const auto config = Config {in};
    EXPECT_EQ(1min, config.getRoomConfig().inactivityCheckInterval);
    EXPECT_EQ(0ms, config.getRoomConfig().botDelay);
}

TEST_F(ConfigTest, testWrongTypesAreIgnored)
{
    in.str(R"EOF(
bind_endpoint = 5
min_players = "many"
)EOF"s);
    const auto config = Config {in};
    EXPECT_EQ("tcp://*:5555"s, config.getBindEndpoint());
    EXPECT_EQ(3, config.getRoomConfig().minPlayers);
}
