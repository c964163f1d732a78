#include "Logging.hh"

#include <gtest/gtest.h>

#include <iostream>
#include <sstream>
#include <string>

using Wizard::LogLevel;

namespace {
using namespace std::string_view_literals;
constexpr auto MESSAGE = "A trick was played"sv;
}

class LoggingTest : public testing::Test {
protected:
    virtual void SetUp()
    {
        setupLogging(LogLevel::WARNING, stream);
    }

    virtual void TearDown()
    {
        setupLogging(LogLevel::NONE, std::cerr);
    }

    std::ostringstream stream;
};

TEST_F(LoggingTest, testLoggingWithTriggeringLevel)
{
    setupLogging(LogLevel::INFO, stream);
    log(LogLevel::INFO, "round %d: %s"sv, 3, MESSAGE);
    EXPECT_NE(std::string::npos, stream.str().find(MESSAGE));
    EXPECT_NE(std::string::npos, stream.str().find("round 3"));
}

TEST_F(LoggingTest, testLoggingBelowLevel)
{
    log(LogLevel::DEBUG, "%s"sv, MESSAGE);
    EXPECT_TRUE(stream.str().empty());
}

TEST_F(LoggingTest, testLoggingWithLevelNone)
{
    setupLogging(LogLevel::NONE, stream);
    log(LogLevel::FATAL, "%s"sv, MESSAGE);
    EXPECT_TRUE(stream.str().empty());
}

TEST_F(LoggingTest, testLoggingWithMissingFormatSpecifier)
{
    log(LogLevel::WARNING, ""sv, MESSAGE);
    EXPECT_EQ(std::string::npos, stream.str().find(MESSAGE));
}

TEST_F(LoggingTest, testVerbosity)
{
    EXPECT_EQ(LogLevel::WARNING, Wizard::getLogLevel(0));
    EXPECT_EQ(LogLevel::INFO, Wizard::getLogLevel(1));
    EXPECT_EQ(LogLevel::DEBUG, Wizard::getLogLevel(2));
}
