#include "Logging.hh"

#include <gtest/gtest.h>

#include <iostream>
#include <sstream>
#include <string>
#include <thread>

namespace {
using namespace std::string_view_literals;
constexpr auto MESSAGE = "This is logging"sv;
}

class LoggingTest : public testing::Test {
protected:
    virtual void SetUp()
    {
        setupLogging(Uno::LogLevel::WARNING, stream);
    }

    virtual void TearDown()
    {
        setupLogging(Uno::LogLevel::NONE, std::cerr);
    }

    std::ostringstream stream;
};

TEST_F(LoggingTest, testLoggingWithTriggeringLevel)
{
    setupLogging(Uno::LogLevel::INFO, stream);
    log(Uno::LogLevel::INFO, "format %s format"sv, MESSAGE);
    EXPECT_NE(std::string::npos, stream.str().find(MESSAGE));
}

TEST_F(LoggingTest, testLoggingBelowLevel)
{
    log(Uno::LogLevel::DEBUG, "%s"sv, MESSAGE);
    EXPECT_TRUE(stream.str().empty());
}

TEST_F(LoggingTest, testLoggingWithLevelNone)
{
    setupLogging(Uno::LogLevel::NONE, stream);
    log(Uno::LogLevel::FATAL, "%s"sv, MESSAGE);
    EXPECT_TRUE(stream.str().empty());
}

TEST_F(LoggingTest, testLoggingWithMissingFormatSpecifier)
{
    log(Uno::LogLevel::WARNING, ""sv, MESSAGE);
    EXPECT_EQ(std::string::npos, stream.str().find(MESSAGE));
}

TEST_F(LoggingTest, testLoggingWithInvalidFormatSpecifier)
{
    log(Uno::LogLevel::WARNING, "%"sv, MESSAGE);
    EXPECT_EQ(std::string::npos, stream.str().find(MESSAGE));
}

TEST_F(LoggingTest, testLoggingMultipleArguments)
{
    log(Uno::LogLevel::WARNING, "%d of %d"sv, 3, 4);
    EXPECT_NE(std::string::npos, stream.str().find("3 of 4"));
}

TEST_F(LoggingTest, testVerbosity)
{
    EXPECT_EQ(Uno::LogLevel::WARNING, Uno::getLogLevel(0));
    EXPECT_EQ(Uno::LogLevel::INFO, Uno::getLogLevel(1));
    EXPECT_EQ(Uno::LogLevel::DEBUG, Uno::getLogLevel(2));
}

TEST_F(LoggingTest, testLogLevelFromString)
{
    EXPECT_EQ(Uno::LogLevel::NONE, Uno::logLevelFromString("none"));
    EXPECT_EQ(Uno::LogLevel::ERROR, Uno::logLevelFromString("error"));
    EXPECT_EQ(Uno::LogLevel::DEBUG, Uno::logLevelFromString("debug"));
    EXPECT_FALSE(Uno::logLevelFromString("verbose"));
}

TEST_F(LoggingTest, testLoggingFromMultipleThreads)
{
    const auto write = [](const int thread)
    {
        for (auto n = 0; n < 500; ++n) {
            log(Uno::LogLevel::WARNING, "thread %d message %d end"sv,
                thread, n);
        }
    };
    auto thread1 = std::thread {write, 1};
    auto thread2 = std::thread {write, 2};
    thread1.join();
    thread2.join();

    auto lines = 0;
    auto in = std::istringstream {stream.str()};
    for (auto line = std::string {}; std::getline(in, line); ++lines) {
        EXPECT_NE(std::string::npos, line.find("WARNING thread ")) << line;
        EXPECT_TRUE(line.ends_with(" end")) << line;
    }
    EXPECT_EQ(1000, lines);
}
