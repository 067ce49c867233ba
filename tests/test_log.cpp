// File: tests/test_log.cpp
// Purpose: Verify level filtering, line format and level-name parsing of the
//          logger.
// Key invariants: One line per accepted message, formatted
//                 "[LEVEL] HH:MM:SS message".
// Ownership/Lifetime: The capture stream is owned by the fixture and detached
//                     before it is destroyed.
// Links: src/support/log.cpp

#include "clockface/support/log.hpp"
#include "clockface/support/result.hpp"

#include <gtest/gtest.h>

#include <regex>
#include <sstream>
#include <string>

using clockface::support::LogLevel;
using clockface::support::logEnabled;
using clockface::support::logLevel;
using clockface::support::parseLogLevel;
using clockface::support::setLogLevel;
using clockface::support::setLogStream;

namespace
{
class LogTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        saved_ = logLevel();
        setLogStream(&out_);
    }

    void TearDown() override
    {
        setLogStream(nullptr);
        setLogLevel(saved_);
    }

    std::ostringstream out_;
    LogLevel saved_ = LogLevel::Info;
};
} // namespace

TEST_F(LogTest, WritesTaggedTimestampedLine)
{
    setLogLevel(LogLevel::Info);
    clockface::support::logInfo("clock started");
    const std::regex line(R"(\[INFO\] \d\d:\d\d:\d\d clock started\n)");
    EXPECT_TRUE(std::regex_match(out_.str(), line)) << out_.str();
}

TEST_F(LogTest, DropsMessagesBelowLevel)
{
    setLogLevel(LogLevel::Warn);
    clockface::support::logDebug("d");
    clockface::support::logInfo("i");
    clockface::support::logWarn("w");
    clockface::support::logError("e");

    const std::string text = out_.str();
    EXPECT_EQ(text.find("[DEBUG]"), std::string::npos);
    EXPECT_EQ(text.find("[INFO]"), std::string::npos);
    EXPECT_NE(text.find("[WARN]"), std::string::npos);
    EXPECT_NE(text.find("[ERROR]"), std::string::npos);
    EXPECT_LT(text.find("[WARN]"), text.find("[ERROR]"));
}

TEST_F(LogTest, OffSilencesEverything)
{
    setLogLevel(LogLevel::Off);
    EXPECT_FALSE(logEnabled(LogLevel::Error));
    clockface::support::logError("boom");
    EXPECT_TRUE(out_.str().empty());
}

TEST(LogLevelNames, ParsesKnownNames)
{
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("INFO"), LogLevel::Info);
    EXPECT_EQ(parseLogLevel("Warning"), LogLevel::Warn);
    EXPECT_EQ(parseLogLevel("warn"), LogLevel::Warn);
    EXPECT_EQ(parseLogLevel("error"), LogLevel::Error);
    EXPECT_EQ(parseLogLevel("off"), LogLevel::Off);
    EXPECT_FALSE(parseLogLevel("verbose").has_value());
}

TEST(ErrorText, PrintsKindAndMessage)
{
    std::ostringstream os;
    clockface::support::printError(
        clockface::support::makeError(clockface::support::ErrorKind::TimerUnavailable, "no timers"),
        os);
    EXPECT_EQ(os.str(), "timer_unavailable: no timers\n");
}
