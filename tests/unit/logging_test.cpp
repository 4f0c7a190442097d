#include "earshot/core/logging.hpp"

#include <gtest/gtest.h>

#include <iostream>
#include <sstream>

using namespace earshot;

TEST(LoggingTest, ParsesLevelNames) {
    EXPECT_EQ(parseLogLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::Warn);
    EXPECT_EQ(parseLogLevel("error"), LogLevel::Error);
    EXPECT_EQ(parseLogLevel("off"), LogLevel::Off);
    EXPECT_EQ(parseLogLevel("chatty"), LogLevel::Info);
}

TEST(LoggingTest, TagsAndFiltersLines) {
    const LogLevel previous = logLevel();
    std::ostringstream captured;
    std::streambuf* old = std::cout.rdbuf(captured.rdbuf());

    setLogLevel(LogLevel::Warn);
    logInfo("Capture", "hidden");
    logWarn("Capture", "shown");

    std::cout.rdbuf(old);
    setLogLevel(previous);

    EXPECT_EQ(captured.str(), "[Capture] [WARN] shown\n");
}
