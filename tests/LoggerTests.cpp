/**
 * @file LoggerTests.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Logger.h"
#include <gtest/gtest.h>

#include <stdexcept>

TEST(LoggerTest, ParseLevelAcceptsKnownNames) {
    EXPECT_EQ(Logger::parseLevel("debug"), Logger::Level::Debug);
    EXPECT_EQ(Logger::parseLevel("INFO"), Logger::Level::Info);
    EXPECT_EQ(Logger::parseLevel("warn"), Logger::Level::Warn);
    EXPECT_EQ(Logger::parseLevel("Warning"), Logger::Level::Warn);
    EXPECT_EQ(Logger::parseLevel("error"), Logger::Level::Error);
    EXPECT_EQ(Logger::parseLevel("off"), Logger::Level::None);
    EXPECT_EQ(Logger::parseLevel("none"), Logger::Level::None);
}

TEST(LoggerTest, ParseLevelRejectsUnknownNames) {
    EXPECT_FALSE(Logger::parseLevel("").has_value());
    EXPECT_FALSE(Logger::parseLevel("verbose").has_value());
    EXPECT_FALSE(Logger::parseLevel("3").has_value());
}

TEST(LoggerTest, LevelGatesMessages) {
    const Logger::Level saved = Logger::level();

    Logger::setLevel(Logger::Level::Warn);
    EXPECT_FALSE(Logger::enabled(Logger::Level::Debug));
    EXPECT_FALSE(Logger::enabled(Logger::Level::Info));
    EXPECT_TRUE(Logger::enabled(Logger::Level::Warn));
    EXPECT_TRUE(Logger::enabled(Logger::Level::Error));

    Logger::setLevel(Logger::Level::None);
    EXPECT_FALSE(Logger::enabled(Logger::Level::Error));
    EXPECT_FALSE(Logger::enabled(Logger::Level::None));

    Logger::setLevel(saved);
}

TEST(LoggerTest, LoggingWhileOpenIsHarmless) {
    EXPECT_TRUE(Logger::isOpen());
    Logger::info("LoggerTest: info line");
    Logger::logException("LoggerTest", std::runtime_error("sample"));
    Logger::logUnknownException("LoggerTest");
    EXPECT_TRUE(Logger::isOpen());
}
