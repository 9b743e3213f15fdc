#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "Logger.h"

TEST(Logger, SilentBeforeInit) {
    ASSERT_FALSE(Logger::isOpen());
    Logger::info("dropped");
    Logger::error("dropped");
    SUCCEED();
}

TEST(Logger, LevelFiltering) {
    const Logger::Level saved = Logger::level();
    Logger::setLevel(Logger::Level::Warn);
    EXPECT_FALSE(Logger::enabled(Logger::Level::Info));
    EXPECT_TRUE(Logger::enabled(Logger::Level::Warn));
    EXPECT_TRUE(Logger::enabled(Logger::Level::Error));
    EXPECT_FALSE(Logger::enabled(Logger::Level::None));
    Logger::setLevel(saved);
}

TEST(Logger, WritesSessionAndMessages) {
    const std::string path = "sparks_logger_test.log";
    std::remove(path.c_str());
    Logger::init(path);
    ASSERT_TRUE(Logger::isOpen());
    Logger::setLevel(Logger::Level::Info);
    Logger::info("hello sparks");
    Logger::debug("not shown");
    Logger::logException("unit", std::runtime_error("boom"));
    Logger::shutdown();
    EXPECT_FALSE(Logger::isOpen());

    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    const std::string text = ss.str();
    EXPECT_NE(text.find("session start"), std::string::npos);
    EXPECT_NE(text.find("[INFO] hello sparks"), std::string::npos);
    EXPECT_EQ(text.find("not shown"), std::string::npos);
    EXPECT_NE(text.find("boom"), std::string::npos);
    EXPECT_NE(text.find("session end"), std::string::npos);
    std::remove(path.c_str());
}
