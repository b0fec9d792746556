/**
 * @file test_logger.cpp
 * @brief Unit tests for the logging framework
 */

#include <gtest/gtest.h>
#include <soodlink/utils/logger.hpp>

#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace soodlink::utils;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setLevel(LogLevel::TRACE);
        Logger::instance().setColorEnabled(false);
        Logger::instance().setOutput(output_);
    }

    void TearDown() override {
        Logger::instance().resetOutput();
        Logger::instance().setLevel(LogLevel::INFO);
        Logger::instance().setColorEnabled(true);
    }

    std::string captured() const { return output_.str(); }

    std::ostringstream output_;
};

TEST_F(LoggerTest, SingletonInstance) {
    auto& instance1 = Logger::instance();
    auto& instance2 = Logger::instance();
    EXPECT_EQ(&instance1, &instance2);
}

TEST_F(LoggerTest, LogLevelFiltering) {
    Logger::instance().setLevel(LogLevel::WARN);

    LOG_TRACE("Test", "trace line");
    LOG_DEBUG("Test", "debug line");
    LOG_INFO("Test", "info line");
    LOG_WARN("Test", "warn line");
    LOG_ERROR("Test", "error line");

    std::string out = captured();
    EXPECT_EQ(out.find("trace line"), std::string::npos);
    EXPECT_EQ(out.find("debug line"), std::string::npos);
    EXPECT_EQ(out.find("info line"), std::string::npos);
    EXPECT_NE(out.find("warn line"), std::string::npos);
    EXPECT_NE(out.find("error line"), std::string::npos);
}

TEST_F(LoggerTest, OffSilencesEverything) {
    Logger::instance().setLevel(LogLevel::OFF);

    LOG_ERROR("Test", "should not appear");

    EXPECT_TRUE(captured().empty());
    EXPECT_FALSE(Logger::instance().isEnabled(LogLevel::ERROR));
    EXPECT_FALSE(Logger::instance().isEnabled(LogLevel::OFF));
}

TEST_F(LoggerTest, LogLevelNames) {
    EXPECT_STREQ(logLevelToString(LogLevel::TRACE), "TRACE");
    EXPECT_STREQ(logLevelToString(LogLevel::DEBUG), "DEBUG");
    EXPECT_STREQ(logLevelToString(LogLevel::INFO), "INFO ");
    EXPECT_STREQ(logLevelToString(LogLevel::WARN), "WARN ");
    EXPECT_STREQ(logLevelToString(LogLevel::ERROR), "ERROR");
    EXPECT_STREQ(logLevelToString(LogLevel::FATAL), "FATAL");
}

TEST_F(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parseLogLevel("TRACE"), LogLevel::TRACE);
    EXPECT_EQ(parseLogLevel("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("INFO"), LogLevel::INFO);
    EXPECT_EQ(parseLogLevel("WARN"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("ERROR"), LogLevel::ERROR);
    EXPECT_EQ(parseLogLevel("FATAL"), LogLevel::FATAL);
    EXPECT_EQ(parseLogLevel("OFF"), LogLevel::OFF);

    // Unknown names fall back
    EXPECT_EQ(parseLogLevel("verbose"), LogLevel::INFO);
    EXPECT_EQ(parseLogLevel("", LogLevel::WARN), LogLevel::WARN);
}

TEST_F(LoggerTest, ParseLogLevelIgnoresCase) {
    EXPECT_EQ(parseLogLevel("debug", LogLevel::FATAL), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("Warn", LogLevel::FATAL), LogLevel::WARN);

    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(tryParseLogLevel("off", level));
    EXPECT_EQ(level, LogLevel::OFF);

    level = LogLevel::INFO;
    EXPECT_FALSE(tryParseLogLevel("loud", level));
    EXPECT_EQ(level, LogLevel::INFO);
}

TEST_F(LoggerTest, PlaceholderFormatting) {
    LOG_INFO("Fmt", "found {} server(s) at {}:{}", 2, "10.0.0.5", 9003);
    EXPECT_NE(captured().find("found 2 server(s) at 10.0.0.5:9003"), std::string::npos);
}

TEST_F(LoggerTest, SurplusPlaceholdersKeptVerbatim) {
    LOG_INFO("Fmt", "a={} b={}", 1);
    EXPECT_NE(captured().find("a=1 b={}"), std::string::npos);
}

TEST_F(LoggerTest, ComponentTag) {
    LOG_INFO("MyComponent", "Test message");

    std::string out = captured();
    EXPECT_NE(out.find("[MyComponent]"), std::string::npos);
    EXPECT_NE(out.find("[INFO ]"), std::string::npos);
    EXPECT_EQ(out.find("\033["), std::string::npos);
}

TEST_F(LoggerTest, ThreadSafety) {
    std::vector<std::thread> threads;
    const int num_threads = 10;
    const int logs_per_thread = 100;

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([i, logs_per_thread]() {
            for (int j = 0; j < logs_per_thread; ++j) {
                LOG_INFO("Thread", "worker {} message {}", i, j);
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    // Every line arrives whole
    std::istringstream lines(captured());
    std::string line;
    int count = 0;
    while (std::getline(lines, line)) {
        EXPECT_NE(line.find("[Thread] worker "), std::string::npos) << line;
        ++count;
    }
    EXPECT_EQ(count, num_threads * logs_per_thread);
}
