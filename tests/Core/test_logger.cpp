/**
 * @file test_logger.cpp
 * @brief Unit tests for the Logger infrastructure
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 */

#include <gtest/gtest.h>
#include "Ascent/Core/Logger.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <thread>
#include <vector>

using namespace Ascent::Core;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        logPath_ = (std::filesystem::temp_directory_path() / "ascent_test_logger.log").string();
        std::filesystem::remove(logPath_);
        Logger::Instance().Shutdown();
    }

    void TearDown() override {
        auto& logger = Logger::Instance();
        logger.SetCallback(nullptr);
        logger.Shutdown();

        std::error_code ec;
        std::filesystem::remove(logPath_, ec);
    }

    std::string ReadLog() const {
        std::ifstream logFile(logPath_);
        return std::string((std::istreambuf_iterator<char>(logFile)),
                           std::istreambuf_iterator<char>());
    }

    std::string logPath_;
};

TEST_F(LoggerTest, InitializeTwiceFails) {
    auto& logger = Logger::Instance();

    EXPECT_TRUE(logger.Initialize(LogLevel::Info, LogOutput::Console));
    EXPECT_FALSE(logger.Initialize(LogLevel::Debug, LogOutput::Console));
    EXPECT_EQ(logger.GetMinLevel(), LogLevel::Info);

    logger.Shutdown();
    EXPECT_TRUE(logger.Initialize(LogLevel::Debug, LogOutput::Console));
    EXPECT_EQ(logger.GetMinLevel(), LogLevel::Debug);
}

TEST_F(LoggerTest, NothingEnabledBeforeInitialize) {
    auto& logger = Logger::Instance();

    EXPECT_FALSE(logger.IsLevelEnabled(LogLevel::Critical));
}

TEST_F(LoggerTest, LogLevelFiltering) {
    auto& logger = Logger::Instance();

    ASSERT_TRUE(logger.Initialize(LogLevel::Warning, LogOutput::Console));

    EXPECT_FALSE(logger.IsLevelEnabled(LogLevel::Debug));
    EXPECT_FALSE(logger.IsLevelEnabled(LogLevel::Info));
    EXPECT_TRUE(logger.IsLevelEnabled(LogLevel::Warning));
    EXPECT_TRUE(logger.IsLevelEnabled(LogLevel::Critical));
    EXPECT_FALSE(logger.IsLevelEnabled(LogLevel::Off));

    logger.SetMinLevel(LogLevel::Trace);
    EXPECT_TRUE(logger.IsLevelEnabled(LogLevel::Trace));
}

TEST_F(LoggerTest, ParseLogLevelNames) {
    LogLevel level = LogLevel::Info;

    EXPECT_TRUE(ParseLogLevel("debug", level));
    EXPECT_EQ(level, LogLevel::Debug);
    EXPECT_TRUE(ParseLogLevel("WARN", level));
    EXPECT_EQ(level, LogLevel::Warning);
    EXPECT_TRUE(ParseLogLevel("Off", level));
    EXPECT_EQ(level, LogLevel::Off);

    EXPECT_FALSE(ParseLogLevel("verbose", level));
    EXPECT_EQ(level, LogLevel::Off);
}

TEST_F(LoggerTest, FileOutput) {
    auto& logger = Logger::Instance();

    ASSERT_TRUE(logger.Initialize(LogLevel::Debug, LogOutput::File, logPath_));

    logger.Log(LogLevel::Info, "Round 7 WAITING");
    logger.Log(LogLevel::Error, "Persisting bet failed");
    logger.Flush();

    const std::string content = ReadLog();
    EXPECT_NE(content.find("Round 7 WAITING"), std::string::npos);
    EXPECT_NE(content.find("Persisting bet failed"), std::string::npos);
    EXPECT_NE(content.find("[info]"), std::string::npos);
    EXPECT_NE(content.find("[error]"), std::string::npos);
}

TEST_F(LoggerTest, StatisticsAndDrops) {
    auto& logger = Logger::Instance();

    ASSERT_TRUE(logger.Initialize(LogLevel::Error, LogOutput::Console));
    logger.ResetStatistics();

    logger.Log(LogLevel::Debug, "dropped");
    logger.Log(LogLevel::Info, "dropped");
    logger.Log(LogLevel::Warning, "dropped");
    logger.Log(LogLevel::Error, "kept");
    logger.Log(LogLevel::Critical, "kept");

    const auto stats = logger.GetStatistics();
    EXPECT_EQ(stats.dropped, 3u);
    EXPECT_EQ(stats.info, 0u);
    EXPECT_EQ(stats.error, 1u);
    EXPECT_EQ(stats.critical, 1u);
}

TEST_F(LoggerTest, ConcurrentLogging) {
    auto& logger = Logger::Instance();

    ASSERT_TRUE(logger.Initialize(LogLevel::Debug, LogOutput::File, logPath_));
    logger.ResetStatistics();

    constexpr int threadCount = 8;
    constexpr int messagesPerThread = 100;

    std::vector<std::thread> threads;
    for (int i = 0; i < threadCount; ++i) {
        threads.emplace_back([&logger, i]() {
            for (int j = 0; j < messagesPerThread; ++j) {
                logger.LogFormat(LogLevel::Info, __FILE__, __LINE__, "Worker %d tick %d", i, j);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(logger.GetStatistics().info, static_cast<size_t>(threadCount * messagesPerThread));
}

TEST_F(LoggerTest, CallbackReceivesMessage) {
    auto& logger = Logger::Instance();

    ASSERT_TRUE(logger.Initialize(LogLevel::Info, LogOutput::Callback));

    int calls = 0;
    LogLevel lastLevel = LogLevel::Off;
    std::string lastMessage;
    logger.SetCallback([&](LogLevel level, std::string_view message,
                           std::chrono::system_clock::time_point) {
        calls++;
        lastLevel = level;
        lastMessage = std::string(message);
    });

    logger.Log(LogLevel::Warning, "Broadcast frame dropped");
    logger.Log(LogLevel::Debug, "below threshold");

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(lastLevel, LogLevel::Warning);
    EXPECT_EQ(lastMessage, "Broadcast frame dropped");
}

TEST_F(LoggerTest, MacrosIncludeSourceLocation) {
    auto& logger = Logger::Instance();

    ASSERT_TRUE(logger.Initialize(LogLevel::Trace, LogOutput::File, logPath_));
    logger.ResetStatistics();

    ASCENT_LOG_TRACE("trace macro");
    ASCENT_LOG_DEBUG("debug macro");
    ASCENT_LOG_INFO("info macro");
    ASCENT_LOG_WARNING("warning macro");
    ASCENT_LOG_ERROR("error macro");
    ASCENT_LOG_CRITICAL("critical macro");
    ASCENT_LOG_INFO_F("Session %s bet %d", "Guest_A1B2C3", 200);
    logger.Flush();

    const auto stats = logger.GetStatistics();
    EXPECT_EQ(stats.trace, 1u);
    EXPECT_EQ(stats.info, 2u);
    EXPECT_EQ(stats.critical, 1u);

    const std::string content = ReadLog();
    EXPECT_NE(content.find("trace macro"), std::string::npos);
    EXPECT_NE(content.find("Session Guest_A1B2C3 bet 200"), std::string::npos);
    EXPECT_NE(content.find("test_logger.cpp"), std::string::npos);
}
