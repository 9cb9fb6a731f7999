#include <gtest/gtest.h>
#include "chanmux/core/logger.hpp"
#include <filesystem>
#include <fstream>

using namespace chanmux::core;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_file = "test_chanmux.log";
    }
    
    void TearDown() override {
        Logger::shutdown();
        if (std::filesystem::exists(log_file)) {
            std::filesystem::remove(log_file);
        }
    }
    
    std::string log_file;
};

TEST_F(LoggerTest, Initialize) {
    Logger::initialize(log_file, LogLevel::Debug);
    
    EXPECT_NE(Logger::get(), nullptr);
    EXPECT_TRUE(std::filesystem::exists(log_file));
}

TEST_F(LoggerTest, LogMessages) {
    Logger::initialize(log_file, LogLevel::Debug);
    
    LOG_DEBUG("Debug message: {}", 123);
    LOG_INFO("Info message: {}", "test");
    LOG_WARN("Warning message");
    LOG_ERROR("Error message");
    LOG_CRITICAL("Critical message");
    
    Logger::get()->flush();
    
    std::ifstream file(log_file);
    std::string content((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
    
    EXPECT_TRUE(content.find("Debug message: 123") != std::string::npos);
    EXPECT_TRUE(content.find("Info message: test") != std::string::npos);
    EXPECT_TRUE(content.find("Warning message") != std::string::npos);
    EXPECT_TRUE(content.find("Error message") != std::string::npos);
    EXPECT_TRUE(content.find("Critical message") != std::string::npos);
}

TEST_F(LoggerTest, LogLevel) {
    Logger::initialize(log_file, LogLevel::Warn);
    
    LOG_DEBUG("Debug message");
    LOG_INFO("Info message");
    LOG_WARN("Warning message");
    
    Logger::get()->flush();
    
    std::ifstream file(log_file);
    std::string content((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
    
    EXPECT_TRUE(content.find("Debug message") == std::string::npos);
    EXPECT_TRUE(content.find("Info message") == std::string::npos);
    EXPECT_TRUE(content.find("Warning message") != std::string::npos);
}

TEST_F(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::parse_level("trace"), LogLevel::Trace);
    EXPECT_EQ(Logger::parse_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(Logger::parse_level("warning"), LogLevel::Warn);
    EXPECT_EQ(Logger::parse_level("off"), LogLevel::Off);
    EXPECT_EQ(Logger::parse_level("verbose"), LogLevel::Info);
    EXPECT_EQ(Logger::parse_level("", LogLevel::Error), LogLevel::Error);
    EXPECT_EQ(Logger::parse_level("\xC3\x89RROR", LogLevel::Warn), LogLevel::Warn);
    EXPECT_EQ(Logger::parse_level("ERROR"), LogLevel::Error);
}

TEST_F(LoggerTest, ShutdownKeepsDefaultLogger) {
    Logger::initialize(log_file, LogLevel::Info);
    Logger::shutdown();
    
    EXPECT_EQ(Logger::get(), nullptr);
    ASSERT_NE(spdlog::default_logger(), nullptr);
    LOG_INFO("Logged after shutdown");
}
