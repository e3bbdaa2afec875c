#include <gtest/gtest.h>
#include <boost/log/core.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include "logger/logger.hpp"

using namespace mediavault::logging;

class LoggerTest : public ::testing::Test {
protected:
    const std::filesystem::path log_dir{"logs"};
    const std::filesystem::path log_file{log_dir / "test.log"};

    void SetUp() override {
        // Clean up any existing logs
        if (std::filesystem::exists(log_dir)) {
            std::filesystem::remove_all(log_dir);
        }

        init_logging(log_file.string(), boost::log::trivial::trace);
    }

    void TearDown() override {
        // Ensure all logs are written
        boost::log::core::get()->flush();
        boost::log::core::get()->remove_all_sinks();
        enable_logging();

        if (std::filesystem::exists(log_dir)) {
            std::filesystem::remove_all(log_dir);
        }
    }

    std::string read_log() {
        boost::log::core::get()->flush();
        std::ifstream file(log_file, std::ios::in | std::ios::binary);
        if (!file.is_open()) {
            return "";
        }
        std::stringstream content;
        content << file.rdbuf();
        return content.str();
    }

    bool log_contains(const std::string& text, int max_retries = 3) {
        for (int retry = 0; retry < max_retries; ++retry) {
            if (read_log().find(text) != std::string::npos) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50 * (retry + 1)));
        }
        return false;
    }
};

TEST_F(LoggerTest, BasicLogging) {
    LOG_INFO << "Test info message";
    LOG_ERROR << "Test error message";

    EXPECT_TRUE(std::filesystem::exists(log_file));
    EXPECT_TRUE(log_contains("Test info message"));
    EXPECT_TRUE(log_contains("Test error message"));
}

TEST_F(LoggerTest, SeverityIsWritten) {
    LOG_WARN << "Disk nearly full";
    EXPECT_TRUE(log_contains("[warning] Disk nearly full"));
}

TEST_F(LoggerTest, LogLevelFilters) {
    set_log_level(boost::log::trivial::warning);
    LOG_DEBUG << "Filtered debug message";
    LOG_INFO << "Filtered info message";
    LOG_WARN << "Visible warning message";

    EXPECT_TRUE(log_contains("Visible warning message"));
    EXPECT_EQ(read_log().find("Filtered debug message"), std::string::npos);
    EXPECT_EQ(read_log().find("Filtered info message"), std::string::npos);
}

TEST_F(LoggerTest, DisableAndEnable) {
    disable_logging();
    LOG_ERROR << "Message while disabled";
    enable_logging();
    LOG_ERROR << "Message after enable";

    EXPECT_TRUE(log_contains("Message after enable"));
    EXPECT_EQ(read_log().find("Message while disabled"), std::string::npos);
}

TEST_F(LoggerTest, TrivialLoggerSharesSinks) {
    BOOST_LOG_TRIVIAL(info) << "Store: trivial logger message";
    EXPECT_TRUE(log_contains("Store: trivial logger message"));
}

TEST_F(LoggerTest, MultiThreadedLogging) {
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([i]() {
            for (int j = 0; j < 10; ++j) {
                LOG_INFO << "Thread " << i << " message " << j;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int i = 0; i < 4; ++i) {
        EXPECT_TRUE(log_contains("Thread " + std::to_string(i) + " message 9"));
    }
}
