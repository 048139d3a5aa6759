#include <gtest/gtest.h>
#include "utils/logger.h"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <atomic>
#include <thread>
#include <vector>

using namespace shroud::utils;

class LoggerTest : public ::testing::Test {
protected:
    void TearDown() override {
        Logger::shutdown();
    }

    static std::string readFile(const std::string& path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

TEST_F(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::parseLevel("trace"), Logger::Level::TRACE);
    EXPECT_EQ(Logger::parseLevel(" DEBUG "), Logger::Level::DEBUG);
    EXPECT_EQ(Logger::parseLevel("Warning"), Logger::Level::WARN);
    EXPECT_EQ(Logger::parseLevel("err"), Logger::Level::ERROR);
    EXPECT_EQ(Logger::parseLevel("crit"), Logger::Level::CRITICAL);
    EXPECT_FALSE(Logger::parseLevel("verbose").has_value());
    EXPECT_FALSE(Logger::parseLevel("").has_value());
}

TEST_F(LoggerTest, LoggingBeforeInitIsDropped) {
    ASSERT_FALSE(Logger::isInitialized());
    SHROUD_INFO("nobody is listening {}", 42);
    Logger::setLevel(Logger::Level::DEBUG);
    EXPECT_FALSE(Logger::isInitialized());
}

TEST_F(LoggerTest, WritesToFileAtConfiguredLevel) {
    const std::string path = ::testing::TempDir() + "shroud_logger_test.log";
    std::remove(path.c_str());

    Logger::Options options;
    options.console = false;
    options.file = path;
    options.level = Logger::Level::WARN;
    options.pattern = "%l %v";
    Logger::init(options);
    ASSERT_TRUE(Logger::isInitialized());

    SHROUD_INFO("dropped info line");
    SHROUD_WARN("kept warning {} entities", 3);
    Logger::setLevel(Logger::Level::INFO);
    SHROUD_INFO("info after level change");
    Logger::shutdown();

    std::string contents = readFile(path);
    std::remove(path.c_str());
    EXPECT_EQ(contents.find("dropped info line"), std::string::npos);
    EXPECT_NE(contents.find("warning kept warning 3 entities"), std::string::npos);
    EXPECT_NE(contents.find("info after level change"), std::string::npos);
}

TEST_F(LoggerTest, UnwritableFileFallsBackToConsole) {
    Logger::Options options;
    options.console = false;
    options.file = "/proc/shroud-no-such-dir/shroud.log";
    Logger::init(options);
    EXPECT_TRUE(Logger::isInitialized());
    SHROUD_ERROR("still logging after fallback");
}

TEST_F(LoggerTest, ReinitReplacesLogger) {
    Logger::Options options;
    options.console = false;
    options.file.clear();
    Logger::init(options);
    options.level = Logger::Level::ERROR;
    Logger::init(options);
    EXPECT_TRUE(Logger::isInitialized());
    SHROUD_INFO("ignored");
}

TEST_F(LoggerTest, ConcurrentLoggingAcrossReinit) {
    Logger::Options options;
    options.console = false;
    options.file.clear();
    Logger::init(options);

    std::atomic<bool> stop{false};
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&stop, t] {
            int n = 0;
            while (!stop) {
                SHROUD_INFO("writer {} message {}", t, n++);
                SHROUD_DEBUG("writer {} detail", t);
            }
        });
    }

    for (int i = 0; i < 50; ++i) {
        options.level = (i % 2 == 0) ? Logger::Level::DEBUG : Logger::Level::WARN;
        Logger::init(options);
        if (i % 10 == 9) {
            Logger::shutdown();
        }
    }
    stop = true;
    for (auto& w : writers) {
        w.join();
    }
    SUCCEED();
}
