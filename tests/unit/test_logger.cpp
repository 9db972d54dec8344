#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "../../src/core/logger/logger.hpp"

using namespace Fetchium::Core;

TEST(LoggerTest, SetLevel) {
    Logger::set_level(LOG_NONE);
    EXPECT_EQ(Logger::level(), LOG_NONE);
    Logger::info("hidden");
    Logger::set_level(LOG_ALL);
    EXPECT_EQ(Logger::level(), LOG_ALL);
}

TEST(LoggerTest, QuietMaskKeepsErrors) {
    Logger::set_level(LOG_ERROR);
    EXPECT_FALSE(Logger::level() & LOG_INFO);
    EXPECT_FALSE(Logger::level() & LOG_WARN);
    EXPECT_TRUE(Logger::level() & LOG_ERROR);
    Logger::warn("This should not be printed");
    Logger::error("This should be printed");
    Logger::set_level(LOG_ALL);
}

TEST(LoggerTest, ConcurrentWriters) {
    Logger::set_level(LOG_ALL);
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([i]() {
            for (int j = 0; j < 50; ++j) {
                if (j % 2)
                    Logger::info("writer " + std::to_string(i) + " step " + std::to_string(j));
                else
                    Logger::success("writer " + std::to_string(i) + " step " + std::to_string(j));
            }
        });
    }
    for (auto& t : threads)
        t.join();
}
