#include <gtest/gtest.h>
#include "common/Logger.h"

namespace SMI {
namespace Tests {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        previous_ = Logger::getLevel();
    }

    void TearDown() override {
        Logger::setLevel(previous_);
    }

    spdlog::level::level_enum previous_ = spdlog::level::debug;
};

TEST_F(LoggerTest, SetLevelChangesActiveLevel) {
    Logger::setLevel(spdlog::level::warn);
    EXPECT_EQ(Logger::getLevel(), spdlog::level::warn);
    EXPECT_EQ(spdlog::get("SMI")->level(), spdlog::level::warn);

    Logger::setLevel(spdlog::level::trace);
    EXPECT_EQ(Logger::getLevel(), spdlog::level::trace);
}

// Test that a later initialize keeps the logger and its level
TEST_F(LoggerTest, InitializeAfterFirstUseIsIgnored) {
    Logger::setLevel(spdlog::level::err);
    Logger::initialize();
    EXPECT_EQ(Logger::getLevel(), spdlog::level::err);
    EXPECT_NO_THROW(LOG_ERROR("logged at {}", "error"));
    EXPECT_NO_THROW(LOG_DEBUG("filtered {}", 1));
}

}  // namespace Tests
}  // namespace SMI
