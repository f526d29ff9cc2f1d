#include <gtest/gtest.h>

#include <spdlog/spdlog.h>

#include "log.hpp"

TEST(Log, LevelFiltersLocally) {
    setLogLevel(LOG_LEVEL_WARN);
    EXPECT_EQ(LOG_LEVEL_WARN, getLogLevel());

    setLogLevel(LOG_LEVEL_DEBUG);
    EXPECT_EQ(LOG_LEVEL_DEBUG, getLogLevel());
    setLogLevel(LOG_LEVEL_INFO);
}

TEST(Log, LoggingLeavesHostSpdlogLevelAlone) {
    spdlog::level::level_enum hostLevel = spdlog::default_logger()->level();
    spdlog::default_logger()->set_level(spdlog::level::err);

    setLogLevel(LOG_LEVEL_DEBUG);
    DOCSCAN_LOGD("LogTest", "debug message %d", 1);
    DOCSCAN_LOGW("LogTest", "warning message %s", "two");

    EXPECT_EQ(spdlog::level::err, spdlog::default_logger()->level());

    // Messages go to a dedicated logger
    std::shared_ptr<spdlog::logger> logger = spdlog::get("docscan");
    ASSERT_TRUE(logger != nullptr);
    EXPECT_NE(spdlog::default_logger(), logger);

    setLogLevel(LOG_LEVEL_INFO);
    spdlog::default_logger()->set_level(hostLevel);
}
