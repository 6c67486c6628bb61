// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include <gtest/gtest.h>
#include <memory>

#include "LogManager.hpp"
#include "LogGlobals.hpp"
#include "LogMacros.h"

using namespace eanim;

TEST(LogManagerTest, BuffersFormattedLines)
{
    LogManager logger;
    logger.log("value %d and %s", 7, "text");

    ASSERT_EQ(logger.lines().size(), 1u);
    EXPECT_TRUE(logger.contains("value 7 and text"));
    EXPECT_EQ(logger.lines()[0].rfind("[+", 0), 0u);

    logger.clear();
    EXPECT_TRUE(logger.lines().empty());
}

TEST(LogManagerTest, GlobalsForwardToLogger)
{
    auto logger = std::make_shared<LogManager>();
    LogGlobals::set_logger(logger);

    EANIM_LOG_WARN("careful %d", 1);
    EANIM_LOG_ERROR("broken");
    EXPECT_TRUE(logger->contains("[WARN] careful 1"));
    EXPECT_TRUE(logger->contains("[ERROR] broken"));
    EXPECT_EQ(LogGlobals::try_get(), logger.get());

    LogGlobals::clear();
    EXPECT_TRUE(logger->lines().empty());
}

TEST(LogManagerTest, ExpiredLoggerIsNoOp)
{
    {
        auto logger = std::make_shared<LogManager>();
        LogGlobals::set_logger(logger);
    }
    EXPECT_EQ(LogGlobals::try_get(), nullptr);
    EXPECT_NO_THROW(EANIM_LOG_INFO("nobody listens"));
}

TEST(LogManagerTest, DropsOldestLinesBeyondCapacity)
{
    LogManager logger(false, 3);
    for (int i = 0; i < 5; ++i)
        logger.log("line %d", i);

    ASSERT_EQ(logger.lines().size(), 3u);
    EXPECT_FALSE(logger.contains("line 1"));
    EXPECT_NE(logger.lines().front().find("line 2"), std::string::npos);
    EXPECT_NE(logger.lines().back().find("line 4"), std::string::npos);
}
