#include "core/LoggingChannels.h"
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

using namespace SandSim;

TEST(LoggingChannelsTest, ChannelLevelsFollowSpecString)
{
    spdlog::info("Starting LoggingChannelsTest::ChannelLevelsFollowSpecString test");
    LoggingChannels::initialize(spdlog::level::info, spdlog::level::debug, "");
    ASSERT_TRUE(LoggingChannels::isInitialized());

    for (const auto& name : LoggingChannels::channelNames()) {
        EXPECT_EQ(LoggingChannels::get(name)->name(), name);
    }
    EXPECT_EQ(LoggingChannels::fire()->name(), "fire");

    LoggingChannels::configureFromString("*:warn, fire:trace");
    EXPECT_EQ(LoggingChannels::fire()->level(), spdlog::level::trace);
    EXPECT_EQ(LoggingChannels::grid()->level(), spdlog::level::warn);
    EXPECT_EQ(LoggingChannels::scheduler()->level(), spdlog::level::warn);

    // Malformed items are skipped without touching the others.
    LoggingChannels::configureFromString("grid,rules:debug");
    EXPECT_EQ(LoggingChannels::grid()->level(), spdlog::level::warn);
    EXPECT_EQ(LoggingChannels::rules()->level(), spdlog::level::debug);

    LoggingChannels::configureFromString("*:info");
    EXPECT_EQ(LoggingChannels::fire()->level(), spdlog::level::info);
}

TEST(LoggingChannelsTest, UnknownChannelFallsBackToDefaultLogger)
{
    spdlog::info("Starting LoggingChannelsTest::UnknownChannelFallsBackToDefaultLogger test");
    EXPECT_EQ(LoggingChannels::get("no_such_channel"), spdlog::default_logger());
}
