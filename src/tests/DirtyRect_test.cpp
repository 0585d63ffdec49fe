#include "core/DirtyRect.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using namespace SandSim;

TEST(DirtyRectTest, DefaultIsEmpty)
{
    spdlog::info("Starting DirtyRectTest::DefaultIsEmpty test");
    DirtyRect rect;
    EXPECT_TRUE(rect.isEmpty());
    EXPECT_EQ(rect.width(), 0);
    EXPECT_EQ(rect.area(), 0);
    EXPECT_FALSE(rect.contains(0, 0));
}

TEST(DirtyRectTest, ExtendGrowsToCoverPoints)
{
    spdlog::info("Starting DirtyRectTest::ExtendGrowsToCoverPoints test");
    DirtyRect rect;
    rect.extend(3, 4);
    EXPECT_EQ(rect, DirtyRect::fromPoint(3, 4));
    EXPECT_EQ(rect.area(), 1);

    rect.extend(-2, 10);
    EXPECT_EQ(rect, DirtyRect::fromBounds(-2, 4, 3, 10));
    EXPECT_EQ(rect.width(), 6);
    EXPECT_EQ(rect.height(), 7);

    // Extending by an empty rect changes nothing.
    rect.extend(DirtyRect{});
    EXPECT_EQ(rect, DirtyRect::fromBounds(-2, 4, 3, 10));
}

TEST(DirtyRectTest, ClipExpandAndTranslate)
{
    spdlog::info("Starting DirtyRectTest::ClipExpandAndTranslate test");
    const DirtyRect bounds = DirtyRect::fromBounds(0, 0, 63, 63);

    EXPECT_EQ(DirtyRect::fromBounds(-5, 10, 5, 70).clippedTo(bounds), DirtyRect::fromBounds(0, 10, 5, 63));
    EXPECT_TRUE(DirtyRect::fromBounds(70, 70, 80, 80).clippedTo(bounds).isEmpty());

    EXPECT_EQ(DirtyRect::fromPoint(5, 5).expanded(1), DirtyRect::fromBounds(4, 4, 6, 6));
    EXPECT_TRUE(DirtyRect{}.expanded(1).isEmpty());

    EXPECT_EQ(DirtyRect::fromBounds(0, 0, 1, 1).translated({ 64, -64 }), DirtyRect::fromBounds(64, -64, 65, -63));
}

TEST(DirtyRectTest, Intersects)
{
    spdlog::info("Starting DirtyRectTest::Intersects test");
    const DirtyRect a = DirtyRect::fromBounds(0, 0, 4, 4);
    EXPECT_TRUE(a.intersects(DirtyRect::fromBounds(4, 4, 8, 8)));
    EXPECT_FALSE(a.intersects(DirtyRect::fromBounds(5, 0, 8, 4)));
    EXPECT_FALSE(a.intersects(DirtyRect{}));
}

TEST(DirtyRectTest, JsonUsesNullForEmpty)
{
    spdlog::info("Starting DirtyRectTest::JsonUsesNullForEmpty test");
    nlohmann::json empty = DirtyRect{};
    EXPECT_TRUE(empty.is_null());

    nlohmann::json j = DirtyRect::fromBounds(-1, 2, 3, 4);
    EXPECT_EQ(j["min_x"], -1);
    EXPECT_EQ(j["max_y"], 4);
    EXPECT_EQ(j.get<DirtyRect>(), DirtyRect::fromBounds(-1, 2, 3, 4));
}
