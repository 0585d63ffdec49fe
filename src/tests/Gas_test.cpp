#include "TestMaterials.h"
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

using namespace SandSim;

class GasTest : public Test::WorldTestBase {};

TEST_F(GasTest, LightGasRisesOneCellPerTick)
{
    spdlog::info("Starting GasTest::LightGasRisesOneCellPerTick test");
    place(5, 40, "steam");

    world->advance();
    EXPECT_TRUE(world->getCell(5, 40).isEmpty());
    EXPECT_EQ(materialAt(5, 39), id("steam"));

    world->advance(4);
    EXPECT_EQ(materialAt(5, 35), id("steam"));
}

TEST_F(GasTest, HeavyGasSinks)
{
    spdlog::info("Starting GasTest::HeavyGasSinks test");
    fill("stone", 0, 20, 50, 20);
    place(25, 10, "heavy_gas");

    world->advance();
    EXPECT_EQ(materialAt(25, 11), id("heavy_gas"));

    // Once on the floor it wanders sideways but never lifts off.
    world->advance(20);
    EXPECT_EQ(count("heavy_gas", DirtyRect::fromBounds(0, 19, 50, 19)), 1);
}

TEST_F(GasTest, DriftsSidewaysUnderCeiling)
{
    spdlog::info("Starting GasTest::DriftsSidewaysUnderCeiling test");
    fill("stone", 0, 10, 10, 10);
    place(5, 11, "steam");

    world->advance();

    EXPECT_TRUE(world->getCell(5, 11).isEmpty());
    const bool left = materialAt(4, 11) == id("steam");
    const bool right = materialAt(6, 11) == id("steam");
    EXPECT_TRUE(left != right);
}

TEST_F(GasTest, BubblesUpThroughLiquid)
{
    spdlog::info("Starting GasTest::BubblesUpThroughLiquid test");
    fill("stone", 4, 0, 4, 10);
    fill("stone", 6, 0, 6, 10);
    place(5, 10, "stone");
    place(5, 9, "steam");
    place(5, 8, "water");

    world->advance();

    EXPECT_EQ(materialAt(5, 8), id("steam"));
    EXPECT_EQ(materialAt(5, 9), id("water"));
}

TEST_F(GasTest, DissipatesAfterConfiguredTicks)
{
    spdlog::info("Starting GasTest::DissipatesAfterConfiguredTicks test");
    place(20, 50, "smoke");
    const DirtyRect chunk = DirtyRect::fromBounds(0, 0, 63, 63);

    world->advance(9);
    ASSERT_EQ(count("smoke", chunk), 1);
    EXPECT_NEAR(totalFill("smoke", chunk), 0.1, 1e-4);

    const StepStats last = world->advance();
    EXPECT_EQ(count("smoke", chunk), 0);
    EXPECT_EQ(last.dissipated, 1u);
}

TEST_F(GasTest, DissipationCanBeDisabled)
{
    spdlog::info("Starting GasTest::DissipationCanBeDisabled test");
    SimulationSettings settings = Test::singleThreadedSettings();
    settings.gas_dissipation_enabled = false;
    createWorld(settings);

    place(20, 50, "smoke");
    world->advance(20);

    const DirtyRect chunk = DirtyRect::fromBounds(0, 0, 63, 63);
    EXPECT_EQ(count("smoke", chunk), 1);
    EXPECT_FLOAT_EQ(static_cast<float>(totalFill("smoke", chunk)), 1.0f);
}
