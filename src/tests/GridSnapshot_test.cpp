#include "TestMaterials.h"
#include "core/GridSnapshot.h"
#include <algorithm>
#include <filesystem>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using namespace SandSim;

class GridSnapshotTest : public Test::WorldTestBase {
protected:
    void SetUp() override
    {
        WorldTestBase::SetUp();
        fill("stone", -5, 20, 70, 20);
        fill("sand", 0, 0, 3, 3);
        place(10, 19, "water", 0.4f);
        place(-3, 19, "oil", 0.75f);
        Cell burning = Cell::of(id("wood"));
        burning.fire = FireState{ .hp = 4, .burning = true, .igniting = false };
        world->setCell(40, 19, burning);
        world->advance(3);
    }

    void expectSameCells(const World& a, const World& b)
    {
        ASSERT_EQ(a.tick(), b.tick());
        ASSERT_EQ(a.getGrid().chunkCoords(), b.getGrid().chunkCoords());
        for (const auto& coord : a.getGrid().chunkCoords()) {
            EXPECT_EQ(a.getGrid().findChunk(coord)->cells(), b.getGrid().findChunk(coord)->cells())
                << "chunk " << coord.toString();
        }
    }
};

TEST_F(GridSnapshotTest, BinaryRoundTripPreservesEveryCell)
{
    spdlog::info("Starting GridSnapshotTest::BinaryRoundTripPreservesEveryCell test");
    const auto bytes = world->saveSnapshot();
    ASSERT_FALSE(bytes.empty());

    World restored(registry, Test::singleThreadedSettings());
    const auto result = restored.loadSnapshot(bytes);
    ASSERT_TRUE(result.isValue()) << result.errorValue();

    expectSameCells(*world, restored);
    EXPECT_EQ(restored.getGrid().activeChunkCount(), restored.getGrid().chunkCount());

    // Both continue identically.
    world->advance(5);
    restored.advance(5);
    expectSameCells(*world, restored);
}

TEST_F(GridSnapshotTest, CompressedLiquidColumnRoundTripsExactly)
{
    spdlog::info("Starting GridSnapshotTest::CompressedLiquidColumnRoundTripsExactly test");
    nlohmann::json json = Test::testMaterialsJson();
    json["materials"].push_back({ { "name", "slime" },
                                  { "color", { 90, 200, 90, 200 } },
                                  { "physics",
                                    { { "type", "liquid" },
                                      { "density", 12 },
                                      { "flow_rate", 1.0 },
                                      { "dry_threshold", 0.000001 },
                                      { "max_compression", 2.0 } } } });
    auto loaded = MaterialRegistry::loadFromJson(json);
    ASSERT_TRUE(loaded.isValue()) << loaded.errorValue().toString();
    const MaterialRegistry squishy = std::move(loaded).value();
    const MaterialId stone = *squishy.idOf("stone");
    const MaterialId slime = *squishy.idOf("slime");

    // One cell wide shaft, 20 deep.
    World source(squishy, Test::singleThreadedSettings());
    source.fillRect(DirtyRect::fromBounds(4, 0, 4, 21), Cell::of(stone));
    source.fillRect(DirtyRect::fromBounds(6, 0, 6, 21), Cell::of(stone));
    source.fillRect(DirtyRect::fromBounds(5, 21, 5, 21), Cell::of(stone));
    source.fillRect(DirtyRect::fromBounds(5, 1, 5, 20), Cell::of(slime));
    source.advance(3000);

    float deepest = 0.0f;
    source.regionQuery(DirtyRect::fromBounds(5, 0, 5, 20), [&](Vector2i, const Cell& cell) {
        if (cell.material == slime) {
            deepest = std::max(deepest, cell.fill_level);
        }
    });
    ASSERT_GT(deepest, 2.0f);

    World binary(squishy, Test::singleThreadedSettings());
    const auto result = binary.loadSnapshot(source.saveSnapshot());
    ASSERT_TRUE(result.isValue()) << result.errorValue();
    expectSameCells(source, binary);

    const auto parsed =
        GridSnapshot::fromJson(nlohmann::json::parse(GridSnapshot::capture(source.getGrid()).toJson().dump()));
    ASSERT_TRUE(parsed.isValue()) << parsed.errorValue();
    World fromJson(squishy, Test::singleThreadedSettings());
    ASSERT_TRUE(parsed.value().restore(fromJson.getGrid()).isValue());
    expectSameCells(source, fromJson);
}

TEST_F(GridSnapshotTest, JsonRoundTripPreservesEveryCell)
{
    spdlog::info("Starting GridSnapshotTest::JsonRoundTripPreservesEveryCell test");
    const GridSnapshot snapshot = GridSnapshot::capture(world->getGrid());
    const nlohmann::json json = snapshot.toJson();
    EXPECT_EQ(json["tick"], 3);
    EXPECT_EQ(json["chunks"].size(), snapshot.chunks.size());

    const auto parsed = GridSnapshot::fromJson(nlohmann::json::parse(json.dump()));
    ASSERT_TRUE(parsed.isValue()) << parsed.errorValue();
    EXPECT_EQ(parsed.value().cellCount(), snapshot.cellCount());

    World restored(registry, Test::singleThreadedSettings());
    ASSERT_TRUE(parsed.value().restore(restored.getGrid()).isValue());
    expectSameCells(*world, restored);
}

TEST_F(GridSnapshotTest, UnknownMaterialLeavesGridUntouched)
{
    spdlog::info("Starting GridSnapshotTest::UnknownMaterialLeavesGridUntouched test");
    GridSnapshot snapshot = GridSnapshot::capture(world->getGrid());
    snapshot.chunks.front().cells[5].material = 999;

    World target(registry, Test::singleThreadedSettings());
    target.setMaterial(1, 1, "stone");

    const auto result = snapshot.restore(target.getGrid());
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("unknown material"), std::string::npos);
    EXPECT_EQ(target.getGrid().chunkCount(), 1u);
    EXPECT_EQ(target.getCell(1, 1).material, id("stone"));
    EXPECT_EQ(target.tick(), 0u);
}

TEST_F(GridSnapshotTest, MalformedChunkIsRejected)
{
    spdlog::info("Starting GridSnapshotTest::MalformedChunkIsRejected test");
    GridSnapshot shortChunk = GridSnapshot::capture(world->getGrid());
    shortChunk.chunks.front().cells.pop_back();
    EXPECT_TRUE(shortChunk.restore(world->getGrid()).isError());

    GridSnapshot duplicate = GridSnapshot::capture(world->getGrid());
    duplicate.chunks.push_back(duplicate.chunks.front());
    EXPECT_TRUE(duplicate.restore(world->getGrid()).isError());

    GridSnapshot future = GridSnapshot::capture(world->getGrid());
    future.version = GridSnapshot::FORMAT_VERSION + 1;
    EXPECT_TRUE(future.restore(world->getGrid()).isError());
}

TEST_F(GridSnapshotTest, GarbageBytesAreRejected)
{
    spdlog::info("Starting GridSnapshotTest::GarbageBytesAreRejected test");
    const std::vector<std::byte> garbage(7, std::byte{ 0xFF });
    EXPECT_TRUE(GridSnapshot::fromBytes(garbage).isError());
    EXPECT_TRUE(world->loadSnapshot(garbage).isError());
    EXPECT_EQ(world->tick(), 3u);

    GridSnapshot wrongMagic;
    wrongMagic.magic = 0;
    EXPECT_TRUE(GridSnapshot::fromBytes(wrongMagic.toBytes()).isError());
}

TEST_F(GridSnapshotTest, WorldFilesRoundTripInBothFormats)
{
    spdlog::info("Starting GridSnapshotTest::WorldFilesRoundTripInBothFormats test");
    const auto dir = std::filesystem::temp_directory_path();

    for (const char* name : { "sandsim_snapshot_test.bin", "sandsim_snapshot_test.json" }) {
        const std::string path = (dir / name).string();
        const auto saved = world->saveToFile(path);
        ASSERT_TRUE(saved.isValue()) << saved.errorValue();

        World restored(registry, Test::singleThreadedSettings());
        const auto loaded = restored.loadFromFile(path);
        ASSERT_TRUE(loaded.isValue()) << loaded.errorValue();
        expectSameCells(*world, restored);

        std::filesystem::remove(path);
    }

    World missing(registry, Test::singleThreadedSettings());
    EXPECT_TRUE(missing.loadFromFile((dir / "sandsim_no_such_file.bin").string()).isError());
}
