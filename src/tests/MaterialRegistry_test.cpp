#include "TestMaterials.h"
#include "core/MaterialRegistry.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using namespace SandSim;

namespace {

nlohmann::json minimalMaterial(const std::string& name)
{
    return { { "name", name }, { "color", { 1, 2, 3, 255 } }, { "physics", { { "type", "static" } } } };
}

// Loads `json`, expects failure, and returns the error.
ConfigError expectLoadError(const nlohmann::json& json)
{
    auto result = MaterialRegistry::loadFromJson(json);
    EXPECT_TRUE(result.isError());
    if (result.isValue()) {
        return ConfigError{};
    }
    return result.errorValue();
}

} // namespace

TEST(MaterialRegistryTest, LoadsMaterialsWithSequentialIds)
{
    spdlog::info("Starting MaterialRegistryTest::LoadsMaterialsWithSequentialIds test");
    const MaterialRegistry registry = Test::makeTestRegistry();

    EXPECT_EQ(registry.size(), Test::testMaterialsJson()["materials"].size() + 1);
    EXPECT_EQ(registry.idOf("empty"), MATERIAL_EMPTY);
    EXPECT_EQ(registry.idOf("sand"), MaterialId{ 1 });
    EXPECT_FALSE(registry.idOf("unobtainium").has_value());
    EXPECT_EQ(registry.find(9999), nullptr);

    const auto* sand = registry.findByName("sand");
    ASSERT_NE(sand, nullptr);
    EXPECT_EQ(sand->kind(), PhysicsKind::Powder);
    EXPECT_FLOAT_EQ(sand->density(), 16.0f);
    EXPECT_EQ(sand->display_name, "sand");

    const auto& water = registry.get(*registry.idOf("water"));
    EXPECT_EQ(water.kind(), PhysicsKind::Liquid);
    EXPECT_FLOAT_EQ(std::get<LiquidPhysics>(water.physics).max_compression, 1.02f);

    EXPECT_TRUE(registry.get(MATERIAL_EMPTY).isEmptyMaterial());
    EXPECT_FLOAT_EQ(registry.get(MATERIAL_EMPTY).density(), AIR_DENSITY);
}

TEST(MaterialRegistryTest, ResolvesBurnsIntoAndDefaultsToEmpty)
{
    spdlog::info("Starting MaterialRegistryTest::ResolvesBurnsIntoAndDefaultsToEmpty test");
    const MaterialRegistry registry = Test::makeTestRegistry();

    const auto& wood = *registry.findByName("wood");
    ASSERT_TRUE(wood.fire.has_value());
    EXPECT_EQ(wood.fire->burns_into_id, *registry.idOf("ash"));
    EXPECT_EQ(wood.fire->fire_hp, 5);
    EXPECT_TRUE(wood.fire->requires_oxygen);

    const auto& oil = *registry.findByName("oil");
    ASSERT_TRUE(oil.fire.has_value());
    EXPECT_EQ(oil.fire->burns_into_id, MATERIAL_EMPTY);
}

TEST(MaterialRegistryTest, ReactionLookupIsSymmetric)
{
    spdlog::info("Starting MaterialRegistryTest::ReactionLookupIsSymmetric test");
    const MaterialRegistry registry = Test::makeTestRegistry();
    const MaterialId lava = *registry.idOf("lava");
    const MaterialId water = *registry.idOf("water");
    const MaterialId stone = *registry.idOf("stone");

    const auto forward = registry.findReaction(lava, water);
    ASSERT_TRUE(forward.has_value());
    EXPECT_FLOAT_EQ(forward->probability, 1.0f);
    EXPECT_EQ(forward->self_output, stone);
    EXPECT_EQ(forward->other_output, stone);

    EXPECT_TRUE(registry.findReaction(water, lava).has_value());
    EXPECT_FALSE(registry.findReaction(water, stone).has_value());
    EXPECT_TRUE(registry.hasReactions(lava));
    EXPECT_FALSE(registry.hasReactions(stone));
}

TEST(MaterialRegistryTest, ReactionOutputsSeenFromEachSide)
{
    spdlog::info("Starting MaterialRegistryTest::ReactionOutputsSeenFromEachSide test");
    nlohmann::json json = {
        { "materials", { minimalMaterial("a"), minimalMaterial("b"), minimalMaterial("c") } },
        { "reactions",
          { { { "probability", 0.25 },
              { "input_a", "a" },
              { "input_b", "b" },
              { "output_a", "c" },
              { "output_b", "empty" } } } },
    };
    auto result = MaterialRegistry::loadFromJson(json);
    ASSERT_TRUE(result.isValue()) << result.errorValue().toString();
    const auto& registry = result.value();

    const auto fromB = registry.findReaction(*registry.idOf("b"), *registry.idOf("a"));
    ASSERT_TRUE(fromB.has_value());
    EXPECT_EQ(fromB->self_output, MATERIAL_EMPTY);
    EXPECT_EQ(fromB->other_output, *registry.idOf("c"));
}

TEST(MaterialRegistryTest, RejectsDuplicateNames)
{
    spdlog::info("Starting MaterialRegistryTest::RejectsDuplicateNames test");
    const auto error = expectLoadError(
        { { "materials", { minimalMaterial("rock"), minimalMaterial("rock") } } });
    EXPECT_EQ(error.entry, "materials[1] (rock)");
    EXPECT_NE(error.message.find("duplicate"), std::string::npos);
}

TEST(MaterialRegistryTest, RejectsReservedEmptyName)
{
    spdlog::info("Starting MaterialRegistryTest::RejectsReservedEmptyName test");
    const auto error = expectLoadError({ { "materials", { minimalMaterial("empty") } } });
    EXPECT_EQ(error.entry, "materials[0] (empty)");
}

TEST(MaterialRegistryTest, RejectsReservedAnyName)
{
    spdlog::info("Starting MaterialRegistryTest::RejectsReservedAnyName test");
    const auto error = expectLoadError({ { "materials", { minimalMaterial("any") } } });
    EXPECT_EQ(error.entry, "materials[0] (any)");
}

TEST(MaterialRegistryTest, AnyReactionAppliesWhenNoPairMatches)
{
    spdlog::info("Starting MaterialRegistryTest::AnyReactionAppliesWhenNoPairMatches test");
    const nlohmann::json json = {
        { "materials", { minimalMaterial("acid"), minimalMaterial("rock"), minimalMaterial("salt") } },
        { "reactions",
          { { { "probability", 0.25 },
              { "input_a", "acid" },
              { "input_b", "any" },
              { "output_a", "acid" },
              { "output_b", "empty" } },
            { { "probability", 1.0 },
              { "input_a", "salt" },
              { "input_b", "acid" },
              { "output_a", "rock" },
              { "output_b", "rock" } } } }
    };
    auto result = MaterialRegistry::loadFromJson(json);
    ASSERT_TRUE(result.isValue()) << result.errorValue().toString();
    const MaterialRegistry registry = std::move(result).value();
    const MaterialId acid = *registry.idOf("acid");
    const MaterialId rock = *registry.idOf("rock");
    const MaterialId salt = *registry.idOf("salt");

    const auto wildcard = registry.findReaction(acid, rock);
    ASSERT_TRUE(wildcard.has_value());
    EXPECT_FLOAT_EQ(wildcard->probability, 0.25f);
    EXPECT_EQ(wildcard->self_output, acid);
    EXPECT_EQ(wildcard->other_output, MATERIAL_EMPTY);

    // A declared pair wins over the wildcard.
    const auto pair = registry.findReaction(acid, salt);
    ASSERT_TRUE(pair.has_value());
    EXPECT_FLOAT_EQ(pair->probability, 1.0f);
    EXPECT_EQ(pair->self_output, rock);

    // The wildcard belongs to acid only, and never matches empty or itself.
    EXPECT_FALSE(registry.findReaction(rock, acid).has_value());
    EXPECT_FALSE(registry.findReaction(acid, MATERIAL_EMPTY).has_value());
    EXPECT_FALSE(registry.findReaction(acid, acid).has_value());
    EXPECT_FALSE(registry.hasReactions(rock));

    EXPECT_EQ(registry.toJson()["reactions"][0]["input_b"], "any");
}

TEST(MaterialRegistryTest, RejectsSecondAnyReactionForMaterial)
{
    spdlog::info("Starting MaterialRegistryTest::RejectsSecondAnyReactionForMaterial test");
    const nlohmann::json wildcard = { { "probability", 0.5 },
                                      { "input_a", "acid" },
                                      { "input_b", "any" },
                                      { "output_a", "acid" },
                                      { "output_b", "empty" } };
    const auto error = expectLoadError(
        { { "materials", { minimalMaterial("acid") } }, { "reactions", { wildcard, wildcard } } });
    EXPECT_EQ(error.entry, "reactions[1]");
    EXPECT_NE(error.message.find("any"), std::string::npos);
}

TEST(MaterialRegistryTest, RejectsMalformedEntriesNamingThem)
{
    spdlog::info("Starting MaterialRegistryTest::RejectsMalformedEntriesNamingThem test");

    auto badType = minimalMaterial("goo");
    badType["physics"] = { { "type", "plasma" } };
    EXPECT_EQ(
        expectLoadError({ { "materials", { minimalMaterial("rock"), badType } } }).entry,
        "materials[1] (goo)");

    auto extraKey = minimalMaterial("goo");
    extraKey["physics"] = { { "type", "powder" }, { "viscosity", 3 } };
    EXPECT_EQ(expectLoadError({ { "materials", { extraKey } } }).entry, "materials[0] (goo)");

    auto noColor = minimalMaterial("goo");
    noColor.erase("color");
    EXPECT_EQ(expectLoadError({ { "materials", { noColor } } }).entry, "materials[0] (goo)");

    auto badFlow = minimalMaterial("goo");
    badFlow["physics"] = { { "type", "liquid" }, { "flow_rate", 3.0 } };
    EXPECT_EQ(expectLoadError({ { "materials", { badFlow } } }).entry, "materials[0] (goo)");

    auto badContact = minimalMaterial("goo");
    badContact["contact"] = { { "type", "tickle" } };
    EXPECT_EQ(expectLoadError({ { "materials", { badContact } } }).entry, "materials[0] (goo)");

    auto badGas = minimalMaterial("goo");
    badGas["physics"] = { { "type", "gas" }, { "dissipate", 0 } };
    EXPECT_EQ(expectLoadError({ { "materials", { badGas } } }).entry, "materials[0] (goo)");
}

TEST(MaterialRegistryTest, RejectsUnknownBurnsInto)
{
    spdlog::info("Starting MaterialRegistryTest::RejectsUnknownBurnsInto test");
    auto log = minimalMaterial("log");
    log["fire"] = { { "probability", 0.5 }, { "fire_hp", 10 }, { "burns_into", "charcoal" } };

    const auto error = expectLoadError({ { "materials", { log } } });
    EXPECT_EQ(error.entry, "materials[0] (log)");
    EXPECT_NE(error.message.find("charcoal"), std::string::npos);
}

TEST(MaterialRegistryTest, RejectsBadReactions)
{
    spdlog::info("Starting MaterialRegistryTest::RejectsBadReactions test");
    const auto materials = nlohmann::json::array({ minimalMaterial("a"), minimalMaterial("b") });
    const nlohmann::json valid = {
        { "probability", 0.5 }, { "input_a", "a" }, { "input_b", "b" }, { "output_a", "b" }, { "output_b", "a" }
    };

    auto unknown = valid;
    unknown["output_b"] = "c";
    EXPECT_EQ(
        expectLoadError({ { "materials", materials }, { "reactions", { valid, unknown } } }).entry,
        "reactions[1]");

    auto probability = valid;
    probability["probability"] = 1.5;
    EXPECT_EQ(
        expectLoadError({ { "materials", materials }, { "reactions", { probability } } }).entry,
        "reactions[0]");

    auto same = valid;
    same["input_b"] = "a";
    EXPECT_EQ(
        expectLoadError({ { "materials", materials }, { "reactions", { same } } }).entry,
        "reactions[0]");

    auto swapped = valid;
    swapped["input_a"] = "b";
    swapped["input_b"] = "a";
    EXPECT_EQ(
        expectLoadError({ { "materials", materials }, { "reactions", { valid, swapped } } }).entry,
        "reactions[1]");

    auto emptyInput = valid;
    emptyInput["input_a"] = "empty";
    EXPECT_EQ(
        expectLoadError({ { "materials", materials }, { "reactions", { emptyInput } } }).entry,
        "reactions[0]");
}

TEST(MaterialRegistryTest, RejectsUnknownTopLevelKeys)
{
    spdlog::info("Starting MaterialRegistryTest::RejectsUnknownTopLevelKeys test");
    const auto error =
        expectLoadError({ { "materials", { minimalMaterial("a") } }, { "elements", nlohmann::json::array() } });
    EXPECT_EQ(error.entry, "elements");

    EXPECT_TRUE(MaterialRegistry::loadFromJson(nlohmann::json::array()).isError());
}

TEST(MaterialRegistryTest, MissingFileIsAnError)
{
    spdlog::info("Starting MaterialRegistryTest::MissingFileIsAnError test");
    auto result = MaterialRegistry::loadFromFile("/nonexistent/materials.json");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().entry, "/nonexistent/materials.json");
}

TEST(MaterialRegistryTest, ShippedMaterialFileLoads)
{
    spdlog::info("Starting MaterialRegistryTest::ShippedMaterialFileLoads test");
    auto result = MaterialRegistry::loadFromFile(std::string(SANDSIM_CONFIG_DIR) + "/materials.json");
    ASSERT_TRUE(result.isValue()) << result.errorValue().toString();

    const auto& registry = result.value();
    for (const char* name : { "sand", "stone", "wood", "ash", "water", "oil", "lava", "steam",
                              "smoke", "burning_gas", "acid", "healing_spring", "tnt" }) {
        EXPECT_TRUE(registry.idOf(name).has_value()) << name;
    }
    const auto lavaWater = registry.findReaction(*registry.idOf("lava"), *registry.idOf("water"));
    ASSERT_TRUE(lavaWater.has_value());
    EXPECT_FLOAT_EQ(lavaWater->probability, 0.5f);
}

TEST(MaterialRegistryTest, JsonExportListsMaterialsAndReactions)
{
    spdlog::info("Starting MaterialRegistryTest::JsonExportListsMaterialsAndReactions test");
    const MaterialRegistry registry = Test::makeTestRegistry();
    const nlohmann::json exported = registry.toJson();

    ASSERT_TRUE(exported.contains("materials"));
    ASSERT_TRUE(exported.contains("reactions"));
    EXPECT_EQ(exported["reactions"].size(), 1u);
    EXPECT_EQ(exported["reactions"][0]["output_a"], "stone");
}
