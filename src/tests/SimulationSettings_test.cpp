#include "core/SimulationSettings.h"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using namespace SandSim;

TEST(SimulationSettingsTest, DefaultsEnableEveryRule)
{
    spdlog::info("Starting SimulationSettingsTest::DefaultsEnableEveryRule test");
    const SimulationSettings settings = getDefaultSimulationSettings();
    EXPECT_EQ(settings.worker_threads, 0u);
    EXPECT_EQ(settings.random_seed, 1337u);
    EXPECT_TRUE(settings.fire_enabled);
    EXPECT_TRUE(settings.reactions_enabled);
    EXPECT_TRUE(settings.contacts_enabled);
    EXPECT_TRUE(settings.liquid_flow_enabled);
    EXPECT_TRUE(settings.gas_dissipation_enabled);
    EXPECT_FALSE(settings.log_step_summary);
}

TEST(SimulationSettingsTest, PartialJsonOverlaysDefaults)
{
    spdlog::info("Starting SimulationSettingsTest::PartialJsonOverlaysDefaults test");
    const auto result = parseSimulationSettings({ { "random_seed", 99 }, { "fire_enabled", false } });
    ASSERT_TRUE(result.isValue()) << result.errorValue().toString();

    const SimulationSettings& settings = result.value();
    EXPECT_EQ(settings.random_seed, 99u);
    EXPECT_FALSE(settings.fire_enabled);
    EXPECT_TRUE(settings.reactions_enabled);
    EXPECT_EQ(settings.worker_threads, 0u);
}

TEST(SimulationSettingsTest, RejectsUnknownKeysAndBadTypes)
{
    spdlog::info("Starting SimulationSettingsTest::RejectsUnknownKeysAndBadTypes test");
    const auto unknown = parseSimulationSettings({ { "gravity", 9.8 } });
    ASSERT_TRUE(unknown.isError());
    EXPECT_EQ(unknown.errorValue().entry, "settings.gravity");

    EXPECT_TRUE(parseSimulationSettings(nlohmann::json::array()).isError());
    EXPECT_TRUE(parseSimulationSettings({ { "fire_enabled", "yes" } }).isError());
}

TEST(SimulationSettingsTest, JsonRoundTrip)
{
    spdlog::info("Starting SimulationSettingsTest::JsonRoundTrip test");
    SimulationSettings settings = getDefaultSimulationSettings();
    settings.worker_threads = 3;
    settings.random_seed = 7;
    settings.gas_dissipation_enabled = false;

    const nlohmann::json json = settings;
    EXPECT_EQ(json["worker_threads"], 3);
    EXPECT_EQ(json["gas_dissipation_enabled"], false);

    const SimulationSettings parsed = json.get<SimulationSettings>();
    EXPECT_EQ(parsed.worker_threads, 3u);
    EXPECT_EQ(parsed.random_seed, 7u);
    EXPECT_FALSE(parsed.gas_dissipation_enabled);
    EXPECT_TRUE(parsed.fire_enabled);
}

TEST(SimulationSettingsTest, LoadsFromFile)
{
    spdlog::info("Starting SimulationSettingsTest::LoadsFromFile test");
    const auto path = std::filesystem::temp_directory_path() / "sandsim_settings_test.json";
    {
        std::ofstream file(path);
        file << R"({ "worker_threads": 2, "contacts_enabled": false })";
    }

    const auto result = loadSimulationSettings(path.string());
    ASSERT_TRUE(result.isValue()) << result.errorValue().toString();
    EXPECT_EQ(result.value().worker_threads, 2u);
    EXPECT_FALSE(result.value().contacts_enabled);
    std::filesystem::remove(path);

    EXPECT_TRUE(loadSimulationSettings(path.string()).isError());
}

TEST(SimulationSettingsTest, ResolvesWorkerThreads)
{
    spdlog::info("Starting SimulationSettingsTest::ResolvesWorkerThreads test");
    SimulationSettings settings = getDefaultSimulationSettings();
    settings.worker_threads = 6;
    EXPECT_EQ(resolveWorkerThreads(settings), 6u);

    settings.worker_threads = 0;
    const uint32_t automatic = resolveWorkerThreads(settings);
    EXPECT_GE(automatic, 1u);
    EXPECT_LE(automatic, 8u);
}
