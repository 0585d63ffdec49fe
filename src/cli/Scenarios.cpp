#include "Scenarios.h"
#include "core/Cell.h"
#include "core/DirtyRect.h"
#include "core/LoggingChannels.h"
#include "core/MaterialRegistry.h"
#include "core/World.h"

#include <algorithm>

namespace SandSim {
namespace Cli {

namespace {

MaterialId idOf(const World& world, const std::string& name)
{
    // Presence is checked by ScenarioRegistry::setup() before any builder runs.
    return *world.getRegistry().idOf(name);
}

void fill(World& world, const std::string& material, int minX, int minY, int maxX, int maxY)
{
    world.fillRect(DirtyRect::fromBounds(minX, minY, maxX, maxY), Cell::of(idOf(world, material)));
}

// Open-topped stone container: floor at `floorY`, walls at `left` and `right`.
void basin(World& world, int left, int right, int top, int floorY)
{
    fill(world, "stone", left, floorY, right, floorY);
    fill(world, "stone", left, top, left, floorY);
    fill(world, "stone", right, top, right, floorY);
}

Cell burning(const World& world, const std::string& material)
{
    const MaterialId id = idOf(world, material);
    Cell cell = Cell::of(id);
    const auto& definition = world.getRegistry().get(id);
    cell.fire = FireState{ .hp = definition.fire ? definition.fire->fire_hp : 1,
                           .burning = true,
                           .igniting = false };
    return cell;
}

void buildSandpile(World& world)
{
    fill(world, "stone", -20, 100, 100, 100);
    fill(world, "sand", 30, 0, 50, 40);
}

void buildPool(World& world)
{
    basin(world, 0, 80, 40, 90);
    fill(world, "water", 5, 0, 20, 60);
}

void buildFire(World& world)
{
    fill(world, "stone", 0, 80, 100, 80);
    fill(world, "wood", 20, 50, 40, 79);
    fill(world, "wood", 60, 60, 62, 79);
    basin(world, 44, 56, 70, 79);
    fill(world, "oil", 45, 72, 55, 78);
    world.setCell(30, 49, burning(world, "wood"));
}

void buildLava(World& world)
{
    basin(world, 0, 60, 30, 70);
    fill(world, "water", 1, 50, 59, 69);
    fill(world, "lava", 20, 0, 30, 15);
}

void buildMixed(World& world)
{
    // Spans chunks on both sides of the origin.
    fill(world, "stone", -100, 100, 100, 100);
    fill(world, "sand", -80, 20, -50, 60);
    basin(world, -40, 0, 70, 99);
    fill(world, "water", -39, 60, -1, 98);
    fill(world, "oil", -30, 40, -10, 50);
    fill(world, "steam", 10, 60, 20, 70);
    fill(world, "wood", 30, 80, 40, 99);
    world.setCell(35, 79, burning(world, "wood"));

    basin(world, 50, 62, 90, 99);
    fill(world, "acid", 51, 95, 61, 98);
    fill(world, "healing_spring", 70, 98, 72, 99);
    world.setCell(80, 99, Cell::of(idOf(world, "tnt")));

    world.setActorHitboxes({
        { .actor_id = 1, .rect = DirtyRect::fromBounds(54, 88, 57, 94) },
        { .actor_id = 2, .rect = DirtyRect::fromBounds(69, 92, 73, 96) },
        { .actor_id = 3, .rect = DirtyRect::fromBounds(79, 94, 81, 98) },
    });
}

} // namespace

ScenarioRegistry ScenarioRegistry::createDefault()
{
    ScenarioRegistry registry;
    registry.registerScenario(
        "sandpile",
        { "Sandpile", "A block of sand collapsing onto a stone floor", { "stone", "sand" } },
        buildSandpile);
    registry.registerScenario(
        "pool",
        { "Pool", "A water column spreading across a stone basin", { "stone", "water" } },
        buildPool);
    registry.registerScenario(
        "fire",
        { "Fire", "Burning wood spreading to more wood and an oil pool", { "stone", "wood", "oil" } },
        buildFire);
    registry.registerScenario(
        "lava",
        { "Lava", "Lava poured into water, hardening into stone", { "stone", "water", "lava" } },
        buildLava);
    registry.registerScenario(
        "mixed",
        { "Mixed",
          "Every material type across several chunks, with actors touching acid, a spring and tnt",
          { "stone",
            "sand",
            "water",
            "oil",
            "steam",
            "wood",
            "acid",
            "healing_spring",
            "tnt" } },
        buildMixed);
    return registry;
}

void ScenarioRegistry::registerScenario(
    const std::string& id, ScenarioMetadata metadata, SetupFunction setup)
{
    scenarios_[id] = ScenarioEntry{ std::move(metadata), std::move(setup) };
}

const ScenarioMetadata* ScenarioRegistry::getMetadata(const std::string& id) const
{
    auto it = scenarios_.find(id);
    if (it == scenarios_.end()) {
        return nullptr;
    }
    return &it->second.metadata;
}

std::vector<std::string> ScenarioRegistry::getScenarioIds() const
{
    std::vector<std::string> ids;
    ids.reserve(scenarios_.size());
    for (const auto& [id, entry] : scenarios_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

Result<std::monostate, std::string> ScenarioRegistry::setup(
    const std::string& id, World& world) const
{
    using R = Result<std::monostate, std::string>;

    auto it = scenarios_.find(id);
    if (it == scenarios_.end()) {
        return R::error("Unknown scenario '" + id + "'");
    }

    const auto& entry = it->second;
    for (const auto& material : entry.metadata.requiredMaterials) {
        if (!world.getRegistry().idOf(material)) {
            return R::error(
                "Scenario '" + id + "' needs material '" + material
                + "', which the registry does not define");
        }
    }

    world.reset();
    entry.setup(world);
    LoggingChannels::cli()->info(
        "Built scenario '{}': {} chunks", id, world.getGrid().chunkCount());
    return R::okay(std::monostate{});
}

} // namespace Cli
} // namespace SandSim
