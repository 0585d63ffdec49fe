#include "WorldFireCalculator.h"
#include "ChunkNeighborhood.h"
#include "LoggingChannels.h"
#include "MaterialRegistry.h"

namespace SandSim {

namespace {

constexpr Vector2i EIGHT_DIRECTIONS[] = { { -1, -1 }, { 0, -1 }, { 1, -1 }, { -1, 0 },
                                          { 1, 0 },   { -1, 1 }, { 0, 1 },  { 1, 1 } };

} // namespace

bool WorldFireCalculator::hasOxygen(const ChunkNeighborhood& hood, Vector2i pos)
{
    for (const auto& offset : EIGHT_DIRECTIONS) {
        if (hood.isAirLike(pos.x + offset.x, pos.y + offset.y)) {
            return true;
        }
    }
    return false;
}

bool WorldFireCalculator::update(ChunkNeighborhood& hood, Vector2i pos)
{
    Cell* cell = hood.mutableCell(pos.x, pos.y);
    if (!cell || cell->isEmpty()) {
        return false;
    }

    const auto& registry = hood.registry();
    const auto& material = registry.get(cell->material);
    if (!material.fire) {
        return false;
    }
    const FireParameters& fire = *material.fire;

    if (!cell->isBurning()) {
        const bool igniting = cell->isIgniting() || (fire.try_to_ignite && !cell->fire);
        if (!igniting) {
            return false;
        }

        const bool canIgnite = !fire.requires_oxygen || fire.try_to_ignite || hasOxygen(hood, pos);
        if (!canIgnite) {
            cell->fire->igniting = false;
            return false;
        }

        if (hood.roll(pos.x, pos.y, CellRandom::SALT_IGNITE) < fire.probability) {
            // A smothered cell resumes its countdown.
            const int32_t hp = cell->fire && cell->fire->hp > 0 ? cell->fire->hp : fire.fire_hp;
            cell->fire = FireState{ .hp = hp, .burning = true, .igniting = false };
            hood.result().ignitions++;
            hood.touch(pos.x, pos.y);
            LoggingChannels::fire()->trace("{} ignited at {}", material.name, pos.toString());
        }
        else if (!cell->fire) {
            cell->fire = FireState{ .hp = 0, .burning = false, .igniting = true };
        }
        hood.keepAlive(pos.x, pos.y);
        return false;
    }

    // Burning: expose flammable neighbours.
    for (const auto& offset : EIGHT_DIRECTIONS) {
        Cell* neighbour = hood.mutableCell(pos.x + offset.x, pos.y + offset.y);
        if (!neighbour || neighbour->isEmpty() || neighbour->isBurning()
            || neighbour->isIgniting()) {
            continue;
        }
        if (!registry.get(neighbour->material).isFlammable()) {
            continue;
        }
        if (neighbour->fire) {
            neighbour->fire->igniting = true;
        }
        else {
            neighbour->fire = FireState{ .hp = 0, .burning = false, .igniting = true };
        }
        hood.keepAlive(pos.x + offset.x, pos.y + offset.y);
    }

    if (fire.requires_oxygen && !hasOxygen(hood, pos)) {
        cell->fire->burning = false;
        cell->fire->igniting = false;
        hood.result().extinguished++;
        hood.touch(pos.x, pos.y);
        LoggingChannels::fire()->trace("{} smothered at {}", material.name, pos.toString());
        return false;
    }

    cell->fire->hp -= 1;
    if (cell->fire->hp <= 0) {
        const MaterialId residue = fire.burns_into_id;
        hood.write(pos.x, pos.y, Cell::of(residue, registry.get(residue).defaultFill()));
        hood.result().burnouts++;
        LoggingChannels::fire()->trace(
            "{} burned out at {} into {}", material.name, pos.toString(), registry.get(residue).name);
        return true;
    }

    hood.keepAlive(pos.x, pos.y);
    return false;
}

} // namespace SandSim
