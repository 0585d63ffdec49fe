#include "WorldReactionCalculator.h"
#include "ChunkNeighborhood.h"
#include "LoggingChannels.h"
#include "MaterialRegistry.h"
#include <iterator>

namespace SandSim {

namespace {

constexpr Vector2i NEIGHBOUR_ORDER[] = { { -1, -1 }, { 0, -1 }, { 1, -1 }, { -1, 0 },
                                         { 1, 0 },   { -1, 1 }, { 0, 1 },  { 1, 1 } };

} // namespace

bool WorldReactionCalculator::update(ChunkNeighborhood& hood, Vector2i pos)
{
    const auto& registry = hood.registry();
    const Cell* cell = hood.peek(pos.x, pos.y);
    if (!cell || cell->isEmpty() || !registry.hasReactions(cell->material)) {
        return false;
    }

    const MaterialId self = cell->material;
    bool hadCandidate = false;

    for (uint32_t i = 0; i < std::size(NEIGHBOUR_ORDER); ++i) {
        const Vector2i other{ pos.x + NEIGHBOUR_ORDER[i].x, pos.y + NEIGHBOUR_ORDER[i].y };
        const Cell* neighbour = hood.peek(other.x, other.y);
        if (!neighbour || neighbour->isEmpty() || neighbour->material == self) {
            continue;
        }

        const auto outcome = registry.findReaction(self, neighbour->material);
        if (!outcome) {
            continue;
        }
        hadCandidate = true;

        if (hood.roll(pos.x, pos.y, CellRandom::SALT_REACTION + i) < outcome->probability) {
            LoggingChannels::reaction()->trace(
                "{} + {} at {} -> {} + {}",
                registry.get(self).name,
                registry.get(neighbour->material).name,
                pos.toString(),
                registry.get(outcome->self_output).name,
                registry.get(outcome->other_output).name);

            hood.write(
                pos.x,
                pos.y,
                Cell::of(outcome->self_output, registry.get(outcome->self_output).defaultFill()));
            hood.write(
                other.x,
                other.y,
                Cell::of(outcome->other_output, registry.get(outcome->other_output).defaultFill()));
            hood.result().reactions++;
            return true;
        }
    }

    if (hadCandidate) {
        hood.keepAlive(pos.x, pos.y);
    }
    return false;
}

} // namespace SandSim
