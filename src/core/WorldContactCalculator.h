#pragma once

#include "WorldEvents.h"
#include <vector>

namespace SandSim {

class Grid;

/**
 * @brief Contact effects between terrain and external actors.
 *
 * Runs once per step on the calling thread, after all chunk passes. For each
 * hitbox, cells overlapping it or one cell around it are inspected:
 * damage/heal materials produce one aggregated event per (actor, material);
 * explosive materials carve their radius to empty and produce a blast event
 * listing every actor whose hitbox the blast reaches.
 */
class WorldContactCalculator {
public:
    static std::vector<WorldEvent> resolve(
        Grid& grid, const std::vector<ActorHitbox>& hitboxes, uint32_t tick);

    // True if any cell of `rect` lies within `radius` of `center`.
    static bool blastReaches(Vector2i center, float radius, const DirtyRect& rect);
};

} // namespace SandSim
