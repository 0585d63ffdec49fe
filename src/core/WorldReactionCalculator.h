#pragma once

#include "Vector2.h"

namespace SandSim {

class ChunkNeighborhood;

/**
 * Pairwise reactions. Neighbours are scanned in a fixed order and each
 * candidate pair rolls once against the reaction probability; the first
 * success converts both cells and ends the scan. A cell that had a candidate
 * but failed every roll stays awake to try again next tick.
 */
class WorldReactionCalculator {
public:
    // Returns true if the cell reacted.
    static bool update(ChunkNeighborhood& hood, Vector2i pos);
};

} // namespace SandSim
